#include "metrics.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace turnguard {

namespace {

// Tracker calls are pure in-memory work; buckets run from 1us to 100ms
const std::vector<double> kDefaultBuckets = {
    0.000001, 0.000005, 0.00001, 0.00005, 0.0001, 0.0005, 0.001, 0.005, 0.01, 0.1
};

void AtomicAdd(std::atomic<double>& target, double delta) {
    double current = target.load(std::memory_order_relaxed);
    while (!target.compare_exchange_weak(current, current + delta,
                                         std::memory_order_relaxed)) {
    }
}

// Splits name{labels} into the metric name and the label block
std::pair<std::string, std::string> SplitSeriesKey(const std::string& key) {
    auto brace = key.find('{');
    if (brace == std::string::npos) {
        return {key, ""};
    }
    return {key.substr(0, brace), key.substr(brace)};
}

std::string WithLabel(const std::string& label_block, const std::string& extra) {
    if (label_block.empty()) {
        return "{" + extra + "}";
    }
    return label_block.substr(0, label_block.size() - 1) + "," + extra + "}";
}

}  // namespace

Counter::Counter(std::string name, std::string description)
    : name_(std::move(name)), description_(std::move(description)) {}

void Counter::Increment() {
    value_.fetch_add(1, std::memory_order_relaxed);
}

void Counter::Add(int64_t delta) {
    if (delta >= 0) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }
}

int64_t Counter::Value() const {
    return value_.load(std::memory_order_relaxed);
}

Gauge::Gauge(std::string name, std::string description)
    : name_(std::move(name)), description_(std::move(description)) {}

void Gauge::Set(double value) {
    value_.store(value, std::memory_order_relaxed);
}

void Gauge::Increment(double delta) {
    AtomicAdd(value_, delta);
}

void Gauge::Decrement(double delta) {
    AtomicAdd(value_, -delta);
}

double Gauge::Value() const {
    return value_.load(std::memory_order_relaxed);
}

Histogram::Histogram(std::string name, std::string description)
    : Histogram(std::move(name), kDefaultBuckets, std::move(description)) {}

Histogram::Histogram(std::string name, std::vector<double> buckets, std::string description)
    : name_(std::move(name)),
      description_(std::move(description)),
      bucket_bounds_(std::move(buckets)),
      bucket_counts_(bucket_bounds_.size() + 1) {  // +1 for +Inf
    std::sort(bucket_bounds_.begin(), bucket_bounds_.end());
    for (auto& count : bucket_counts_) {
        count.store(0, std::memory_order_relaxed);
    }
}

void Histogram::Observe(double value) {
    count_.fetch_add(1, std::memory_order_relaxed);
    AtomicAdd(sum_, value);

    auto it = std::lower_bound(bucket_bounds_.begin(), bucket_bounds_.end(), value);
    size_t bucket_idx = static_cast<size_t>(std::distance(bucket_bounds_.begin(), it));
    bucket_counts_[bucket_idx].fetch_add(1, std::memory_order_relaxed);
}

int64_t Histogram::Count() const {
    return count_.load(std::memory_order_relaxed);
}

double Histogram::Sum() const {
    return sum_.load(std::memory_order_relaxed);
}

std::vector<std::pair<double, int64_t>> Histogram::Buckets() const {
    std::vector<std::pair<double, int64_t>> result;
    result.reserve(bucket_counts_.size());

    int64_t cumulative = 0;
    for (size_t i = 0; i < bucket_bounds_.size(); ++i) {
        cumulative += bucket_counts_[i].load(std::memory_order_relaxed);
        result.emplace_back(bucket_bounds_[i], cumulative);
    }
    cumulative += bucket_counts_.back().load(std::memory_order_relaxed);
    result.emplace_back(std::numeric_limits<double>::infinity(), cumulative);

    return result;
}

ScopedTimer::ScopedTimer(Histogram& histogram)
    : histogram_(histogram), start_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
    histogram_.Observe(elapsed.count());
}

MetricsRegistry& MetricsRegistry::Instance() {
    static MetricsRegistry instance;
    return instance;
}

std::string MetricsRegistry::SeriesKey(const std::string& name, const MetricLabels& labels) {
    if (labels.empty()) {
        return name;
    }
    std::ostringstream oss;
    oss << name << "{";
    bool first = true;
    for (const auto& [key, value] : labels) {
        if (!first) {
            oss << ",";
        }
        oss << key << "=\"" << value << "\"";
        first = false;
    }
    oss << "}";
    return oss.str();
}

Counter& MetricsRegistry::GetCounter(const std::string& name, const MetricLabels& labels,
                                     const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = SeriesKey(name, labels);
    auto it = counters_.find(key);
    if (it == counters_.end()) {
        it = counters_.emplace(key, std::make_unique<Counter>(key, description)).first;
    }
    return *it->second;
}

Gauge& MetricsRegistry::GetGauge(const std::string& name, const MetricLabels& labels,
                                 const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = SeriesKey(name, labels);
    auto it = gauges_.find(key);
    if (it == gauges_.end()) {
        it = gauges_.emplace(key, std::make_unique<Gauge>(key, description)).first;
    }
    return *it->second;
}

Histogram& MetricsRegistry::GetHistogram(const std::string& name, const MetricLabels& labels,
                                         const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = SeriesKey(name, labels);
    auto it = histograms_.find(key);
    if (it == histograms_.end()) {
        it = histograms_.emplace(key, std::make_unique<Histogram>(key, description)).first;
    }
    return *it->second;
}

std::string MetricsRegistry::ExportText() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    for (const auto& [key, counter] : counters_) {
        auto [name, labels] = SplitSeriesKey(key);
        if (!counter->Description().empty()) {
            oss << "# HELP " << name << " " << counter->Description() << "\n";
        }
        oss << "# TYPE " << name << " counter\n";
        oss << key << " " << counter->Value() << "\n";
    }

    for (const auto& [key, gauge] : gauges_) {
        auto [name, labels] = SplitSeriesKey(key);
        if (!gauge->Description().empty()) {
            oss << "# HELP " << name << " " << gauge->Description() << "\n";
        }
        oss << "# TYPE " << name << " gauge\n";
        oss << key << " " << gauge->Value() << "\n";
    }

    for (const auto& [key, histogram] : histograms_) {
        auto [name, labels] = SplitSeriesKey(key);
        if (!histogram->Description().empty()) {
            oss << "# HELP " << name << " " << histogram->Description() << "\n";
        }
        oss << "# TYPE " << name << " histogram\n";
        for (const auto& [bound, count] : histogram->Buckets()) {
            std::ostringstream le;
            le << "le=\"";
            if (std::isinf(bound)) {
                le << "+Inf";
            } else {
                le << bound;
            }
            le << "\"";
            oss << name << "_bucket" << WithLabel(labels, le.str()) << " " << count << "\n";
        }
        oss << name << "_sum" << labels << " " << histogram->Sum() << "\n";
        oss << name << "_count" << labels << " " << histogram->Count() << "\n";
    }

    return oss.str();
}

}  // namespace turnguard
