#pragma once

/// @file metrics.h
/// @brief In-process metrics for TurnGuard self-monitoring

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace turnguard {

/// @brief Label set attached to a metric series, e.g. {{"detector", "crescendo"}}
using MetricLabels = std::map<std::string, std::string>;

/// @brief Monotonic counter
class Counter {
public:
    explicit Counter(std::string name, std::string description = "");

    void Increment();

    /// @brief Add a non-negative amount; negative deltas are ignored
    void Add(int64_t delta);

    int64_t Value() const;

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::atomic<int64_t> value_{0};
};

/// @brief Gauge that can go up and down
class Gauge {
public:
    explicit Gauge(std::string name, std::string description = "");

    void Set(double value);
    void Increment(double delta = 1.0);
    void Decrement(double delta = 1.0);
    double Value() const;

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::atomic<double> value_{0.0};
};

/// @brief Fixed-bucket histogram
class Histogram {
public:
    /// @brief Histogram with buckets suited to in-memory call latency
    explicit Histogram(std::string name, std::string description = "");

    Histogram(std::string name, std::vector<double> buckets, std::string description = "");

    void Observe(double value);

    int64_t Count() const;
    double Sum() const;

    /// @brief Cumulative bucket counts, last entry is +Inf
    std::vector<std::pair<double, int64_t>> Buckets() const;

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::vector<double> bucket_bounds_;
    std::vector<std::atomic<int64_t>> bucket_counts_;
    std::atomic<int64_t> count_{0};
    std::atomic<double> sum_{0.0};
};

/// @brief RAII timer observing elapsed seconds into a histogram
class ScopedTimer {
public:
    explicit ScopedTimer(Histogram& histogram);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// @brief Owns metric series keyed by name and labels
///
/// A process normally shares Instance(); components accept a registry by
/// reference so tests can give each fixture its own.
class MetricsRegistry {
public:
    MetricsRegistry() = default;

    MetricsRegistry(const MetricsRegistry&) = delete;
    MetricsRegistry& operator=(const MetricsRegistry&) = delete;

    /// @brief Process-wide registry
    static MetricsRegistry& Instance();

    Counter& GetCounter(const std::string& name, const MetricLabels& labels = {},
                        const std::string& description = "");
    Gauge& GetGauge(const std::string& name, const MetricLabels& labels = {},
                    const std::string& description = "");
    Histogram& GetHistogram(const std::string& name, const MetricLabels& labels = {},
                            const std::string& description = "");

    /// @brief Prometheus text exposition of every series
    std::string ExportText() const;

private:
    /// @brief Series key, e.g. name{detector="echo_chamber"}
    static std::string SeriesKey(const std::string& name, const MetricLabels& labels);

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Counter>> counters_;
    std::map<std::string, std::unique_ptr<Gauge>> gauges_;
    std::map<std::string, std::unique_ptr<Histogram>> histograms_;
};

}  // namespace turnguard
