#include "config.h"

#include <cstdlib>
#include <functional>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "logging.h"

namespace turnguard {

namespace {

struct EnvBinding {
    const char* suffix;
    const char* key;
    enum class Kind { kString, kInt, kDouble } kind;
};

// Environment variables understood by LoadFromEnvironment (after the prefix)
constexpr EnvBinding kEnvBindings[] = {
    {"HIGH_RISK_THRESHOLD", "tracker.high_risk_threshold", EnvBinding::Kind::kDouble},
    {"SESSION_IDLE_TIMEOUT_SECONDS", "tracker.session_idle_timeout_seconds",
     EnvBinding::Kind::kInt},
    {"MAX_SESSIONS", "tracker.max_sessions", EnvBinding::Kind::kInt},
    {"EVICTION_HEADROOM", "tracker.eviction_headroom", EnvBinding::Kind::kInt},
    {"MAX_CUMULATIVE_RISK", "tracker.max_cumulative_risk", EnvBinding::Kind::kDouble},
    {"MAX_INJECTION_ATTEMPTS", "tracker.max_injection_attempts", EnvBinding::Kind::kInt},
    {"LOG_LEVEL", "logging.level", EnvBinding::Kind::kString},
    {"LOG_FILE", "logging.file", EnvBinding::Kind::kString},
};

nlohmann::json YamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = YamlToJson(kv.second);
            }
            return obj;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(YamlToJson(item));
            }
            return arr;
        }
        case YAML::NodeType::Scalar: {
            const std::string& text = node.Scalar();
            int64_t as_int = 0;
            double as_double = 0.0;
            if (absl::SimpleAtoi(text, &as_int)) {
                return as_int;
            }
            if (absl::SimpleAtod(text, &as_double)) {
                return as_double;
            }
            if (text == "true") return true;
            if (text == "false") return false;
            return text;
        }
        default:
            return nullptr;
    }
}

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return absl::NotFoundError(
            absl::StrCat("Configuration file not found: ", path.string()));
    }

    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    for (const auto& binding : kEnvBindings) {
        std::string name = absl::StrCat(absl::string_view(prefix.data(), prefix.size()), binding.suffix);
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            continue;
        }

        switch (binding.kind) {
            case EnvBinding::Kind::kString:
                config.Set(binding.key, std::string(value));
                break;
            case EnvBinding::Kind::kInt: {
                int64_t parsed = 0;
                if (!absl::SimpleAtoi(value, &parsed)) {
                    return absl::InvalidArgumentError(
                        absl::StrCat(name, " is not an integer: ", value));
                }
                config.Set(binding.key, parsed);
                break;
            }
            case EnvBinding::Kind::kDouble: {
                double parsed = 0.0;
                if (!absl::SimpleAtod(value, &parsed)) {
                    return absl::InvalidArgumentError(
                        absl::StrCat(name, " is not a number: ", value));
                }
                config.Set(binding.key, parsed);
                break;
            }
        }
    }

    return config;
}

absl::StatusOr<Config> Config::LoadLayered(
    const std::optional<std::filesystem::path>& config_path,
    std::string_view env_prefix) {
    Config config;

    if (config_path.has_value()) {
        auto file_config = LoadFromFile(*config_path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        config.Merge(*file_config);
    }

    auto env_config = LoadFromEnvironment(env_prefix);
    if (!env_config.ok()) {
        return env_config.status();
    }
    config.Merge(*env_config);

    return config;
}

void Config::Merge(const Config& other) {
    std::function<void(YAML::Node&, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node& base, const YAML::Node& overlay) {
        if (!overlay.IsMap()) {
            return;
        }
        for (const auto& kv : overlay) {
            const std::string key = kv.first.as<std::string>();
            if (base[key] && base[key].IsMap() && kv.second.IsMap()) {
                YAML::Node base_child = base[key];
                merge_nodes(base_child, kv.second);
            } else {
                base[key] = YAML::Clone(kv.second);
            }
        }
    };

    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    // Rebind with reset(); assigning to a handle would write into the tree
    YAML::Node current;
    current.reset(root_);
    for (const auto& part : parts) {
        if (!current || !current.IsMap()) {
            return std::nullopt;
        }
        const YAML::Node& parent = current;
        YAML::Node child = parent[part];
        current.reset(child);
    }

    if (!current || current.IsNull()) {
        return std::nullopt;
    }

    return current;
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        return node->as<std::string>();
    }
    return std::string(default_value);
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<int64_t>();
        } catch (const YAML::Exception&) {
            TURNGUARD_LOG_WARN("Config key {} is not an integer, using default {}",
                               key, default_value);
        }
    }
    return default_value;
}

double Config::GetDouble(std::string_view key, double default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<double>();
        } catch (const YAML::Exception&) {
            TURNGUARD_LOG_WARN("Config key {} is not a number, using default {}",
                               key, default_value);
        }
    }
    return default_value;
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<bool>();
        } catch (const YAML::Exception&) {
            TURNGUARD_LOG_WARN("Config key {} is not a boolean, using default {}",
                               key, default_value);
        }
    }
    return default_value;
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    YAML::Node current;
    current.reset(root_);
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!current[parts[i]] || !current[parts[i]].IsMap()) {
            current[parts[i]] = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(current[parts[i]]);
    }

    std::visit([&](const auto& val) { current[parts.back()] = val; }, value);
}

nlohmann::json Config::ToJson() const {
    return YamlToJson(root_);
}

}  // namespace turnguard
