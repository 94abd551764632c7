#pragma once

/// @file config.h
/// @brief TurnGuard configuration management

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace turnguard {

/// @brief Configuration value that can hold different types
using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string
>;

/// @brief Layered configuration backed by a YAML document
///
/// Keys use dot notation ("tracker.echo.lookback"). Layers are combined with
/// Merge(); later layers win.
class Config {
public:
    Config() = default;

    /// @brief Load configuration from a YAML file
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Load configuration from a YAML string
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Load the TURNGUARD_* environment overrides
    /// @param prefix Environment variable prefix
    /// @return Configuration holding only the variables that are set, or
    ///         InvalidArgument when a numeric variable does not parse
    static absl::StatusOr<Config> LoadFromEnvironment(std::string_view prefix = "TURNGUARD_");

    /// @brief File (optional) overlaid with environment variables
    static absl::StatusOr<Config> LoadLayered(
        const std::optional<std::filesystem::path>& config_path,
        std::string_view env_prefix = "TURNGUARD_");

    /// @brief Merge another configuration into this one (other takes precedence)
    void Merge(const Config& other);

    std::string GetString(std::string_view key, std::string_view default_value = "") const;
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;
    double GetDouble(std::string_view key, double default_value = 0.0) const;
    bool GetBool(std::string_view key, bool default_value = false) const;

    bool HasKey(std::string_view key) const;

    /// @brief Set a configuration value, creating intermediate maps
    void Set(std::string_view key, ConfigValue value);

    /// @brief Export configuration to JSON
    nlohmann::json ToJson() const;

private:
    YAML::Node root_;

    /// @brief Navigate to a nested node using dot notation
    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;
};

}  // namespace turnguard
