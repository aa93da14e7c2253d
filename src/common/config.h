#pragma once

/// @file config.h
/// @brief Layered YAML configuration: defaults < file < environment < flags
///
/// Keys use dot notation into the YAML tree ("detector.psi_bins"). Two getter
/// families exist:
/// - Get*: lenient, fall back to the default when the key is absent or has the
///   wrong type (logged at warn level).
/// - Read*: strict, fall back only when the key is absent; a value of the wrong
///   type is a configuration error naming the key.
///
/// Recognised keys:
/// @code
///   detector:
///     significance_level: 0.05
///     psi_threshold: 0.25
///     psi_bins: 10
///     num_workers: 1
///     categorical_features: [SEX, EDUCATION]
///   server:
///     host: 0.0.0.0
///     port: 8000
///     max_request_body_bytes: 67108864
///   logging:
///     level: info
///     file: sentinel.log
/// @endcode

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace sentinel {

/// @brief Value accepted by Config::Set
using ConfigValue = std::variant<int64_t, double, std::string, std::vector<std::string>>;

class Config {
public:
    Config() = default;

    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Collect the SENTINEL_* environment overrides
    ///
    /// Reads <prefix>SIGNIFICANCE_LEVEL, PSI_THRESHOLD, PSI_BINS, NUM_WORKERS,
    /// CATEGORICAL_FEATURES (comma separated), SERVER_HOST, SERVER_PORT and
    /// LOG_LEVEL. A malformed number is an InvalidArgumentError.
    static absl::StatusOr<Config> LoadFromEnvironment(std::string_view prefix = "SENTINEL_");

    /// @brief Deep-merge other into this configuration; other wins on conflicts
    void Merge(const Config& other);

    std::string GetString(std::string_view key, std::string_view default_value = "") const;
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;
    double GetDouble(std::string_view key, double default_value = 0.0) const;

    /// @brief Scalar entries of a sequence, or empty if the key is absent
    std::vector<std::string> GetStringList(std::string_view key) const;

    absl::StatusOr<int64_t> ReadInt(std::string_view key, int64_t default_value) const;
    absl::StatusOr<double> ReadDouble(std::string_view key, double default_value) const;

    /// @brief Sequence of scalars; an absent key reads as an empty list
    absl::StatusOr<std::vector<std::string>> ReadStringList(std::string_view key) const;

    bool HasKey(std::string_view key) const;

    /// @brief Set a value, creating intermediate maps as needed
    void Set(std::string_view key, ConfigValue value);

    /// @brief Configuration tree as JSON, with scalars typed by their text
    nlohmann::json ToJson() const;

private:
    /// @brief Node at a dotted path, or nullopt if absent or null
    std::optional<YAML::Node> FindNode(std::string_view key) const;

    YAML::Node root_;
};

/// @brief Process-wide configuration used by the CLI front end
Config& GlobalConfig();

/// @brief Rebuild GlobalConfig() from an optional file plus the environment
absl::Status InitGlobalConfig(
    const std::optional<std::filesystem::path>& config_path = std::nullopt,
    std::string_view env_prefix = "SENTINEL_");

}  // namespace sentinel
