#pragma once

/// @file config.h
/// @brief YAML configuration with environment overlay for drift checks

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <yaml-cpp/yaml.h>

namespace driftscope {

/// @brief Value accepted by Config::Set
using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

/// @brief Dot-addressed configuration tree ("drift.threshold", "logging.level")
///
/// Two access styles:
///   - Get* return a fallback when the key is missing or has the wrong type,
///     for settings where a bad value is harmless.
///   - Lookup* return nullopt for a missing key and kConfigurationError for a
///     key present with the wrong type; EngineOptions::FromConfig uses these.
///
/// Example:
/// @code
///   auto config = LoadConfig("driftscope.yaml");
///   auto threshold = config->LookupDouble("drift.threshold");
/// @endcode
class Config {
public:
    Config() = default;

    /// @brief Parse a YAML file
    /// @return NotFound if the file does not exist, kConfigurationError on
    ///         malformed YAML
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Parse YAML text
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Build a tree from <prefix>THRESHOLD, <prefix>OUTPUT_DIRECTORY,
    /// <prefix>EXCLUDED_COLUMNS (comma separated), <prefix>WORKER_THREADS,
    /// <prefix>LOG_LEVEL and <prefix>LOG_FILE
    /// @return kConfigurationError when a numeric variable does not parse
    static absl::StatusOr<Config> LoadFromEnvironment(std::string_view prefix = "DRIFTSCOPE_");

    /// @brief Deep-merge other into this tree; other wins on conflicts
    void Merge(const Config& other);

    std::string GetString(std::string_view key, std::string_view default_value = "") const;
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;
    double GetDouble(std::string_view key, double default_value = 0.0) const;
    bool GetBool(std::string_view key, bool default_value = false) const;

    /// @brief Sequence of scalars, empty if absent
    std::vector<std::string> GetStringList(std::string_view key) const;

    absl::StatusOr<std::optional<double>> LookupDouble(std::string_view key) const;
    absl::StatusOr<std::optional<int64_t>> LookupInt(std::string_view key) const;
    absl::StatusOr<std::optional<bool>> LookupBool(std::string_view key) const;
    absl::StatusOr<std::optional<std::string>> LookupString(std::string_view key) const;
    absl::StatusOr<std::optional<std::vector<std::string>>> LookupStringList(
        std::string_view key) const;

    /// @brief True if the key resolves to a non-null node
    bool HasKey(std::string_view key) const;

    /// @brief Write a value, creating intermediate maps
    void Set(std::string_view key, ConfigValue value);

private:
    /// @brief Resolve a dotted key; nullopt if any step is missing or null
    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;

    template <typename T>
    absl::StatusOr<std::optional<T>> LookupScalar(std::string_view key,
                                                  std::string_view type_name) const;

    YAML::Node root_;
};

/// @brief Optional YAML file overlaid with the environment
///
/// Command-line overrides are applied afterwards by the caller with Set.
absl::StatusOr<Config> LoadConfig(
    const std::optional<std::filesystem::path>& config_path = std::nullopt,
    std::string_view env_prefix = "DRIFTSCOPE_");

}  // namespace driftscope
