#include "config.h"

#include <cstdlib>
#include <functional>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

#include "error.h"
#include "logging.h"

namespace driftscope {

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
        return MakeError(ErrorCode::kConfigurationError,
            absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return MakeError(ErrorCode::kConfigurationError,
            absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    auto get_env = [&prefix](const char* suffix) -> std::optional<std::string> {
        std::string key = absl::StrCat(prefix, suffix);
        const char* value = std::getenv(key.c_str());
        if (value != nullptr && *value != '\0') {
            return std::string(value);
        }
        return std::nullopt;
    };

    if (auto val = get_env("THRESHOLD")) {
        double threshold = 0.0;
        if (!absl::SimpleAtod(*val, &threshold)) {
            return MakeError(ErrorCode::kConfigurationError,
                absl::StrCat(prefix, "THRESHOLD is not a number: ", *val));
        }
        config.Set("drift.threshold", threshold);
    }
    if (auto val = get_env("OUTPUT_DIRECTORY")) {
        config.Set("drift.output_directory", *val);
    }
    if (auto val = get_env("EXCLUDED_COLUMNS")) {
        std::vector<std::string> columns;
        for (absl::string_view part : absl::StrSplit(*val, ',', absl::SkipWhitespace())) {
            columns.emplace_back(absl::StripAsciiWhitespace(part));
        }
        config.Set("drift.excluded_columns", columns);
    }
    if (auto val = get_env("WORKER_THREADS")) {
        int64_t threads = 0;
        if (!absl::SimpleAtoi(*val, &threads)) {
            return MakeError(ErrorCode::kConfigurationError,
                absl::StrCat(prefix, "WORKER_THREADS is not an integer: ", *val));
        }
        config.Set("drift.worker_threads", threads);
    }

    if (auto val = get_env("LOG_LEVEL")) {
        config.Set("logging.level", *val);
    }
    if (auto val = get_env("LOG_FILE")) {
        config.Set("logging.file", *val);
    }

    return config;
}

void Config::Merge(const Config& other) {
    // Deep merge YAML nodes
    std::function<void(YAML::Node&, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node& base, const YAML::Node& overlay) {
        if (overlay.IsMap()) {
            for (const auto& kv : overlay) {
                const std::string key = kv.first.as<std::string>();
                if (base[key] && base[key].IsMap() && kv.second.IsMap()) {
                    YAML::Node base_child = base[key];
                    merge_nodes(base_child, kv.second);
                } else {
                    base[key] = kv.second;
                }
            }
        }
    };

    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(key, '.');

    // Node::operator= rebinds the referenced node inside the tree, so each step
    // re-constructs the handle instead of assigning it
    std::optional<YAML::Node> current(root_);
    for (const auto& part : parts) {
        if (!current->IsDefined() || !current->IsMap()) {
            return std::nullopt;
        }
        const YAML::Node& parent = *current;
        YAML::Node child = parent[part];
        current.emplace(child);
    }

    if (!current->IsDefined() || current->IsNull()) {
        return std::nullopt;
    }

    return current;
}

template <typename T>
absl::StatusOr<std::optional<T>> Config::LookupScalar(std::string_view key,
                                                      std::string_view type_name) const {
    auto node = GetNestedNode(key);
    if (!node) {
        return std::optional<T>();
    }
    if (!node->IsScalar()) {
        return MakeError(ErrorCode::kConfigurationError,
            absl::StrCat("Configuration key '", key, "' must be a ", type_name));
    }
    try {
        return std::optional<T>(node->as<T>());
    } catch (const YAML::Exception&) {
        return MakeError(ErrorCode::kConfigurationError,
            absl::StrCat("Configuration key '", key, "' must be a ", type_name,
                         ", got '", node->Scalar(), "'"));
    }
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto value = LookupString(key);
    if (value.ok() && value->has_value()) {
        return **value;
    }
    return std::string(default_value);
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    auto value = LookupInt(key);
    return value.ok() && value->has_value() ? **value : default_value;
}

double Config::GetDouble(std::string_view key, double default_value) const {
    auto value = LookupDouble(key);
    return value.ok() && value->has_value() ? **value : default_value;
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    auto value = LookupBool(key);
    return value.ok() && value->has_value() ? **value : default_value;
}

std::vector<std::string> Config::GetStringList(std::string_view key) const {
    auto value = LookupStringList(key);
    if (value.ok() && value->has_value()) {
        return **value;
    }
    return {};
}

absl::StatusOr<std::optional<double>> Config::LookupDouble(std::string_view key) const {
    return LookupScalar<double>(key, "number");
}

absl::StatusOr<std::optional<int64_t>> Config::LookupInt(std::string_view key) const {
    return LookupScalar<int64_t>(key, "integer");
}

absl::StatusOr<std::optional<bool>> Config::LookupBool(std::string_view key) const {
    return LookupScalar<bool>(key, "boolean");
}

absl::StatusOr<std::optional<std::string>> Config::LookupString(std::string_view key) const {
    return LookupScalar<std::string>(key, "string");
}

absl::StatusOr<std::optional<std::vector<std::string>>> Config::LookupStringList(
    std::string_view key) const {
    auto node = GetNestedNode(key);
    if (!node) {
        return std::optional<std::vector<std::string>>();
    }
    if (!node->IsSequence()) {
        return MakeError(ErrorCode::kConfigurationError,
            absl::StrCat("Configuration key '", key, "' must be a list of strings"));
    }

    std::vector<std::string> result;
    for (const auto& item : *node) {
        if (!item.IsScalar()) {
            return MakeError(ErrorCode::kConfigurationError,
                absl::StrCat("Configuration key '", key, "' must contain only strings"));
        }
        result.push_back(item.Scalar());
    }
    return std::optional<std::vector<std::string>>(std::move(result));
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(key, '.');

    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    // Handles share the underlying node, so writes through copies land in root_
    std::vector<YAML::Node> path;
    path.push_back(root_);
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node child = path.back()[parts[i]];
        if (!child.IsMap()) {
            child = YAML::Node(YAML::NodeType::Map);
        }
        path.push_back(path.back()[parts[i]]);
    }

    YAML::Node parent = path.back();
    std::visit([&](auto&& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            parent[parts.back()] = seq;
        } else {
            parent[parts.back()] = val;
        }
    }, value);
}

absl::StatusOr<Config> LoadConfig(
    const std::optional<std::filesystem::path>& config_path,
    std::string_view env_prefix
) {
    Config config;

    if (config_path.has_value()) {
        DRIFTSCOPE_ASSIGN_OR_RETURN(Config file_config, Config::LoadFromFile(*config_path));
        config.Merge(file_config);
        DRIFTSCOPE_LOG_DEBUG("Loaded configuration from {}", config_path->string());
    }

    // Environment variables take precedence over the file
    DRIFTSCOPE_ASSIGN_OR_RETURN(Config env_config, Config::LoadFromEnvironment(env_prefix));
    config.Merge(env_config);

    return config;
}

}  // namespace driftscope
