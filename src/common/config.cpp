/// @file config.cpp
/// @brief YAML-backed configuration with environment overrides

#include "config.h"

#include <cstdlib>
#include <utility>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "error.h"
#include "logging.h"

namespace sentinel {

namespace {

Config g_global_config;

nlohmann::json ScalarToJson(const std::string& text) {
    int64_t int_value = 0;
    if (absl::SimpleAtoi(text, &int_value)) {
        return int_value;
    }
    double double_value = 0.0;
    if (absl::SimpleAtod(text, &double_value)) {
        return double_value;
    }
    if (text == "true" || text == "false") {
        return text == "true";
    }
    return text;
}

nlohmann::json NodeToJson(const YAML::Node& node) {
    if (node.IsMap()) {
        nlohmann::json object = nlohmann::json::object();
        for (const auto& entry : node) {
            object[entry.first.Scalar()] = NodeToJson(entry.second);
        }
        return object;
    }
    if (node.IsSequence()) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& item : node) {
            array.push_back(NodeToJson(item));
        }
        return array;
    }
    if (node.IsScalar()) {
        return ScalarToJson(node.Scalar());
    }
    return nullptr;
}

void MergeInto(YAML::Node base, const YAML::Node& overlay) {
    if (!overlay.IsMap()) {
        return;
    }
    for (const auto& entry : overlay) {
        const std::string& key = entry.first.Scalar();
        YAML::Node existing = base[key];
        if (existing.IsMap() && entry.second.IsMap()) {
            MergeInto(existing, entry.second);
        } else {
            base[key] = YAML::Clone(entry.second);
        }
    }
}

/// Decode a scalar node as T; false on a non-scalar or unparsable value
template <typename T>
bool DecodeScalar(const YAML::Node& node, T& out) {
    return node.IsScalar() && YAML::convert<T>::decode(node, out);
}

absl::Status WrongType(std::string_view key, std::string_view expected) {
    return MakeError(ErrorCode::kConfigurationError,
                     absl::StrCat("Config key '", absl::string_view(key.data(), key.size()), "' must be ", absl::string_view(expected.data(), expected.size())));
}

}  // namespace

// =============================================================================
// Loading
// =============================================================================

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
        return MakeError(ErrorCode::kParseError,
                         absl::StrCat("Failed to parse ", path.string(), ": ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return MakeError(ErrorCode::kParseError,
                         absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromEnvironment(std::string_view prefix) {
    struct Override {
        const char* suffix;
        const char* key;
        enum { kInt, kDouble, kString, kList } type;
    };
    static constexpr Override kOverrides[] = {
        {"SIGNIFICANCE_LEVEL", "detector.significance_level", Override::kDouble},
        {"PSI_THRESHOLD", "detector.psi_threshold", Override::kDouble},
        {"PSI_BINS", "detector.psi_bins", Override::kInt},
        {"NUM_WORKERS", "detector.num_workers", Override::kInt},
        {"CATEGORICAL_FEATURES", "detector.categorical_features", Override::kList},
        {"SERVER_HOST", "server.host", Override::kString},
        {"SERVER_PORT", "server.port", Override::kInt},
        {"LOG_LEVEL", "logging.level", Override::kString},
    };

    Config config;
    for (const auto& entry : kOverrides) {
        const std::string name = absl::StrCat(absl::string_view(prefix.data(), prefix.size()), entry.suffix);
        const char* raw = std::getenv(name.c_str());
        if (raw == nullptr) {
            continue;
        }
        const std::string value(absl::StripAsciiWhitespace(raw));

        switch (entry.type) {
            case Override::kInt: {
                int64_t parsed = 0;
                if (!absl::SimpleAtoi(value, &parsed)) {
                    return absl::InvalidArgumentError(
                        absl::StrCat(name, " is not an integer: ", value));
                }
                config.Set(entry.key, parsed);
                break;
            }
            case Override::kDouble: {
                double parsed = 0.0;
                if (!absl::SimpleAtod(value, &parsed)) {
                    return absl::InvalidArgumentError(
                        absl::StrCat(name, " is not a number: ", value));
                }
                config.Set(entry.key, parsed);
                break;
            }
            case Override::kString:
                config.Set(entry.key, value);
                break;
            case Override::kList: {
                std::vector<std::string> items;
                for (absl::string_view item : absl::StrSplit(value, ',', absl::SkipWhitespace())) {
                    items.emplace_back(absl::StripAsciiWhitespace(item));
                }
                config.Set(entry.key, std::move(items));
                break;
            }
        }
    }
    return config;
}

void Config::Merge(const Config& other) {
    if (!other.root_.IsMap()) {
        return;
    }
    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }
    MergeInto(root_, other.root_);
}

// =============================================================================
// Access
// =============================================================================

std::optional<YAML::Node> Config::FindNode(std::string_view key) const {
    YAML::Node current = root_;
    for (absl::string_view part : absl::StrSplit(absl::string_view(key.data(), key.size()), '.')) {
        if (!current.IsMap()) {
            return std::nullopt;
        }
        // Const lookup never inserts; a missing key yields an invalid node
        const YAML::Node child = std::as_const(current)[std::string(part)];
        if (!child.IsDefined()) {
            return std::nullopt;
        }
        // reset() rebinds the handle; operator= would overwrite the shared node
        current.reset(child);
    }
    if (current.IsNull()) {
        return std::nullopt;
    }
    return current;
}

bool Config::HasKey(std::string_view key) const {
    return FindNode(key).has_value();
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto node = FindNode(key);
    if (node && node->IsScalar()) {
        return node->Scalar();
    }
    return std::string(default_value);
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    auto value = ReadInt(key, default_value);
    if (!value.ok()) {
        SENTINEL_LOG_WARN("{}; using {}", std::string_view(value.status().message().data(), value.status().message().size()), default_value);
        return default_value;
    }
    return *value;
}

double Config::GetDouble(std::string_view key, double default_value) const {
    auto value = ReadDouble(key, default_value);
    if (!value.ok()) {
        SENTINEL_LOG_WARN("{}; using {}", std::string_view(value.status().message().data(), value.status().message().size()), default_value);
        return default_value;
    }
    return *value;
}

std::vector<std::string> Config::GetStringList(std::string_view key) const {
    std::vector<std::string> result;
    auto node = FindNode(key);
    if (node && node->IsSequence()) {
        for (const auto& item : *node) {
            if (item.IsScalar()) {
                result.push_back(item.Scalar());
            }
        }
    }
    return result;
}

absl::StatusOr<int64_t> Config::ReadInt(std::string_view key, int64_t default_value) const {
    auto node = FindNode(key);
    if (!node) {
        return default_value;
    }
    int64_t value = 0;
    if (!DecodeScalar(*node, value)) {
        return WrongType(key, "an integer");
    }
    return value;
}

absl::StatusOr<double> Config::ReadDouble(std::string_view key, double default_value) const {
    auto node = FindNode(key);
    if (!node) {
        return default_value;
    }
    double value = 0.0;
    if (!DecodeScalar(*node, value)) {
        return WrongType(key, "a number");
    }
    return value;
}

absl::StatusOr<std::vector<std::string>> Config::ReadStringList(std::string_view key) const {
    auto node = FindNode(key);
    if (!node) {
        return std::vector<std::string>{};
    }
    if (!node->IsSequence()) {
        return WrongType(key, "a list");
    }
    std::vector<std::string> result;
    result.reserve(node->size());
    for (const auto& item : *node) {
        if (!item.IsScalar()) {
            return WrongType(key, "a list of names");
        }
        result.push_back(item.Scalar());
    }
    return result;
}

void Config::Set(std::string_view key, ConfigValue value) {
    const std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }
    YAML::Node current;
    current.reset(root_);
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!current[parts[i]].IsMap()) {
            current[parts[i]] = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(current[parts[i]]);
    }

    YAML::Node leaf = std::visit([](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node sequence(YAML::NodeType::Sequence);
            for (const auto& item : v) {
                sequence.push_back(item);
            }
            return sequence;
        } else {
            return YAML::Node(v);
        }
    }, value);
    current[parts.back()] = leaf;
}

nlohmann::json Config::ToJson() const {
    return NodeToJson(root_);
}

// =============================================================================
// Global configuration
// =============================================================================

Config& GlobalConfig() {
    return g_global_config;
}

absl::Status InitGlobalConfig(const std::optional<std::filesystem::path>& config_path,
                              std::string_view env_prefix) {
    Config config;

    if (config_path.has_value()) {
        auto file_config = Config::LoadFromFile(*config_path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        config.Merge(*file_config);
    }

    auto env_config = Config::LoadFromEnvironment(env_prefix);
    if (!env_config.ok()) {
        return env_config.status();
    }
    config.Merge(*env_config);

    g_global_config = std::move(config);
    return absl::OkStatus();
}

}  // namespace sentinel
