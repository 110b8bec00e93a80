#include "config.h"

#include <cstdlib>
#include <functional>
#include <sstream>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

namespace driftguard {

namespace {

nlohmann::json YamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& kv : node) {
                object[kv.first.as<std::string>()] = YamlToJson(kv.second);
            }
            return object;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(YamlToJson(item));
            }
            return array;
        }
        case YAML::NodeType::Scalar: {
            const std::string text = node.Scalar();
            int64_t as_int = 0;
            double as_double = 0.0;
            if (absl::SimpleAtoi(text, &as_int)) {
                return as_int;
            }
            if (absl::SimpleAtod(text, &as_double)) {
                return as_double;
            }
            if (text == "true" || text == "false") {
                return text == "true";
            }
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

Config Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    auto get_env = [&prefix](const char* suffix) -> std::optional<std::string> {
        std::string key = std::string(prefix) + suffix;
        const char* value = std::getenv(key.c_str());
        if (value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    };

    auto set_int = [&](const char* suffix, std::string_view key) {
        int64_t parsed = 0;
        if (auto val = get_env(suffix)) {
            if (absl::SimpleAtoi(*val, &parsed)) {
                config.Set(key, parsed);
            }
        }
    };

    auto set_double = [&](const char* suffix, std::string_view key) {
        double parsed = 0.0;
        if (auto val = get_env(suffix)) {
            if (absl::SimpleAtod(*val, &parsed)) {
                config.Set(key, parsed);
            }
        }
    };

    // Analysis settings
    set_int("MIN_GROUP_SIZE", "analysis.min_group_size");
    set_int("MAX_COMBINATION_SIZE", "analysis.max_combination_size");
    set_int("PSI_BINS", "analysis.psi_bins");
    set_int("ANALYSIS_INTERVAL", "analysis.analysis_interval");
    set_int("RANDOM_SEED", "analysis.random_seed");
    set_double("P_VALUE_THRESHOLD", "analysis.thresholds.p_value");
    set_double("DISPARATE_IMPACT_THRESHOLD", "analysis.thresholds.disparate_impact");

    if (auto val = get_env("SENSITIVE_ATTRIBUTES")) {
        std::vector<std::string> attributes =
            absl::StrSplit(*val, ',', absl::SkipEmpty());
        config.Set("monitor.sensitive_attributes", attributes);
    }

    // Logging
    if (auto val = get_env("LOG_LEVEL")) {
        config.Set("logging.level", *val);
    }
    if (auto val = get_env("LOG_FILE")) {
        config.Set("logging.file_path", *val);
        config.Set("logging.enable_file", true);
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
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');
    YAML::Node current = root_;

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
            return default_value;
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
            return default_value;
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
            return default_value;
        }
    }
    return default_value;
}

std::vector<std::string> Config::GetStringList(std::string_view key) const {
    std::vector<std::string> result;
    auto node = GetNestedNode(key);
    if (node && node->IsSequence()) {
        for (const auto& item : *node) {
            if (item.IsScalar()) {
                result.push_back(item.as<std::string>());
            }
        }
    }
    return result;
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    // Nodes are handles; reset() rebinds without overwriting the parent
    YAML::Node current = root_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!current[parts[i]] || !current[parts[i]].IsMap()) {
            current[parts[i]] = YAML::Node(YAML::NodeType::Map);
        }
        YAML::Node child = current[parts[i]];
        current.reset(child);
    }

    std::visit([&](auto&& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            current[parts.back()] = seq;
        } else if constexpr (std::is_same_v<T, std::unordered_map<std::string, std::string>>) {
            YAML::Node map(YAML::NodeType::Map);
            for (const auto& [k, v] : val) {
                map[k] = v;
            }
            current[parts.back()] = map;
        } else {
            current[parts.back()] = val;
        }
    }, value);
}

nlohmann::json Config::ToJson() const {
    return YamlToJson(root_);
}

absl::StatusOr<Config> LoadLayeredConfig(
    const std::optional<std::filesystem::path>& config_path,
    std::string_view env_prefix
) {
    Config config;

    if (config_path.has_value()) {
        auto file_config = Config::LoadFromFile(*config_path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        config.Merge(*file_config);
    }

    // Environment variables have the highest priority
    config.Merge(Config::LoadFromEnvironment(env_prefix));
    return config;
}

LogConfig LoadLogConfig(const Config& config) {
    LogConfig log_config;
    log_config.name = config.GetString("logging.name", log_config.name);
    if (auto level = ParseLogLevel(config.GetString("logging.level", "info"))) {
        log_config.level = *level;
    }
    log_config.pattern = config.GetString("logging.pattern", log_config.pattern);
    log_config.enable_file = config.GetBool("logging.enable_file", false);
    log_config.file_path = config.GetString("logging.file_path", log_config.file_path);
    log_config.max_file_size = static_cast<size_t>(
        config.GetInt("logging.max_file_size",
                      static_cast<int64_t>(log_config.max_file_size)));
    log_config.max_files = static_cast<size_t>(
        config.GetInt("logging.max_files", static_cast<int64_t>(log_config.max_files)));
    return log_config;
}

}  // namespace driftguard
