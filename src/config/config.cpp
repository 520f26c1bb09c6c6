#include "filerix/config.hpp"
#include "filerix/encoding.hpp"
#include "filerix/file_ops.hpp"
#include "filerix/log.hpp"
#include "filerix/platform.hpp"

#include <cctype>
#include <optional>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace filerix {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Helper to safely get a bool from JSON
std::optional<bool> get_bool(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    return std::nullopt;
}

// Keep the default and record a warning when the name is not a known encoding
void read_encoding(const nlohmann::json& section, const std::string& section_name,
                   std::string& target, std::vector<std::string>& warnings) {
    if (auto enc = get_string(section, "encoding")) {
        if (parse_encoding(*enc)) {
            target = *enc;
        } else {
            warnings.push_back("invalid_configuration:" + section_name + ".encoding");
        }
    }
}

} // namespace

Config get_builtin_config() {
    Config config;
    config.schema = CONFIG_SCHEMA;
    return config;
}

ConfigParseResult parse_config_full(const std::string& json_str,
                                    const std::string& source_path) {
    ConfigParseResult result;
    result.config = get_builtin_config();
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != CONFIG_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + CONFIG_SCHEMA;
            return result;
        }

        if (auto level = get_string(j, "log_level")) {
            if (is_known_log_level(*level)) {
                result.config.log_level = *level;
            } else {
                result.warnings.push_back("invalid_configuration:log_level");
            }
        }

        // "create" section
        if (j.contains("create") && j["create"].is_object()) {
            const auto& create = j["create"];
            if (auto overwrite = get_bool(create, "overwrite")) {
                result.config.create.overwrite = *overwrite;
            }
            if (auto compact = get_bool(create, "compact")) {
                result.config.create.compact = *compact;
            }
            read_encoding(create, "create", result.config.create.encoding, result.warnings);
        }

        // "read" section
        if (j.contains("read") && j["read"].is_object()) {
            read_encoding(j["read"], "read", result.config.read.encoding, result.warnings);
        }

        // "temp" section
        if (j.contains("temp") && j["temp"].is_object()) {
            const auto& temp = j["temp"];
            if (auto prefix = get_string(temp, "prefix")) {
                result.config.temp.prefix = *prefix;
            }
            if (auto suffix = get_string(temp, "suffix")) {
                result.config.temp.suffix = *suffix;
            }
            if (auto directory = get_string(temp, "directory")) {
                if (!trim(*directory).empty()) {
                    result.config.temp.directory = *directory;
                }
            }
            if (auto close = get_bool(temp, "close_immediately")) {
                result.config.temp.close_immediately = *close;
            }
        }

        result.ok = true;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

ConfigParseResult load_config(const std::string& path) {
    auto content = read_file(path);
    if (!content.ok) {
        ConfigParseResult result;
        result.config = get_builtin_config();
        result.config.source_path = path;
        result.error = content.error.message();
        return result;
    }
    return parse_config_full(content.value.text, path);
}

ConfigParseResult resolve_config() {
    ConfigParseResult result;
    auto config_path = get_env(CONFIG_ENV_VAR);
    if (config_path && !config_path->empty()) {
        result = load_config(*config_path);
        if (!result.ok) {
            return result;
        }
    } else {
        result.ok = true;
        result.config = get_builtin_config();
    }

    if (auto level = get_env(LOG_LEVEL_ENV_VAR); level && !level->empty()) {
        if (is_known_log_level(*level)) {
            result.config.log_level = *level;
        } else {
            result.warnings.push_back(std::string("invalid_configuration:") + LOG_LEVEL_ENV_VAR);
        }
    }

    return result;
}

void apply_config(const Config& config) {
    set_log_level(config.log_level);
    if (!config.source_path.empty()) {
        spdlog::debug("using config {}", config.source_path);
    }
}

} // namespace filerix
