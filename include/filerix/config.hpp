#pragma once

#include "filerix/types.hpp"

#include <string>
#include <vector>

namespace filerix {

inline constexpr const char* CONFIG_SCHEMA = "filerix.config.v1";

// Environment variables consulted by resolve_config()
inline constexpr const char* CONFIG_ENV_VAR = "FILERIX_CONFIG";
inline constexpr const char* LOG_LEVEL_ENV_VAR = "FILERIX_LOG_LEVEL";

// ============================================================================
// Config
// ============================================================================

struct Config {
    std::string schema;  // MUST be "filerix.config.v1"

    std::string log_level = "info";

    // [create] section: defaults for create_file
    CreateOptions create;

    // [read] section: defaults for read_file (encoding only)
    ReadOptions read;

    // [temp] section: defaults for create_temp_file
    TempFileSpec temp;

    // Source path for diagnostics
    std::string source_path;
};

// Defaults used when no config file is given
Config get_builtin_config();

// ============================================================================
// Config Parsing
// ============================================================================

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    Config config;
    std::vector<std::string> warnings;
};

// Parse a config from a JSON string.
// Malformed JSON, a non-object root and a missing or mismatched $schema are
// errors. Unknown encodings and log levels fall back to the default and add a
// warning.
ConfigParseResult parse_config_full(const std::string& json_str,
                                    const std::string& source_path = "");

// Read and parse a config file
ConfigParseResult load_config(const std::string& path);

// FILERIX_CONFIG when set, the builtin config otherwise; FILERIX_LOG_LEVEL
// then overrides log_level
ConfigParseResult resolve_config();

// Apply process-wide settings (log level) from a config
void apply_config(const Config& config);

} // namespace filerix
