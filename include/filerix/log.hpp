#pragma once

#include <string>

namespace filerix {

// Log levels understood by set_log_level: "trace", "debug", "info", "warn",
// "error", "off" (case-insensitive; "warning" and "err" are accepted too)
bool is_known_log_level(const std::string& level);

// Set the level of spdlog's default logger, which the library logs through.
// Returns false and leaves the level unchanged for an unknown name.
bool set_log_level(const std::string& level);

} // namespace filerix
