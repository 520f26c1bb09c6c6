#include "filerix/log.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include <spdlog/spdlog.h>

namespace filerix {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& level) {
    std::string l = to_lower(level);
    if (l == "trace") return spdlog::level::trace;
    if (l == "debug") return spdlog::level::debug;
    if (l == "info") return spdlog::level::info;
    if (l == "warn" || l == "warning") return spdlog::level::warn;
    if (l == "error" || l == "err") return spdlog::level::err;
    if (l == "off") return spdlog::level::off;
    return std::nullopt;
}

} // namespace

bool is_known_log_level(const std::string& level) {
    return parse_log_level(level).has_value();
}

bool set_log_level(const std::string& level) {
    auto parsed = parse_log_level(level);
    if (!parsed) {
        spdlog::warn("unknown log level '{}', keeping current level", level);
        return false;
    }
    spdlog::set_level(*parsed);
    return true;
}

} // namespace filerix
