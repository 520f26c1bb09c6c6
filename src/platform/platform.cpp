#include "filerix/platform.hpp"

#include <cstdlib>

#ifndef _WIN32
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace filerix {

Platform get_current_platform() {
#if defined(__APPLE__)
    return Platform::macOS;
#elif defined(_WIN32)
    return Platform::Windows;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

std::optional<std::string> get_home_directory() {
    if (auto home = get_env("HOME"); home && !home->empty()) {
        return home;
    }
    if (auto profile = get_env("USERPROFILE"); profile && !profile->empty()) {
        return profile;
    }
#ifndef _WIN32
    if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) {
        return std::string(pw->pw_dir);
    }
#endif
    return std::nullopt;
}

std::optional<std::string> get_user_home_directory(const std::string& user) {
#ifndef _WIN32
    if (const passwd* pw = getpwnam(user.c_str()); pw && pw->pw_dir) {
        return std::string(pw->pw_dir);
    }
#else
    (void)user;
#endif
    return std::nullopt;
}

} // namespace filerix
