#include "filerix/path_utils.hpp"
#include "filerix/platform.hpp"

#include <filesystem>
#include <string>

namespace filerix {

namespace fs = std::filesystem;

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

bool is_separator(char c) {
#ifdef _WIN32
    return c == '/' || c == '\\';
#else
    return c == '/';
#endif
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

// Resolve and require existence; shared by the attribute queries
Result<std::string> resolve_existing(const std::string& raw_path) {
    auto resolved = resolve_path(raw_path);
    if (!resolved.ok) {
        return resolved;
    }
    if (!path_exists(resolved.value)) {
        return Result<std::string>::failure(
            make_error(ErrorKind::NotFound, resolved.value, "path does not exist"));
    }
    return resolved;
}

} // namespace

std::string expand_user(const std::string& raw_path) {
    if (raw_path.empty() || raw_path[0] != '~') {
        return raw_path;
    }

    size_t sep = 1;
    while (sep < raw_path.size() && !is_separator(raw_path[sep])) {
        ++sep;
    }

    std::string user = raw_path.substr(1, sep - 1);
    auto home = user.empty() ? get_home_directory() : get_user_home_directory(user);
    if (!home) {
        return raw_path;
    }

    std::string rest = raw_path.substr(sep);
    // Avoid "//" when home is the filesystem root
    if (!rest.empty() && !home->empty() && is_separator(home->back())) {
        home->pop_back();
    }
    return *home + rest;
}

Result<std::string> resolve_path(const std::string& raw_path) {
    if (contains_nul(raw_path)) {
        return Result<std::string>::failure(
            make_error(ErrorKind::InvalidInputKind, raw_path, "path contains a NUL byte"));
    }

    std::error_code ec;
    // An empty path names the working directory
    fs::path input = raw_path.empty() ? fs::path(".") : fs::path(expand_user(raw_path));
    fs::path absolute = fs::absolute(input, ec);
    if (ec) {
        return Result<std::string>::failure(
            make_error(ErrorKind::OsError, raw_path, "cannot make path absolute", ec.message()));
    }

    fs::path canonical = fs::weakly_canonical(absolute, ec);
    if (ec) {
        // An unreadable ancestor stops symlink resolution; keep the lexical form
        canonical = absolute.lexically_normal();
    }

    if (!canonical.has_filename() && canonical.has_relative_path()) {
        canonical = canonical.parent_path();
    }

    return Result<std::string>::success(canonical.string());
}

bool has_hidden_name(const std::string& path) {
    std::string name = fs::path(path).filename().string();
    return !name.empty() && name[0] == '.';
}

Result<std::string> validate_path(const std::string& raw_path,
                                  const ValidationConstraints& constraints) {
    auto resolved = resolve_path(raw_path);
    if (!resolved.ok) {
        return resolved;
    }
    const std::string& path = resolved.value;

    if (constraints.must_exist && !path_exists(path)) {
        return Result<std::string>::failure(
            make_error(ErrorKind::NotFound, path, "path does not exist"));
    }

    std::error_code ec;
    if (constraints.expected_kind == ExpectedKind::File && !fs::is_regular_file(path, ec)) {
        return Result<std::string>::failure(
            make_error(ErrorKind::WrongKind, path, "expected a regular file"));
    }
    if (constraints.expected_kind == ExpectedKind::Directory && !fs::is_directory(path, ec)) {
        return Result<std::string>::failure(
            make_error(ErrorKind::WrongKind, path, "expected a directory"));
    }

    if (!constraints.allow_hidden && has_hidden_name(path)) {
        return Result<std::string>::failure(
            make_error(ErrorKind::HiddenRejected, path, "hidden paths are not allowed"));
    }

    if (constraints.readable && !has_read_access(path)) {
        return Result<std::string>::failure(
            make_error(ErrorKind::NotReadable, path, "path is not readable"));
    }

    if (constraints.writable && !has_write_access(path)) {
        return Result<std::string>::failure(
            make_error(ErrorKind::NotWritable, path, "path is not writable"));
    }

    return resolved;
}

Result<bool> is_hidden(const std::string& raw_path) {
    auto resolved = resolve_existing(raw_path);
    if (!resolved.ok) {
        return Result<bool>::failure(resolved.error);
    }
    return Result<bool>::success(platform_attributes().is_hidden(resolved.value));
}

Result<bool> is_readonly(const std::string& raw_path) {
    auto resolved = resolve_existing(raw_path);
    if (!resolved.ok) {
        return Result<bool>::failure(resolved.error);
    }
    return Result<bool>::success(platform_attributes().is_readonly(resolved.value));
}

} // namespace filerix
