#include "filerix/directory.hpp"
#include "filerix/path_utils.hpp"

#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

namespace filerix {

namespace fs = std::filesystem;

Result<std::string> ensure_directory(const std::string& raw_path,
                                     const EnsureOptions& options) {
    auto resolved = resolve_path(raw_path);
    if (!resolved.ok) {
        return resolved;
    }
    const std::string& path = resolved.value;

    std::error_code ec;
    if (fs::exists(path, ec)) {
        if (!fs::is_directory(path, ec)) {
            return Result<std::string>::failure(
                make_error(ErrorKind::WrongKind, path, "path exists but is not a directory"));
        }
        if (!options.exist_ok) {
            return Result<std::string>::failure(
                make_error(ErrorKind::AlreadyExists, path, "directory already exists"));
        }
        return resolved;
    }

    if (!options.create_if_missing) {
        return Result<std::string>::failure(
            make_error(ErrorKind::NotFound, path, "directory does not exist and creation is disabled"));
    }

    bool created = fs::create_directories(path, ec);
    if (ec) {
        std::error_code probe;
        if (fs::is_directory(path, probe)) {
            created = false;
        } else if (ec == std::errc::permission_denied ||
                   ec == std::errc::operation_not_permitted) {
            return Result<std::string>::failure(
                make_error(ErrorKind::PermissionDenied, path,
                           "permission denied while creating directory", ec.message()));
        } else {
            return Result<std::string>::failure(
                make_error(ErrorKind::DirectoryCreateFailed, path,
                           "failed to create directory", ec.message()));
        }
    }

    // Another process created it between the existence check and creation
    if (!created) {
        if (!options.exist_ok) {
            return Result<std::string>::failure(
                make_error(ErrorKind::AlreadyExists, path, "directory already exists"));
        }
        return resolved;
    }

    spdlog::debug("created directory {}", path);
    return resolved;
}

} // namespace filerix
