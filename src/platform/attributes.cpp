#include "filerix/platform.hpp"
#include "filerix/path_utils.hpp"

#include <filesystem>

#include <spdlog/spdlog.h>

#ifdef _WIN32
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace filerix {

namespace fs = std::filesystem;

namespace {

bool owner_write_cleared(const std::string& resolved_path) {
    std::error_code ec;
    auto st = fs::status(resolved_path, ec);
    if (ec) {
        return false;
    }
    return (st.permissions() & fs::perms::owner_write) == fs::perms::none;
}

#ifdef _WIN32
// Returns INVALID_FILE_ATTRIBUTES when the query fails
DWORD query_attributes(const std::string& resolved_path) {
    return GetFileAttributesW(fs::path(resolved_path).wstring().c_str());
}
#endif

} // namespace

bool has_read_access(const std::string& resolved_path) {
#ifdef _WIN32
    return _waccess(fs::path(resolved_path).wstring().c_str(), 4) == 0;
#else
    return access(resolved_path.c_str(), R_OK) == 0;
#endif
}

bool has_write_access(const std::string& resolved_path) {
#ifdef _WIN32
    return _waccess(fs::path(resolved_path).wstring().c_str(), 2) == 0;
#else
    return access(resolved_path.c_str(), W_OK) == 0;
#endif
}

// ============================================================================
// POSIX
// ============================================================================

bool PosixAttributes::is_hidden(const std::string& resolved_path) const {
    return has_hidden_name(resolved_path);
}

bool PosixAttributes::is_readonly(const std::string& resolved_path) const {
    return owner_write_cleared(resolved_path) || !has_write_access(resolved_path);
}

// ============================================================================
// Attribute bits
// ============================================================================

bool AttributeBitAttributes::is_hidden(const std::string& resolved_path) const {
#ifdef _WIN32
    DWORD attrs = query_attributes(resolved_path);
    if (attrs != INVALID_FILE_ATTRIBUTES) {
        return (attrs & FILE_ATTRIBUTE_HIDDEN) != 0;
    }
#endif
    spdlog::warn("hidden attribute query failed for {}, using dot prefix", resolved_path);
    return fallback_.is_hidden(resolved_path);
}

bool AttributeBitAttributes::is_readonly(const std::string& resolved_path) const {
#ifdef _WIN32
    DWORD attrs = query_attributes(resolved_path);
    if (attrs != INVALID_FILE_ATTRIBUTES) {
        return (attrs & FILE_ATTRIBUTE_READONLY) != 0;
    }
#endif
    spdlog::warn("read-only attribute query failed for {}, using access check", resolved_path);
    return fallback_.is_readonly(resolved_path);
}

const PlatformAttributes& platform_attributes() {
    static const PosixAttributes posix;
    static const AttributeBitAttributes attribute_bits;
    if (get_current_platform() == Platform::Windows) {
        return attribute_bits;
    }
    return posix;
}

} // namespace filerix
