#pragma once

#include <optional>
#include <string>

namespace filerix {

// ============================================================================
// Platform Detection
// ============================================================================

enum class Platform {
    Linux,
    macOS,
    Windows,
    Unknown
};

Platform get_current_platform();

inline const char* platform_to_string(Platform p) {
    switch (p) {
        case Platform::Linux: return "linux";
        case Platform::macOS: return "macos";
        case Platform::Windows: return "windows";
        case Platform::Unknown: return "unknown";
        default: return "unknown";
    }
}

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Home directory of the current user: HOME, then USERPROFILE, then the
// password database on POSIX systems
std::optional<std::string> get_home_directory();

// Home directory of a named user (POSIX password database only)
std::optional<std::string> get_user_home_directory(const std::string& user);

// ============================================================================
// Platform Attributes
// ============================================================================

// Hidden and read-only detection for an existing, resolved path.
// Implementations never fail: attribute-based variants fall back to the
// POSIX-style checks when the attribute query is unavailable.
class PlatformAttributes {
public:
    virtual ~PlatformAttributes() = default;

    virtual const char* name() const = 0;
    virtual bool is_hidden(const std::string& resolved_path) const = 0;
    virtual bool is_readonly(const std::string& resolved_path) const = 0;
};

// Dot-prefix hidden check and permission-bit / access() read-only check
class PosixAttributes : public PlatformAttributes {
public:
    const char* name() const override { return "posix"; }
    bool is_hidden(const std::string& resolved_path) const override;
    bool is_readonly(const std::string& resolved_path) const override;
};

// FILE_ATTRIBUTE_HIDDEN / FILE_ATTRIBUTE_READONLY bits, with fallback
class AttributeBitAttributes : public PlatformAttributes {
public:
    const char* name() const override { return "attribute-bits"; }
    bool is_hidden(const std::string& resolved_path) const override;
    bool is_readonly(const std::string& resolved_path) const override;

private:
    PosixAttributes fallback_;
};

// Variant selected for the running platform; lives for the whole process
const PlatformAttributes& platform_attributes();

// Effective-user access checks used by path validation
bool has_read_access(const std::string& resolved_path);
bool has_write_access(const std::string& resolved_path);

} // namespace filerix
