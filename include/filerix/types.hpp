#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace filerix {

using Bytes = std::vector<std::uint8_t>;

// ============================================================================
// Error Kinds
// ============================================================================

enum class ErrorKind {
    InvalidInputKind,       // argument is not a usable path or content value
    NotFound,
    WrongKind,              // file where a directory was expected, or the reverse
    HiddenRejected,
    NotReadable,
    NotWritable,
    AlreadyExists,
    UnsupportedType,
    InvalidEncoding,
    EmptyContent,
    DirectoryCreateFailed,
    TempFileCreateFailed,
    IsADirectory,
    PermissionDenied,
    DecodeError,
    OsError,
};

// Convert error kind to canonical lowercase snake_case string
inline const char* error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::InvalidInputKind: return "invalid_input_kind";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::WrongKind: return "wrong_kind";
        case ErrorKind::HiddenRejected: return "hidden_rejected";
        case ErrorKind::NotReadable: return "not_readable";
        case ErrorKind::NotWritable: return "not_writable";
        case ErrorKind::AlreadyExists: return "already_exists";
        case ErrorKind::UnsupportedType: return "unsupported_type";
        case ErrorKind::InvalidEncoding: return "invalid_encoding";
        case ErrorKind::EmptyContent: return "empty_content";
        case ErrorKind::DirectoryCreateFailed: return "directory_create_failed";
        case ErrorKind::TempFileCreateFailed: return "tempfile_create_failed";
        case ErrorKind::IsADirectory: return "is_a_directory";
        case ErrorKind::PermissionDenied: return "permission_denied";
        case ErrorKind::DecodeError: return "decode_error";
        case ErrorKind::OsError: return "os_error";
        default: return "unknown";
    }
}

// Placeholder path for failures that happen before a temp file has a name
inline constexpr const char* TEMPFILE_PLACEHOLDER = "<tempfile>";

// Placeholder path for content failures raised outside of a file operation
inline constexpr const char* CONTENT_PLACEHOLDER = "<content>";

// ============================================================================
// Error
// ============================================================================

struct Error {
    ErrorKind kind = ErrorKind::OsError;
    std::string path;    // resolved path, raw input, or TEMPFILE_PLACEHOLDER
    std::string reason;  // human-readable description
    std::string cause;   // message of the lower-level failure, if any

    // "[kind] path: reason (cause)"
    std::string message() const {
        std::string msg = "[";
        msg += error_kind_to_string(kind);
        msg += "] ";
        msg += path;
        msg += ": ";
        msg += reason;
        if (!cause.empty()) {
            msg += " (" + cause + ")";
        }
        return msg;
    }
};

inline Error make_error(ErrorKind kind, std::string path, std::string reason,
                        std::string cause = "") {
    Error e;
    e.kind = kind;
    e.path = std::move(path);
    e.reason = std::move(reason);
    e.cause = std::move(cause);
    return e;
}

// Re-map a lower-level error to another kind, keeping its message as cause
inline Error wrap_error(ErrorKind kind, const Error& inner, std::string reason) {
    return make_error(kind, inner.path, std::move(reason), inner.message());
}

// ============================================================================
// Result
// ============================================================================

template<typename T>
struct Result {
    bool ok = false;
    Error error;
    T value{};

    static Result success(T v) {
        Result r;
        r.ok = true;
        r.value = std::move(v);
        return r;
    }

    static Result failure(Error e) {
        Result r;
        r.error = std::move(e);
        return r;
    }
};

// ============================================================================
// Validation Constraints
// ============================================================================

enum class ExpectedKind {
    Any,
    File,
    Directory
};

inline const char* expected_kind_to_string(ExpectedKind k) {
    switch (k) {
        case ExpectedKind::Any: return "any";
        case ExpectedKind::File: return "file";
        case ExpectedKind::Directory: return "directory";
        default: return "any";
    }
}

struct ValidationConstraints {
    bool must_exist = true;
    ExpectedKind expected_kind = ExpectedKind::Any;
    bool readable = false;
    bool writable = false;
    bool allow_hidden = true;
};

// ============================================================================
// Content Policy
// ============================================================================

struct SanitizationPolicy {
    bool compact = false;  // collapse blank lines and space runs, trim
};

// ============================================================================
// Operation Options
// ============================================================================

struct EnsureOptions {
    bool create_if_missing = true;
    bool exist_ok = true;
};

struct CreateOptions {
    bool overwrite = true;
    bool compact = false;
    std::string encoding = "utf-8";
};

struct ReadOptions {
    bool as_bytes = false;
    std::string encoding = "utf-8";
};

struct TempFileSpec {
    std::string prefix = "tmp_";
    std::string suffix = ".tmp";
    std::optional<std::string> directory;  // system temp directory when unset
    bool close_immediately = true;
};

// Content returned by read_file: text (UTF-8) or raw bytes
struct FileContent {
    bool is_binary = false;
    std::string text;
    Bytes bytes;
};

} // namespace filerix
