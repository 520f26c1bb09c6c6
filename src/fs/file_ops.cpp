#include "filerix/file_ops.hpp"
#include "filerix/directory.hpp"
#include "filerix/encoding.hpp"
#include "filerix/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace filerix {

namespace fs = std::filesystem;

namespace {

bool is_permission_error(int err) {
    return err == EACCES || err == EPERM || err == EROFS;
}

bool is_permission_error(const std::error_code& ec) {
    return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
           ec == std::errc::read_only_file_system;
}

Result<std::string> write_whole_file(const std::string& path, const std::string& data) {
    errno = 0;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        int err = errno;
        std::string cause = err ? std::strerror(err) : "cannot open file for writing";
        if (is_permission_error(err)) {
            return Result<std::string>::failure(make_error(
                ErrorKind::PermissionDenied, path, "permission denied while creating file", cause));
        }
        return Result<std::string>::failure(
            make_error(ErrorKind::OsError, path, "failed to open file for writing", cause));
    }

    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        return Result<std::string>::failure(
            make_error(ErrorKind::OsError, path, "failed to write file content"));
    }
    return Result<std::string>::success(path);
}

Result<std::string> create_file_impl(const std::string& raw_path,
                                     const ContentValue& content,
                                     const CreateOptions& options) {
    auto resolved = resolve_path(raw_path);
    if (!resolved.ok) {
        return resolved;
    }
    const std::string& path = resolved.value;

    auto encoding = parse_encoding(options.encoding);
    if (!encoding) {
        return Result<std::string>::failure(make_error(
            ErrorKind::InvalidInputKind, path, "unknown encoding: " + options.encoding));
    }

    std::error_code ec;
    if (fs::exists(path, ec)) {
        if (!options.overwrite) {
            return Result<std::string>::failure(make_error(
                ErrorKind::AlreadyExists, path, "file already exists and overwrite is disabled"));
        }
        if (fs::is_directory(path, ec)) {
            return Result<std::string>::failure(
                make_error(ErrorKind::IsADirectory, path, "path is a directory"));
        }
    }

    auto parent = ensure_directory(fs::path(path).parent_path().string());
    if (!parent.ok) {
        return Result<std::string>::failure(parent.error);
    }

    SanitizationPolicy policy;
    policy.compact = options.compact;
    auto sanitized = sanitize_content(content, policy);
    if (!sanitized.ok) {
        Error err = sanitized.error;
        err.path = path;
        return Result<std::string>::failure(err);
    }

    auto encoded = encode_text(sanitized.value, *encoding);
    if (!encoded) {
        return Result<std::string>::failure(make_error(
            ErrorKind::InvalidEncoding, path,
            std::string("content cannot be encoded as ") + encoding_to_string(*encoding)));
    }

    auto written = write_whole_file(path, *encoded);
    if (!written.ok) {
        return written;
    }

    spdlog::debug("created file {} ({} bytes)", path, encoded->size());
    return resolved;
}

Result<FileContent> read_file_impl(const std::string& raw_path, const ReadOptions& options) {
    ValidationConstraints constraints;
    constraints.must_exist = true;
    constraints.expected_kind = ExpectedKind::File;
    constraints.readable = true;

    auto validated = validate_path(raw_path, constraints);
    if (!validated.ok) {
        return Result<FileContent>::failure(validated.error);
    }
    const std::string& path = validated.value;

    std::optional<Encoding> encoding;
    if (!options.as_bytes) {
        encoding = parse_encoding(options.encoding);
        if (!encoding) {
            return Result<FileContent>::failure(make_error(
                ErrorKind::InvalidInputKind, path, "unknown encoding: " + options.encoding));
        }
    }

    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        int err = errno;
        std::string cause = err ? std::strerror(err) : "cannot open file for reading";
        ErrorKind kind = is_permission_error(err) ? ErrorKind::NotReadable : ErrorKind::OsError;
        return Result<FileContent>::failure(
            make_error(kind, path, "failed to open file for reading", cause));
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Result<FileContent>::failure(
            make_error(ErrorKind::OsError, path, "failed to read file content"));
    }
    std::string raw = ss.str();

    FileContent content;
    if (options.as_bytes) {
        content.is_binary = true;
        content.bytes.assign(raw.begin(), raw.end());
        return Result<FileContent>::success(std::move(content));
    }

    auto text = decode_text(raw, *encoding);
    if (!text) {
        return Result<FileContent>::failure(make_error(
            ErrorKind::DecodeError, path,
            std::string("content is not valid ") + encoding_to_string(*encoding)));
    }
    content.text = std::move(*text);
    return Result<FileContent>::success(std::move(content));
}

Result<bool> delete_file_impl(const std::string& raw_path, bool ignore_missing) {
    auto resolved = resolve_path(raw_path);
    if (!resolved.ok) {
        return Result<bool>::failure(resolved.error);
    }
    const std::string& path = resolved.value;

    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return Result<bool>::failure(
            make_error(ErrorKind::IsADirectory, path, "path is a directory"));
    }

    if (!fs::exists(path, ec)) {
        if (ignore_missing) {
            return Result<bool>::success(false);
        }
        return Result<bool>::failure(
            make_error(ErrorKind::NotFound, path, "file does not exist"));
    }

    if (!fs::is_regular_file(path, ec)) {
        return Result<bool>::failure(
            make_error(ErrorKind::WrongKind, path, "expected a regular file"));
    }

    fs::remove(path, ec);
    if (ec) {
        ErrorKind kind = is_permission_error(ec) ? ErrorKind::NotWritable : ErrorKind::OsError;
        return Result<bool>::failure(
            make_error(kind, path, "failed to delete file", ec.message()));
    }

    spdlog::debug("deleted file {}", path);
    return Result<bool>::success(true);
}

} // namespace

// The public entry points re-wrap anything the standard library throws so
// callers only ever see Result values.

Result<std::string> create_file(const std::string& raw_path,
                                const ContentValue& content,
                                const CreateOptions& options) {
    try {
        return create_file_impl(raw_path, content, options);
    } catch (const std::exception& e) {
        return Result<std::string>::failure(
            make_error(ErrorKind::OsError, raw_path, "unexpected error while creating file", e.what()));
    }
}

Result<FileContent> read_file(const std::string& raw_path, const ReadOptions& options) {
    try {
        return read_file_impl(raw_path, options);
    } catch (const std::exception& e) {
        return Result<FileContent>::failure(
            make_error(ErrorKind::OsError, raw_path, "unexpected error while reading file", e.what()));
    }
}

Result<bool> delete_file(const std::string& raw_path, bool ignore_missing) {
    try {
        return delete_file_impl(raw_path, ignore_missing);
    } catch (const std::exception& e) {
        return Result<bool>::failure(
            make_error(ErrorKind::OsError, raw_path, "unexpected error while deleting file", e.what()));
    }
}

} // namespace filerix
