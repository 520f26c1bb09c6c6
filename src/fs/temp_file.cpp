#include "filerix/temp_file.hpp"
#include "filerix/directory.hpp"
#include "filerix/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <random>

#include <spdlog/spdlog.h>

namespace filerix {

namespace fs = std::filesystem;

namespace {

// Random 8 hex character name component
std::string random_token() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    const std::string hex_chars = "0123456789abcdef";
    std::string token;
    for (int i = 0; i < 8; ++i) {
        token += hex_chars[static_cast<size_t>(dis(gen))];
    }
    return token;
}

bool has_separator(const std::string& s) {
#ifdef _WIN32
    return s.find_first_of("/\\") != std::string::npos;
#else
    return s.find('/') != std::string::npos;
#endif
}

Result<TempFile> temp_error(ErrorKind kind, const std::string& path,
                            const std::string& reason, const std::string& cause = "") {
    return Result<TempFile>::failure(make_error(kind, path, reason, cause));
}

Result<std::string> target_directory(const TempFileSpec& spec) {
    if (spec.directory) {
        auto resolved = resolve_path(*spec.directory);
        if (!resolved.ok) {
            return resolved;
        }
        auto ensured = ensure_directory(resolved.value);
        if (!ensured.ok && ensured.error.kind != ErrorKind::WrongKind) {
            return Result<std::string>::failure(wrap_error(
                ErrorKind::TempFileCreateFailed, ensured.error,
                "failed to prepare temp directory"));
        }
        return ensured;
    }

    std::error_code ec;
    fs::path system_tmp = fs::temp_directory_path(ec);
    if (ec) {
        return Result<std::string>::failure(make_error(
            ErrorKind::TempFileCreateFailed, TEMPFILE_PLACEHOLDER,
            "no system temp directory available", ec.message()));
    }
    return resolve_path(system_tmp.string());
}

} // namespace

TempFile::TempFile(std::string path, std::FILE* stream)
    : path_(std::move(path)), stream_(stream) {}

bool TempFile::write(const std::string& data) {
    if (!stream_) {
        return false;
    }
    return std::fwrite(data.data(), 1, data.size(), stream_.get()) == data.size();
}

bool TempFile::close() {
    if (!stream_) {
        return true;
    }
    bool flushed = std::fflush(stream_.get()) == 0;
    bool closed = std::fclose(stream_.release()) == 0;
    return flushed && closed;
}

Result<TempFile> create_temp_file(const TempFileSpec& spec) {
    if (has_separator(spec.prefix) || has_separator(spec.suffix)) {
        return temp_error(ErrorKind::InvalidInputKind, TEMPFILE_PLACEHOLDER,
                          "prefix and suffix must not contain path separators");
    }

    auto dir = target_directory(spec);
    if (!dir.ok) {
        return Result<TempFile>::failure(dir.error);
    }

    for (int attempt = 0; attempt < TEMP_MAX_ATTEMPTS; ++attempt) {
        std::string candidate =
            (fs::path(dir.value) / (spec.prefix + random_token() + spec.suffix)).string();

        // "x": fail instead of opening an entry that already exists
        std::FILE* stream = std::fopen(candidate.c_str(), "wbx");
        if (!stream) {
            if (errno == EEXIST) {
                continue;
            }
            return temp_error(ErrorKind::TempFileCreateFailed, TEMPFILE_PLACEHOLDER,
                              "failed to create temp file", std::strerror(errno));
        }

        TempFile file(candidate, stream);
        spdlog::debug("created temp file {}", candidate);
        if (spec.close_immediately && !file.close()) {
            return temp_error(ErrorKind::TempFileCreateFailed, candidate,
                              "failed to close temp file");
        }
        return Result<TempFile>::success(std::move(file));
    }

    return temp_error(ErrorKind::TempFileCreateFailed, TEMPFILE_PLACEHOLDER,
                      "no unused temp file name found in " + dir.value);
}

} // namespace filerix
