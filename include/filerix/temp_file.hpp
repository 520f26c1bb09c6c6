#pragma once

#include "filerix/types.hpp"

#include <cstdio>
#include <memory>
#include <string>

namespace filerix {

// Maximum number of names tried before giving up on a temp file
inline constexpr int TEMP_MAX_ATTEMPTS = 100;

// ============================================================================
// Temp File Handle
// ============================================================================

// Owns the open stream of a created temporary file. Closing (explicitly or
// on destruction) releases the stream only; the file stays on disk.
class TempFile {
public:
    TempFile() = default;
    TempFile(std::string path, std::FILE* stream);

    TempFile(TempFile&&) noexcept = default;
    TempFile& operator=(TempFile&&) noexcept = default;
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }
    bool is_open() const { return stream_ != nullptr; }

    // Borrowed stream, nullptr once closed
    std::FILE* stream() const { return stream_.get(); }

    // Append data to the open stream; false if closed or the write fails
    bool write(const std::string& data);

    // Flush and close the stream; false if flushing or closing failed
    bool close();

private:
    struct StreamCloser {
        void operator()(std::FILE* f) const {
            if (f) std::fclose(f);
        }
    };

    std::string path_;
    std::unique_ptr<std::FILE, StreamCloser> stream_;
};

// ============================================================================
// Temp File Creation
// ============================================================================

// Create a uniquely named file "<prefix><8 hex chars><suffix>" inside
// spec.directory (created with its ancestors when missing) or the system temp
// directory. The file exists on disk when this returns. With
// close_immediately the returned handle is already closed.
//
//   directory exists, not a directory  -> WrongKind
//   prefix/suffix holds a separator    -> InvalidInputKind
//   anything else                      -> TempFileCreateFailed
Result<TempFile> create_temp_file(const TempFileSpec& spec = {});

} // namespace filerix
