#pragma once

#include "filerix/sanitize.hpp"
#include "filerix/types.hpp"

#include <string>

namespace filerix {

// ============================================================================
// File Operations
// ============================================================================

// Write sanitized content to a file and return its resolved path.
//
// The parent directory is created when missing. Existing content is replaced
// entirely unless options.overwrite is false, in which case an existing path
// fails with AlreadyExists. Sanitization errors are returned with their own
// kind and the file path filled in. Note that the default (empty) content
// sanitizes to nothing and fails with EmptyContent.
Result<std::string> create_file(const std::string& raw_path,
                                const ContentValue& content = "",
                                const CreateOptions& options = {});

// Read a whole file as text (decoded to UTF-8) or as raw bytes.
// NotFound, WrongKind and NotReadable come from path validation;
// DecodeError when the bytes are not valid in the requested encoding.
Result<FileContent> read_file(const std::string& raw_path,
                              const ReadOptions& options = {});

// Delete a regular file. Returns true when removed and false when the path
// did not exist and ignore_missing is set. A directory always fails with
// IsADirectory, a denied removal with NotWritable.
Result<bool> delete_file(const std::string& raw_path, bool ignore_missing = false);

} // namespace filerix
