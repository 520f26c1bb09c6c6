#pragma once

#include "filerix/types.hpp"

#include <string>

namespace filerix {

// Make sure a directory exists and return its resolved path.
//
//   exists, not a directory       -> WrongKind
//   exists, directory, !exist_ok  -> AlreadyExists
//   missing, !create_if_missing   -> NotFound
//   creation denied               -> PermissionDenied
//   other creation failure        -> DirectoryCreateFailed
//
// Missing ancestors are created too. Losing a creation race to another
// process is success with exist_ok and AlreadyExists without it.
Result<std::string> ensure_directory(const std::string& raw_path,
                                     const EnsureOptions& options = {});

} // namespace filerix
