/*
 * filerix - Validated File Operations
 * SPDX-License-Identifier: Apache-2.0
 *
 * Umbrella header. Pulls in path validation, content sanitization,
 * directory and temp file helpers, the create/read/delete operations and
 * the config layer.
 *
 * All fallible calls return filerix::Result<T>; nothing throws across the
 * public API. Check `ok` before using `value`:
 *
 *     auto created = filerix::create_file("~/notes/todo.txt", "buy milk");
 *     if (!created.ok) {
 *         std::cerr << created.error.message() << "\n";
 *     }
 */

#ifndef FILERIX_HPP
#define FILERIX_HPP

#include "filerix/config.hpp"
#include "filerix/directory.hpp"
#include "filerix/encoding.hpp"
#include "filerix/file_ops.hpp"
#include "filerix/log.hpp"
#include "filerix/path_utils.hpp"
#include "filerix/platform.hpp"
#include "filerix/sanitize.hpp"
#include "filerix/temp_file.hpp"
#include "filerix/types.hpp"

namespace filerix {

inline constexpr const char* FILERIX_VERSION = "1.0.0";
inline constexpr int FILERIX_VERSION_MAJOR = 1;
inline constexpr int FILERIX_VERSION_MINOR = 0;
inline constexpr int FILERIX_VERSION_PATCH = 0;

} // namespace filerix

#endif // FILERIX_HPP
