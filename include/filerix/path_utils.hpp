#pragma once

#include "filerix/types.hpp"

#include <string>

namespace filerix {

// ============================================================================
// Path Resolution
// ============================================================================

// Expand "~", "~/rest" and "~user/rest" to the matching home directory.
// Input without shorthand, or with shorthand that cannot be resolved, is
// returned unchanged.
std::string expand_user(const std::string& raw_path);

// Expand home shorthand and resolve to an absolute canonical path without
// requiring the path to exist: symlinks in the existing prefix are followed,
// the remainder is normalized lexically. Trailing separators are dropped and
// an empty path resolves to the working directory.
// Fails with InvalidInputKind for a path containing NUL.
Result<std::string> resolve_path(const std::string& raw_path);

// ============================================================================
// Path Validation
// ============================================================================

// Resolve raw_path and check it against every requested constraint.
// Checks run in this order and the first failure is reported:
//   must_exist    -> NotFound
//   expected_kind -> WrongKind
//   allow_hidden  -> HiddenRejected (dot-prefixed final segment)
//   readable      -> NotReadable
//   writable      -> NotWritable
Result<std::string> validate_path(const std::string& raw_path,
                                  const ValidationConstraints& constraints = {});

// True if the final segment of the path starts with '.'
bool has_hidden_name(const std::string& path);

// ============================================================================
// Attribute Queries
// ============================================================================

// Hidden according to the running platform's convention.
// NotFound if the path does not exist.
Result<bool> is_hidden(const std::string& raw_path);

// Read-only according to the running platform's convention.
// NotFound if the path does not exist.
Result<bool> is_readonly(const std::string& raw_path);

} // namespace filerix
