#pragma once

#include "filerix/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace filerix {

// Any value accepted as file content. Insertion order of object keys is kept
// so structured content is written back in the order it was built.
//
//   object, array          -> JSON text
//   string                 -> as is
//   number, boolean, null  -> canonical literal ("42", "1.5", "true", "null")
//   binary                 -> UTF-8 decoded bytes
//   discarded              -> unsupported
using ContentValue = nlohmann::ordered_json;

// A value of a type that cannot be converted to text
ContentValue opaque_content();

// Raw bytes to be decoded as UTF-8
ContentValue bytes_content(const Bytes& bytes);
ContentValue bytes_content(const std::string& bytes);

// ============================================================================
// Sanitization
// ============================================================================

// Convert a value to text and clean it for writing:
//   1. everything outside printable ASCII, tab and LF is removed
//      (CR included, so CRLF ends up as LF and a lone CR disappears)
//   2. CRLF and lone CR become LF
//   3. compact: blank-line runs and space/tab runs collapse, ends are trimmed
//
// Errors (path is CONTENT_PLACEHOLDER):
//   UnsupportedType  value (or a nested value) has no text form
//   InvalidEncoding  binary value is not valid UTF-8
//   EmptyContent     nothing but whitespace is left
Result<std::string> sanitize_content(const ContentValue& value,
                                     const SanitizationPolicy& policy = {});

// Steps 1-3 above on already converted text. Never fails.
std::string clean_text(const std::string& text, bool compact);

} // namespace filerix
