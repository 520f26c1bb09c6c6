#pragma once

#include <optional>
#include <string>

namespace filerix {

// ============================================================================
// Text Encodings
// ============================================================================

enum class Encoding {
    Utf8,
    Ascii,
    Latin1
};

inline const char* encoding_to_string(Encoding e) {
    switch (e) {
        case Encoding::Utf8: return "utf-8";
        case Encoding::Ascii: return "ascii";
        case Encoding::Latin1: return "latin-1";
        default: return "utf-8";
    }
}

// Parse an encoding name (case-insensitive; "utf8", "UTF-8", "us-ascii",
// "iso-8859-1", "latin_1" ...)
std::optional<Encoding> parse_encoding(const std::string& name);

// True if the bytes form well-formed UTF-8 (no overlong forms, surrogates or
// code points above U+10FFFF)
bool is_valid_utf8(const std::string& bytes);

// Decode raw bytes in the given encoding into UTF-8 text.
// Returns nullopt if the bytes are invalid for that encoding.
std::optional<std::string> decode_text(const std::string& raw, Encoding encoding);

// Encode UTF-8 text into the given encoding.
// Returns nullopt if the text holds characters the encoding cannot represent.
std::optional<std::string> encode_text(const std::string& utf8, Encoding encoding);

} // namespace filerix
