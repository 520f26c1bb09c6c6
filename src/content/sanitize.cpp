#include "filerix/sanitize.hpp"
#include "filerix/encoding.hpp"

#include <string>

namespace filerix {

namespace {

Result<std::string> content_error(ErrorKind kind, const std::string& reason,
                                  const std::string& cause = "") {
    return Result<std::string>::failure(make_error(kind, CONTENT_PLACEHOLDER, reason, cause));
}

// Nested discarded or binary values have no JSON text form
bool has_unserializable_member(const ContentValue& value) {
    if (value.is_discarded() || value.is_binary()) {
        return true;
    }
    if (value.is_structured()) {
        for (const auto& item : value) {
            if (has_unserializable_member(item)) {
                return true;
            }
        }
    }
    return false;
}

bool is_kept_char(char c) {
    return (c >= 0x20 && c <= 0x7E) || c == '\t' || c == '\n';
}

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\n';
}

std::string normalize_newlines(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            out += text[i];
        }
    }
    return out;
}

std::string strip_disallowed(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (is_kept_char(c)) {
            out += c;
        }
    }
    return out;
}

std::string compact_whitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\n') {
            if (!out.empty() && out.back() == '\n') continue;
            out += c;
        } else if (c == ' ' || c == '\t') {
            if (!out.empty() && out.back() == ' ') continue;
            out += ' ';
        } else {
            out += c;
        }
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && is_blank(s[start])) ++start;
    size_t end = s.size();
    while (end > start && is_blank(s[end - 1])) --end;
    return s.substr(start, end - start);
}

Result<std::string> to_text(const ContentValue& value, bool compact) {
    if (value.is_object() || value.is_array()) {
        if (has_unserializable_member(value)) {
            return content_error(ErrorKind::UnsupportedType,
                                 "structure holds a value with no JSON form");
        }
        try {
            return Result<std::string>::success(
                value.dump(compact ? -1 : 2, ' ', false, ContentValue::error_handler_t::strict));
        } catch (const ContentValue::exception& e) {
            return content_error(ErrorKind::UnsupportedType,
                                 "failed to serialize structure", e.what());
        }
    }

    if (value.is_string()) {
        return Result<std::string>::success(value.get<std::string>());
    }
    if (value.is_boolean()) {
        return Result<std::string>::success(value.get<bool>() ? "true" : "false");
    }
    if (value.is_null()) {
        return Result<std::string>::success("null");
    }
    if (value.is_number()) {
        return Result<std::string>::success(value.dump());
    }

    if (value.is_binary()) {
        const auto& bin = value.get_binary();
        std::string raw(bin.begin(), bin.end());
        if (!is_valid_utf8(raw)) {
            return content_error(ErrorKind::InvalidEncoding, "bytes are not valid UTF-8");
        }
        return Result<std::string>::success(std::move(raw));
    }

    return content_error(ErrorKind::UnsupportedType, "content type has no text form");
}

} // namespace

ContentValue opaque_content() {
    return ContentValue(ContentValue::value_t::discarded);
}

ContentValue bytes_content(const Bytes& bytes) {
    return ContentValue::binary(bytes);
}

ContentValue bytes_content(const std::string& bytes) {
    return ContentValue::binary(Bytes(bytes.begin(), bytes.end()));
}

std::string clean_text(const std::string& text, bool compact) {
    std::string out = normalize_newlines(strip_disallowed(text));
    if (compact) {
        out = trim(compact_whitespace(out));
    }
    return out;
}

Result<std::string> sanitize_content(const ContentValue& value,
                                     const SanitizationPolicy& policy) {
    auto text = to_text(value, policy.compact);
    if (!text.ok) {
        return text;
    }

    std::string cleaned = clean_text(text.value, policy.compact);
    if (trim(cleaned).empty()) {
        return content_error(ErrorKind::EmptyContent, "content is empty after sanitization");
    }
    return Result<std::string>::success(std::move(cleaned));
}

} // namespace filerix
