#include "filerix/encoding.hpp"

#include <cctype>
#include <cstdint>
#include <vector>

namespace filerix {

namespace {

// Lowercase and drop '-' / '_' so "UTF-8", "utf_8" and "utf8" compare equal
std::string canonical_name(const std::string& s) {
    std::string out;
    for (unsigned char c : s) {
        if (c == '-' || c == '_') continue;
        out += static_cast<char>(std::tolower(c));
    }
    return out;
}

// Decode UTF-8 into code points; false on malformed input
bool decode_utf8(const std::string& bytes, std::vector<uint32_t>& out) {
    size_t i = 0;
    while (i < bytes.size()) {
        auto b0 = static_cast<uint8_t>(bytes[i]);
        uint32_t cp = 0;
        size_t len = 0;
        uint32_t min = 0;

        if (b0 < 0x80) {
            out.push_back(b0);
            ++i;
            continue;
        } else if ((b0 & 0xE0) == 0xC0) {
            cp = b0 & 0x1F;
            len = 2;
            min = 0x80;
        } else if ((b0 & 0xF0) == 0xE0) {
            cp = b0 & 0x0F;
            len = 3;
            min = 0x800;
        } else if ((b0 & 0xF8) == 0xF0) {
            cp = b0 & 0x07;
            len = 4;
            min = 0x10000;
        } else {
            return false;
        }

        if (i + len > bytes.size()) {
            return false;
        }
        for (size_t k = 1; k < len; ++k) {
            auto b = static_cast<uint8_t>(bytes[i + k]);
            if ((b & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (b & 0x3F);
        }

        if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        out.push_back(cp);
        i += len;
    }
    return true;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

} // namespace

std::optional<Encoding> parse_encoding(const std::string& name) {
    std::string n = canonical_name(name);
    if (n == "utf8") return Encoding::Utf8;
    if (n == "ascii" || n == "usascii") return Encoding::Ascii;
    if (n == "latin1" || n == "iso88591" || n == "l1") return Encoding::Latin1;
    return std::nullopt;
}

bool is_valid_utf8(const std::string& bytes) {
    std::vector<uint32_t> cps;
    cps.reserve(bytes.size());
    return decode_utf8(bytes, cps);
}

std::optional<std::string> decode_text(const std::string& raw, Encoding encoding) {
    switch (encoding) {
        case Encoding::Utf8:
            if (!is_valid_utf8(raw)) return std::nullopt;
            return raw;
        case Encoding::Ascii:
            for (unsigned char c : raw) {
                if (c > 0x7F) return std::nullopt;
            }
            return raw;
        case Encoding::Latin1: {
            std::string out;
            out.reserve(raw.size());
            for (unsigned char c : raw) {
                append_utf8(out, c);
            }
            return out;
        }
    }
    return std::nullopt;
}

std::optional<std::string> encode_text(const std::string& utf8, Encoding encoding) {
    if (encoding == Encoding::Utf8) {
        if (!is_valid_utf8(utf8)) return std::nullopt;
        return utf8;
    }

    std::vector<uint32_t> cps;
    if (!decode_utf8(utf8, cps)) {
        return std::nullopt;
    }

    uint32_t limit = encoding == Encoding::Ascii ? 0x7F : 0xFF;
    std::string out;
    out.reserve(cps.size());
    for (uint32_t cp : cps) {
        if (cp > limit) return std::nullopt;
        out += static_cast<char>(cp);
    }
    return out;
}

} // namespace filerix
