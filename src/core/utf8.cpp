#include "core/utf8.hpp"

#include <cstdint>

namespace promptguard::utf8 {

namespace {

constexpr char32_t kEscapeBase = 0xDC00;
constexpr char32_t kEscapeFirst = 0xDC80;
constexpr char32_t kEscapeLast = 0xDCFF;

/**
 * @brief Decode one code point starting at `pos`
 * @return Number of bytes consumed; 0 if the sequence is invalid
 */
size_t decode_one(std::string_view in, size_t pos, char32_t& out) {
    const auto b0 = static_cast<uint8_t>(in[pos]);
    if (b0 < 0x80) {
        out = b0;
        return 1;
    }

    size_t len = 0;
    char32_t cp = 0;
    char32_t min_cp = 0;
    if ((b0 & 0xE0) == 0xC0) {
        len = 2; cp = b0 & 0x1F; min_cp = 0x80;
    } else if ((b0 & 0xF0) == 0xE0) {
        len = 3; cp = b0 & 0x0F; min_cp = 0x800;
    } else if ((b0 & 0xF8) == 0xF0) {
        len = 4; cp = b0 & 0x07; min_cp = 0x10000;
    } else {
        return 0;
    }

    if (pos + len > in.size()) return 0;

    for (size_t i = 1; i < len; ++i) {
        const auto b = static_cast<uint8_t>(in[pos + i]);
        if ((b & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (b & 0x3F);
    }

    // Overlong forms, surrogates and out-of-range values are invalid
    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return 0;
    }

    out = cp;
    return len;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp >= kEscapeFirst && cp <= kEscapeLast) {
        out += static_cast<char>(cp - kEscapeBase);
    } else if (cp < 0x80) {
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

} // anonymous namespace

DecodedText decode(std::string_view input) {
    DecodedText result;
    result.text.reserve(input.size());
    result.byte_offsets.reserve(input.size() + 1);

    size_t pos = 0;
    while (pos < input.size()) {
        char32_t cp = 0;
        size_t consumed = decode_one(input, pos, cp);
        if (consumed == 0) {
            cp = kEscapeBase + static_cast<uint8_t>(input[pos]);
            consumed = 1;
        }
        result.byte_offsets.push_back(pos);
        result.text.push_back(static_cast<wchar_t>(cp));
        pos += consumed;
    }
    result.byte_offsets.push_back(input.size());
    return result;
}

std::string encode(std::wstring_view text) {
    std::string out;
    out.reserve(text.size());
    for (const wchar_t wc : text) {
        append_utf8(out, static_cast<char32_t>(wc));
    }
    return out;
}

std::wstring widen(std::string_view input) {
    return decode(input).text;
}

} // namespace promptguard::utf8
