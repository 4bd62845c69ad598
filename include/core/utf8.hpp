#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace promptguard::utf8 {

/**
 * @brief Prompt text decoded to code points, with a map back to UTF-8 bytes
 *
 * Match offsets are code point indexes into `text`. `byte_offsets[i]` is the
 * byte position of code point i in the original UTF-8 string and
 * `byte_offsets[text.size()]` is the original byte length, so any
 * [start, end) code point span maps to exactly one byte slice.
 *
 * Invalid bytes decode to U+DC00 + byte (surrogate escape), one code point
 * per byte, which keeps the byte map total for malformed input.
 */
struct DecodedText {
    std::wstring text;
    std::vector<size_t> byte_offsets;

    [[nodiscard]] size_t length() const { return text.size(); }

    /// Byte range [first, second) of code point span [start, end)
    [[nodiscard]] std::pair<size_t, size_t> byte_range(size_t start, size_t end) const {
        return {byte_offsets.at(start), byte_offsets.at(end)};
    }
};

static_assert(sizeof(wchar_t) >= 4, "code point offsets need a 32-bit wchar_t");

[[nodiscard]] DecodedText decode(std::string_view input);

/// Inverse of decode(): escaped code points turn back into their raw bytes.
[[nodiscard]] std::string encode(std::wstring_view text);

/// Decode for rule and model strings where the byte map is not needed.
[[nodiscard]] std::wstring widen(std::string_view input);

} // namespace promptguard::utf8
