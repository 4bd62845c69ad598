#pragma once

#include "core/types.hpp"
#include "core/utf8.hpp"

#include <string>
#include <string_view>

namespace promptguard {

/**
 * @brief Rewrites a prompt by replacing accepted spans with placeholders
 *
 * Output is built front to back by copying the untouched byte slices of the
 * original between placeholders, so text outside accepted spans is
 * byte-identical and in its original order.
 *
 * Styles:
 * - PER_CATEGORY: every span becomes <ENTITY_TYPE>
 * - NUMBERED:     <ENTITY_TYPE_n>, n counted per category in order of first
 *                 appearance; the same surface text reuses its number
 */
class Anonymizer {
public:
    /**
     * @param original UTF-8 prompt exactly as received
     * @param decoded decode(original)
     * @throws std::out_of_range if a span ends past the text
     * @throws MergeInvariantViolation if spans overlap
     */
    [[nodiscard]] static std::string anonymize(
        std::string_view original,
        const utf8::DecodedText& decoded,
        const AcceptedSet& accepted,
        PlaceholderStyle style = PlaceholderStyle::PER_CATEGORY);

    [[nodiscard]] static std::string anonymize(
        std::string_view original,
        const AcceptedSet& accepted,
        PlaceholderStyle style = PlaceholderStyle::PER_CATEGORY);

    /// "<EMAIL>" for index 0, "<EMAIL_3>" for index 3
    [[nodiscard]] static std::string placeholder(std::string_view entity_type, size_t index = 0);
};

} // namespace promptguard
