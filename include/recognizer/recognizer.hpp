#pragma once

#include "core/types.hpp"
#include "core/utf8.hpp"

#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace promptguard {

/**
 * @brief Abstract PII recognizer
 *
 * Implementations are immutable after construction and safe to call from
 * several request threads at once. detect() may throw; the registry isolates
 * the failure to this recognizer for the current request.
 */
class IRecognizer {
public:
    virtual ~IRecognizer() = default;

    /**
     * @brief Find candidate spans in a decoded prompt
     * @param text Decoded prompt; offsets are code point indexes into text.text
     * @param language Language code the request is served in
     * @param stop Request cancellation token, checked between units of work
     * @return Candidate matches (source/source_order are stamped by the registry)
     */
    [[nodiscard]] virtual std::vector<Match> detect(
        const utf8::DecodedText& text,
        std::string_view language,
        std::stop_token stop) const = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;

    [[nodiscard]] virtual std::string_view supported_language() const = 0;

    [[nodiscard]] virtual std::vector<std::string> supported_entities() const = 0;
};

} // namespace promptguard
