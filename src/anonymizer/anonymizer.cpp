#include "anonymizer/anonymizer.hpp"
#include "core/error.hpp"

#include <format>
#include <map>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace promptguard {

std::string Anonymizer::placeholder(std::string_view entity_type, size_t index) {
    if (index == 0) {
        return std::format("<{}>", entity_type);
    }
    return std::format("<{}_{}>", entity_type, index);
}

std::string Anonymizer::anonymize(
    std::string_view original,
    const utf8::DecodedText& decoded,
    const AcceptedSet& accepted,
    PlaceholderStyle style) {

    if (decoded.byte_offsets.empty() || decoded.byte_offsets.back() != original.size()) {
        throw std::invalid_argument("decoded text does not belong to this prompt");
    }

    // Numbered style state: per-category counter, (category, surface) -> number
    std::unordered_map<std::string, size_t> counters;
    std::map<std::pair<std::string, std::string_view>, size_t> numbers;

    std::string out;
    out.reserve(original.size());

    size_t cursor = 0;   // code point index
    for (const auto& m : accepted) {
        if (m.end > decoded.length() || m.start >= m.end) {
            throw std::out_of_range(std::format(
                "span {}..{} outside text of length {}", m.start, m.end, decoded.length()));
        }
        if (m.start < cursor) {
            throw MergeInvariantViolation("anonymizer received overlapping spans");
        }

        const auto [keep_from, keep_to] = decoded.byte_range(cursor, m.start);
        out.append(original.substr(keep_from, keep_to - keep_from));

        if (style == PlaceholderStyle::NUMBERED) {
            const auto [span_from, span_to] = decoded.byte_range(m.start, m.end);
            const auto key = std::make_pair(m.entity_type,
                                            original.substr(span_from, span_to - span_from));
            auto it = numbers.find(key);
            if (it == numbers.end()) {
                it = numbers.emplace(key, ++counters[m.entity_type]).first;
            }
            out += placeholder(m.entity_type, it->second);
        } else {
            out += placeholder(m.entity_type);
        }

        cursor = m.end;
    }

    const auto tail_from = decoded.byte_offsets.at(cursor);
    out.append(original.substr(tail_from));
    return out;
}

std::string Anonymizer::anonymize(
    std::string_view original,
    const AcceptedSet& accepted,
    PlaceholderStyle style) {
    return anonymize(original, utf8::decode(original), accepted, style);
}

} // namespace promptguard
