#pragma once

#include "core/error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace promptguard {

// ============================================================================
// Entity Types
// ============================================================================

namespace entity {
    inline constexpr const char* kEmail = "EMAIL";
    inline constexpr const char* kPhone = "PHONE";
    inline constexpr const char* kBankAccount = "BANK_ACCOUNT";
    inline constexpr const char* kNationalId = "NATIONAL_ID";
    inline constexpr const char* kMoneyAmount = "MONEY_AMOUNT";
    inline constexpr const char* kPerson = "PERSON";
    inline constexpr const char* kLocation = "LOCATION";
    inline constexpr const char* kOrganization = "ORGANIZATION";
}

// ============================================================================
// Match
// ============================================================================

/**
 * @brief One candidate detection produced by a recognizer
 *
 * Offsets are code point indexes into the decoded prompt, end exclusive.
 * Invariant: start < end, 0 <= score <= 1.
 */
struct Match {
    std::string entity_type;
    size_t start = 0;
    size_t end = 0;
    double score = 0.0;
    std::string source;         // recognizer name
    size_t source_order = 0;    // recognizer registration index (merge tie-break)

    Match() = default;
    Match(std::string type, size_t s, size_t e, double sc,
          std::string src = {}, size_t order = 0)
        : entity_type(std::move(type)), start(s), end(e), score(sc),
          source(std::move(src)), source_order(order) {}

    [[nodiscard]] size_t length() const { return end - start; }

    [[nodiscard]] bool is_valid() const {
        return start < end && score >= 0.0 && score <= 1.0;
    }

    [[nodiscard]] bool overlaps(const Match& other) const {
        return start < other.end && other.start < end;
    }

    bool operator==(const Match&) const = default;
};

class MergeEngine;

/**
 * @brief Non-overlapping matches sorted by start
 *
 * Only MergeEngine fills an AcceptedSet; everyone else gets read access.
 */
class AcceptedSet {
public:
    using const_iterator = std::vector<Match>::const_iterator;

    AcceptedSet() = default;

    [[nodiscard]] const std::vector<Match>& matches() const { return matches_; }
    [[nodiscard]] size_t size() const { return matches_.size(); }
    [[nodiscard]] bool empty() const { return matches_.empty(); }
    [[nodiscard]] const Match& operator[](size_t i) const { return matches_[i]; }
    [[nodiscard]] const_iterator begin() const { return matches_.begin(); }
    [[nodiscard]] const_iterator end() const { return matches_.end(); }

    bool operator==(const AcceptedSet&) const = default;

private:
    friend class MergeEngine;
    friend struct AcceptedSetTestAccess;    // tests build malformed sets
    explicit AcceptedSet(std::vector<Match> matches) : matches_(std::move(matches)) {}

    std::vector<Match> matches_;
};

// ============================================================================
// Analysis / Report
// ============================================================================

/**
 * @brief Raw registry output for one prompt
 */
struct AnalysisResult {
    std::vector<Match> matches;
    std::vector<std::string> failed_recognizers;   // names only, never text
    std::vector<RecognitionError> errors;          // one per failed recognizer
};

enum class PlaceholderStyle : uint8_t {
    PER_CATEGORY,   // <EMAIL>
    NUMBERED        // <EMAIL_1>, <EMAIL_2>
};

[[nodiscard]] inline const char* placeholder_style_to_string(PlaceholderStyle s) {
    switch (s) {
        case PlaceholderStyle::PER_CATEGORY: return "category";
        case PlaceholderStyle::NUMBERED:     return "numbered";
        default:                             return "unknown";
    }
}

struct SafetyReport {
    std::vector<std::string> detected_items;   // distinct, sorted
    std::string sanitized_prompt;
};

// ============================================================================
// Request / Response
// ============================================================================

struct ChatRequest {
    std::string request_id;
    std::string prompt;
    std::string user_id = "guest";
    std::string language;       // empty = configured default
};

struct ChatResponse {
    std::string ai_response;
    SafetyReport safety_report;
    bool simulated = false;
    std::chrono::microseconds total_time{0};
};

} // namespace promptguard
