#include "anonymizer/merge_engine.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <format>

namespace promptguard {

bool MergeEngine::precedes(const Match& a, const Match& b) {
    if (a.start != b.start) return a.start < b.start;
    if (a.score != b.score) return a.score > b.score;
    if (a.length() != b.length()) return a.length() > b.length();
    return a.source_order < b.source_order;
}

AcceptedSet MergeEngine::merge(std::vector<Match> matches) {
    // stable: equal keys keep registry output order
    std::stable_sort(matches.begin(), matches.end(), &MergeEngine::precedes);

    std::vector<Match> accepted;
    accepted.reserve(matches.size());

    bool any = false;
    size_t cursor = 0;
    for (auto& m : matches) {
        if (any && m.start < cursor) {
            continue;
        }
        cursor = m.end;
        any = true;
        accepted.push_back(std::move(m));
    }

    return AcceptedSet(std::move(accepted));
}

void MergeEngine::verify(const AcceptedSet& accepted) {
    for (size_t i = 0; i < accepted.size(); ++i) {
        const auto& m = accepted[i];
        if (!m.is_valid()) {
            throw MergeInvariantViolation(std::format(
                "accepted match #{} is malformed ({}..{})", i, m.start, m.end));
        }
        if (i > 0 && accepted[i - 1].end > m.start) {
            throw MergeInvariantViolation(std::format(
                "accepted matches #{} and #{} overlap or are out of order", i - 1, i));
        }
    }
}

} // namespace promptguard
