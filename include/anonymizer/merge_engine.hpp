#pragma once

#include "core/types.hpp"

#include <vector>

namespace promptguard {

/**
 * @brief Conflict resolver: raw candidate matches -> non-overlapping AcceptedSet
 *
 * Greedy interval selection:
 * 1. Sort by (start asc, score desc, length desc, source_order asc)
 * 2. Walk the sorted list with a cursor at the end of the last accepted span
 * 3. Accept a match iff it starts at or after the cursor
 *
 * Total, deterministic and idempotent: merging an AcceptedSet's own matches
 * returns the same set.
 */
class MergeEngine {
public:
    [[nodiscard]] static AcceptedSet merge(std::vector<Match> matches);

    /**
     * @brief Check that a set is sorted by start and pairwise non-overlapping
     * @throws MergeInvariantViolation
     */
    static void verify(const AcceptedSet& accepted);

    /// Sort key of step 1; exposed for tests.
    [[nodiscard]] static bool precedes(const Match& a, const Match& b);
};

} // namespace promptguard
