#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace promptguard {

class SafetyReportBuilder {
public:
    /// Distinct entity types of the accepted set, sorted ascending
    [[nodiscard]] static std::vector<std::string> detected_items(const AcceptedSet& accepted);

    [[nodiscard]] static SafetyReport build(const AcceptedSet& accepted,
                                            std::string sanitized_prompt);
};

} // namespace promptguard
