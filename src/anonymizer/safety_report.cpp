#include "anonymizer/safety_report.hpp"

#include <set>

namespace promptguard {

std::vector<std::string> SafetyReportBuilder::detected_items(const AcceptedSet& accepted) {
    std::set<std::string> distinct;
    for (const auto& m : accepted) {
        distinct.insert(m.entity_type);
    }
    return {distinct.begin(), distinct.end()};
}

SafetyReport SafetyReportBuilder::build(const AcceptedSet& accepted,
                                        std::string sanitized_prompt) {
    return SafetyReport{detected_items(accepted), std::move(sanitized_prompt)};
}

} // namespace promptguard
