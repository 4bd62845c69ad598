#pragma once

#include "core/types.hpp"
#include "core/utf8.hpp"
#include "core/utils.hpp"
#include "dialogue/dialogue_assembler.hpp"

#include <chrono>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace promptguard {

/**
 * @brief Request context - carries state through the pipeline
 *
 * Created per request, dropped after the response is built. Nothing in it
 * outlives the request.
 */
struct RequestContext {
    // Input
    std::string request_id;
    std::string user_id;
    std::string language;
    std::string prompt;
    std::stop_token stop;

    // Timestamps
    std::chrono::system_clock::time_point received_at;
    std::chrono::steady_clock::time_point started_at;

    // Stage results
    utf8::DecodedText decoded;
    AnalysisResult analysis;
    AcceptedSet accepted;
    std::string sanitized_prompt;
    SafetyReport report;
    DialogueReply reply;

    // Timing breakdown, in stage order
    std::vector<std::pair<std::string_view, std::chrono::microseconds>> stage_times;

    RequestContext()
        : request_id(utils::generate_uuid()),
          received_at(std::chrono::system_clock::now()),
          started_at(std::chrono::steady_clock::now()) {}
};

} // namespace promptguard
