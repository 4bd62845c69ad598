#pragma once

#include "core/llm_client.hpp"

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

namespace promptguard {

struct DialogueReply {
    std::string text;
    bool simulated = false;
};

/**
 * @brief Wraps sanitized text for the LLM and relays its answer unchanged
 *
 * With no configured provider the reply is the simulation echo
 * "[SIMULACIÓN] Prompt seguro: <sanitized>". That is a valid outcome, not
 * an error.
 */
class DialogueAssembler {
public:
    static constexpr std::string_view kSimulationMarker = "[SIMULACIÓN]";

    DialogueAssembler(std::shared_ptr<ILlmProvider> provider,
                      std::chrono::milliseconds timeout);

    /**
     * @throws ProviderError on provider failure or timeout
     * @throws RequestCancelled if `stop` fires during the call
     */
    [[nodiscard]] DialogueReply respond(const std::string& sanitized_prompt,
                                        std::stop_token stop) const;

    /// True when replies come from the simulation branch
    [[nodiscard]] bool simulation_mode() const;

    [[nodiscard]] static const std::string& system_instruction();

    [[nodiscard]] static std::string simulate(std::string_view sanitized_prompt);

private:
    std::shared_ptr<ILlmProvider> provider_;
    std::chrono::milliseconds timeout_;
};

} // namespace promptguard
