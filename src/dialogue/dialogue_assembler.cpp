#include "dialogue/dialogue_assembler.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <future>

namespace promptguard {

DialogueAssembler::DialogueAssembler(std::shared_ptr<ILlmProvider> provider,
                                     std::chrono::milliseconds timeout)
    : provider_(std::move(provider)), timeout_(timeout) {}

const std::string& DialogueAssembler::system_instruction() {
    static const std::string instruction =
        "Eres un asistente legal útil. El usuario te enviará textos con datos "
        "sensibles ocultos (ej: <NATIONAL_ID>, <MONEY_AMOUNT>). Redacta o responde "
        "manteniendo esos placeholders en su lugar para que luego puedan ser rellenados.";
    return instruction;
}

std::string DialogueAssembler::simulate(std::string_view sanitized_prompt) {
    return std::format("{} Prompt seguro: {}", kSimulationMarker, sanitized_prompt);
}

bool DialogueAssembler::simulation_mode() const {
    return !provider_ || !provider_->is_configured();
}

DialogueReply DialogueAssembler::respond(const std::string& sanitized_prompt,
                                         std::stop_token stop) const {
    if (simulation_mode()) {
        return {simulate(sanitized_prompt), true};
    }
    if (stop.stop_requested()) {
        throw RequestCancelled("dialogue cancelled before provider call");
    }

    // Own stop source: fired by the caller's token or by our timeout
    std::stop_source call_stop;
    std::stop_callback link(stop, [&call_stop] { call_stop.request_stop(); });

    auto reply = std::async(std::launch::async,
        [provider = provider_, &sanitized_prompt, token = call_stop.get_token()] {
            return provider->send(system_instruction(), sanitized_prompt, token);
        });

    if (reply.wait_for(timeout_) == std::future_status::timeout) {
        call_stop.request_stop();
        reply.wait();
        utils::log::warn(std::format("LLM provider {} timed out after {}ms",
            provider_->provider_name(), timeout_.count()));
        throw ProviderError("provider call timed out");
    }

    return {reply.get(), false};
}

} // namespace promptguard
