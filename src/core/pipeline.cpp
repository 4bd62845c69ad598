#include "core/pipeline.hpp"
#include "core/error.hpp"
#include "core/pipeline_stages.hpp"
#include "core/utils.hpp"
#include "dialogue/dialogue_assembler.hpp"

#include <format>

namespace promptguard {

Pipeline::Pipeline(PipelineComponents components)
    : c_(std::move(components)) {
    build_stage_chain();
}

void Pipeline::build_stage_chain() {
    stages_.push_back(std::make_unique<DetectStage>(c_));
    stages_.push_back(std::make_unique<ResolveStage>(c_));
    stages_.push_back(std::make_unique<AnonymizeStage>(c_));
    stages_.push_back(std::make_unique<ReportStage>(c_));
    stages_.push_back(std::make_unique<DialogueStage>(c_));
}

std::string_view Pipeline::mode() const {
    return c_.dialogue->simulation_mode() ? kModeSimulation : kModeConnected;
}

void Pipeline::run_stages(RequestContext& ctx) {
    for (const auto& stage : stages_) {
        if (ctx.stop.stop_requested()) {
            throw RequestCancelled(std::format("request cancelled before {}", stage->name()));
        }
        utils::Timer timer;
        stage->process(ctx);
        ctx.stage_times.emplace_back(stage->name(), timer.elapsed_us());
    }
}

ChatResponse Pipeline::execute(const ChatRequest& request, std::stop_token stop) {
    RequestContext ctx;
    if (!request.request_id.empty()) {
        ctx.request_id = request.request_id;
    }
    ctx.user_id = request.user_id;
    ctx.language = request.language.empty() ? c_.default_language : request.language;
    ctx.prompt = request.prompt;
    ctx.stop = std::move(stop);

    total_requests_.fetch_add(1, std::memory_order_relaxed);

    try {
        run_stages(ctx);
    } catch (const RequestCancelled&) {
        requests_cancelled_.fetch_add(1, std::memory_order_relaxed);
        utils::log::info(std::format("request {} cancelled", ctx.request_id));
        throw;
    } catch (const PromptGuardError& e) {
        requests_failed_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("request {} failed: {}",
            ctx.request_id, error_category_to_string(e.category())));
        throw;
    } catch (const std::exception&) {
        requests_failed_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("request {} failed: internal_error", ctx.request_id));
        throw;
    }

    if (!ctx.accepted.empty()) {
        requests_with_pii_.fetch_add(1, std::memory_order_relaxed);
    }

    ChatResponse response;
    response.ai_response = std::move(ctx.reply.text);
    response.safety_report = std::move(ctx.report);
    response.simulated = ctx.reply.simulated;
    response.total_time = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - ctx.started_at);

    std::string timings;
    for (const auto& [name, time] : ctx.stage_times) {
        timings += std::format(" {}={}us", name, time.count());
    }
    utils::log::info(std::format("request {} user={} lang={} spans={} categories=[{}]{}{}",
        ctx.request_id, ctx.user_id, ctx.language, ctx.accepted.size(),
        [&] {
            std::string joined;
            for (const auto& item : response.safety_report.detected_items) {
                if (!joined.empty()) joined += ",";
                joined += item;
            }
            return joined;
        }(),
        response.simulated ? " simulated" : "", timings));

    return response;
}

} // namespace promptguard
