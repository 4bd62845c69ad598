#include "core/pipeline_stages.hpp"
#include "anonymizer/anonymizer.hpp"
#include "anonymizer/merge_engine.hpp"
#include "anonymizer/safety_report.hpp"
#include "core/utils.hpp"
#include "dialogue/dialogue_assembler.hpp"
#include "recognizer/recognizer_registry.hpp"

#include <format>

namespace promptguard {

// ============================================================================
// DetectStage
// ============================================================================
void DetectStage::process(RequestContext& ctx) {
    ctx.decoded = utf8::decode(ctx.prompt);
    ctx.analysis = c_.registry->analyze(ctx.decoded, ctx.language, ctx.stop);

    if (!ctx.analysis.failed_recognizers.empty()) {
        std::string names;
        for (const auto& n : ctx.analysis.failed_recognizers) {
            if (!names.empty()) names += ", ";
            names += n;
        }
        utils::log::warn(std::format("request {}: recognizer(s) failed: {}",
            ctx.request_id, names));
    }
}

// ============================================================================
// ResolveStage
// ============================================================================
void ResolveStage::process(RequestContext& ctx) {
    const size_t raw = ctx.analysis.matches.size();
    ctx.accepted = MergeEngine::merge(std::move(ctx.analysis.matches));
    ctx.analysis.matches.clear();
    MergeEngine::verify(ctx.accepted);

    utils::log::debug(std::format("request {}: {} candidate(s), {} accepted",
        ctx.request_id, raw, ctx.accepted.size()));
}

// ============================================================================
// AnonymizeStage
// ============================================================================
void AnonymizeStage::process(RequestContext& ctx) {
    ctx.sanitized_prompt = Anonymizer::anonymize(
        ctx.prompt, ctx.decoded, ctx.accepted, c_.placeholder_style);
}

// ============================================================================
// ReportStage
// ============================================================================
void ReportStage::process(RequestContext& ctx) {
    ctx.report = SafetyReportBuilder::build(ctx.accepted, ctx.sanitized_prompt);
}

// ============================================================================
// DialogueStage
// ============================================================================
void DialogueStage::process(RequestContext& ctx) {
    ctx.reply = c_.dialogue->respond(ctx.sanitized_prompt, ctx.stop);
}

} // namespace promptguard
