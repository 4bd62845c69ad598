#pragma once

#include "core/pipeline_builder.hpp"
#include "core/pipeline_stage.hpp"
#include "core/request_context.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string_view>
#include <vector>

namespace promptguard {

/**
 * @brief Pipeline coordinator - orchestrates the per-request flow
 *
 * Stages:
 * 1. Detect    (decode, registry fan-out)
 * 2. Resolve   (merge + verify)
 * 3. Anonymize (placeholder rewrite)
 * 4. Report    (distinct categories)
 * 5. Dialogue  (provider call or simulation)
 *
 * Shared read-only by all request threads; per-request state lives in
 * RequestContext.
 */
class Pipeline {
public:
    static constexpr std::string_view kModeConnected = "OpenAI Connected";
    static constexpr std::string_view kModeSimulation = "Simulation Mode";

    explicit Pipeline(PipelineComponents components);

    /**
     * @brief Run one prompt through every stage
     * @throws ConfigurationError for an unsupported language
     * @throws ProviderError if the configured provider fails
     * @throws RequestCancelled if `stop` fires
     * @throws MergeInvariantViolation on an internal merge defect
     */
    [[nodiscard]] ChatResponse execute(const ChatRequest& request, std::stop_token stop = {});

    [[nodiscard]] std::string_view mode() const;

    [[nodiscard]] const PipelineComponents& components() const { return c_; }

    struct Stats {
        uint64_t total_requests;
        uint64_t requests_with_pii;
        uint64_t requests_failed;
        uint64_t requests_cancelled;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .total_requests = total_requests_.load(std::memory_order_relaxed),
            .requests_with_pii = requests_with_pii_.load(std::memory_order_relaxed),
            .requests_failed = requests_failed_.load(std::memory_order_relaxed),
            .requests_cancelled = requests_cancelled_.load(std::memory_order_relaxed),
        };
    }

private:
    void build_stage_chain();

    void run_stages(RequestContext& ctx);

    PipelineComponents c_;

    std::vector<std::unique_ptr<IPipelineStage>> stages_;

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> requests_with_pii_{0};
    std::atomic<uint64_t> requests_failed_{0};
    std::atomic<uint64_t> requests_cancelled_{0};
};

} // namespace promptguard
