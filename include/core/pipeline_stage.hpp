#pragma once

#include "core/request_context.hpp"
#include <string_view>

namespace promptguard {

/**
 * @brief Abstract pipeline stage interface
 *
 * Stages run in a fixed chain over one RequestContext. A stage reports
 * failure by throwing from the core/error.hpp taxonomy; the pipeline
 * checks the request stop token before every stage.
 */
class IPipelineStage {
public:
    virtual ~IPipelineStage() = default;

    /**
     * @brief Process request through this stage
     * @param ctx Mutable request context
     */
    virtual void process(RequestContext& ctx) = 0;

    /**
     * @brief Human-readable stage name for timing/logging
     */
    [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace promptguard
