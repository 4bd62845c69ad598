#include "core/pipeline_builder.hpp"
#include "core/error.hpp"
#include "core/pipeline.hpp"
#include "recognizer/recognizer_registry.hpp"

#include <format>

namespace promptguard {

std::shared_ptr<Pipeline> PipelineBuilder::build() {
    if (!c_.registry) throw ConfigurationError("PipelineBuilder: registry is required");
    if (!c_.dialogue) throw ConfigurationError("PipelineBuilder: dialogue is required");
    if (!c_.registry->supports(c_.default_language)) {
        throw ConfigurationError(std::format(
            "PipelineBuilder: default language '{}' has no recognizer", c_.default_language));
    }

    return std::make_shared<Pipeline>(std::move(c_));
}

} // namespace promptguard
