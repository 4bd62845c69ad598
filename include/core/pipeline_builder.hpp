#pragma once

#include "core/types.hpp"

#include <memory>
#include <string>

namespace promptguard {

// Forward declarations
class RecognizerRegistry;
class DialogueAssembler;
class Pipeline;

/**
 * @brief All components that Pipeline needs, grouped in a single struct.
 */
struct PipelineComponents {
    // Required
    std::shared_ptr<const RecognizerRegistry> registry;
    std::shared_ptr<const DialogueAssembler> dialogue;

    // Settings
    std::string default_language = "es";
    PlaceholderStyle placeholder_style = PlaceholderStyle::PER_CATEGORY;
};

/**
 * @brief Builder pattern for Pipeline construction.
 *
 * Usage:
 *   auto pipeline = PipelineBuilder()
 *       .with_registry(registry)
 *       .with_dialogue(dialogue)
 *       .with_placeholder_style(PlaceholderStyle::NUMBERED)  // optional
 *       .build();
 */
class PipelineBuilder {
public:
    PipelineBuilder& with_registry(std::shared_ptr<const RecognizerRegistry> p) { c_.registry = std::move(p); return *this; }
    PipelineBuilder& with_dialogue(std::shared_ptr<const DialogueAssembler> p)  { c_.dialogue = std::move(p); return *this; }
    PipelineBuilder& with_default_language(std::string lang)                     { c_.default_language = std::move(lang); return *this; }
    PipelineBuilder& with_placeholder_style(PlaceholderStyle style)              { c_.placeholder_style = style; return *this; }

    /**
     * @brief Build the Pipeline from accumulated components.
     * @throws ConfigurationError if required components are missing or the
     *         default language is not served by the registry.
     */
    [[nodiscard]] std::shared_ptr<Pipeline> build();

private:
    PipelineComponents c_;
};

} // namespace promptguard
