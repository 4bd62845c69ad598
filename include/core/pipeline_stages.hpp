#pragma once

#include "core/pipeline_builder.hpp"
#include "core/pipeline_stage.hpp"

namespace promptguard {

/**
 * @brief Base class providing access to pipeline components
 */
class ComponentStage : public IPipelineStage {
public:
    explicit ComponentStage(const PipelineComponents& c) : c_(c) {}
protected:
    const PipelineComponents& c_;
};

/// Decode the prompt and fan it out to every recognizer for the language
class DetectStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    void process(RequestContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "detect"; }
};

/// Merge raw matches into the accepted set and verify it
class ResolveStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    void process(RequestContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "resolve"; }
};

class AnonymizeStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    void process(RequestContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "anonymize"; }
};

class ReportStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    void process(RequestContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "report"; }
};

/// Relay the sanitized prompt to the provider (or the simulation branch)
class DialogueStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    void process(RequestContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "dialogue"; }
};

} // namespace promptguard
