#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/llm_client.hpp"
#include "core/pipeline.hpp"
#include "core/pipeline_builder.hpp"
#include "core/utils.hpp"
#include "dialogue/dialogue_assembler.hpp"
#include "recognizer/entity_model.hpp"
#include "recognizer/entity_recognizer.hpp"
#include "recognizer/pattern_recognizer.hpp"
#include "recognizer/pattern_rules.hpp"
#include "recognizer/recognizer_registry.hpp"
#include "server/http_server.hpp"
#include "server/shutdown_coordinator.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>

using namespace promptguard;

// Global instances for signal handling
std::shared_ptr<HttpServer> g_server;
std::shared_ptr<ShutdownCoordinator> g_shutdown;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));

    // Stop admitting, drain, then cancel whatever is still running
    if (g_shutdown) {
        g_shutdown->initiate_shutdown();
        if (g_shutdown->drain_or_cancel()) {
            utils::log::info("All in-flight requests finished");
        } else {
            utils::log::warn(std::format("Shutdown: {} requests still in flight",
                g_shutdown->in_flight_count()));
        }
    }

    if (g_server) {
        g_server->stop();
    }
    std::exit(0);
}

namespace {

ConfigLoader::LoadResult load_config(const std::string& config_file) {
    if (!std::filesystem::exists(config_file)) {
        utils::log::warn(std::format("Config file {} not found - using defaults", config_file));
        return ConfigLoader::defaults();
    }
    return ConfigLoader::load_from_file(config_file);
}

std::shared_ptr<const RecognizerRegistry> build_registry(const PromptGuardConfig& cfg) {
    const auto table = apply_overrides(default_rule_table(), cfg.patterns);
    auto recognizers = PatternRecognizer::from_table(table);
    utils::log::info(std::format("Pattern rules: version {}, {} rules, {} recognizers",
        table.version, table.rules.size(), recognizers.size()));

    if (cfg.nlp.enabled) {
        auto model = std::make_shared<const LexiconEntityModel>(
            LexiconEntityModel::load_from_file(cfg.nlp.model_path, cfg.nlp.language));
        recognizers.push_back(std::make_unique<EntityRecognizer>(std::move(model)));
    } else {
        utils::log::info("Entity recognizer: disabled");
    }

    RegistryOptions options;
    options.parallel = cfg.analyzer.parallel;
    options.parallel_min_chars = cfg.analyzer.parallel_min_chars;

    return std::make_shared<const RecognizerRegistry>(
        std::move(recognizers), cfg.nlp.supported_languages, options);
}

std::shared_ptr<const DialogueAssembler> build_dialogue(const LlmClient::Config& llm) {
    std::shared_ptr<ILlmProvider> provider;
    if (!llm.api_key.empty()) {
        provider = std::make_shared<LlmClient>(llm);
        utils::log::info(std::format("LLM provider: {} ({}, model {})",
            llm.provider, llm.endpoint, llm.model));
    } else {
        utils::log::warn("No LLM API key configured - running in simulation mode");
    }
    return std::make_shared<const DialogueAssembler>(
        std::move(provider), std::chrono::milliseconds(llm.timeout_ms));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("PromptGuard starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "config/promptguard.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/4] Loading configuration from {}", config_file));
        auto config_result = load_config(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const auto& cfg = config_result.config;

        if (const auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }

        utils::log::info("[2/4] Building recognizers");
        auto registry = build_registry(cfg);

        utils::log::info("[3/4] Building pipeline");
        const auto style = ConfigLoader::parse_placeholder_style(cfg.analyzer.placeholder_style);
        auto pipeline = PipelineBuilder()
            .with_registry(registry)
            .with_dialogue(build_dialogue(cfg.llm))
            .with_default_language(cfg.nlp.language)
            .with_placeholder_style(style.value_or(PlaceholderStyle::PER_CATEGORY))
            .build();

        ShutdownCoordinator::Config shutdown_cfg;
        shutdown_cfg.shutdown_timeout = std::chrono::milliseconds(cfg.server.shutdown_timeout_ms);
        g_shutdown = std::make_shared<ShutdownCoordinator>(shutdown_cfg);

        utils::log::info("[4/4] Starting HTTP server");
        g_server = std::make_shared<HttpServer>(pipeline, cfg.server, cfg.routes, g_shutdown);

        utils::log::info(std::format("Server ready on http://{}:{} ({})",
            cfg.server.host, cfg.server.port, pipeline->mode()));

        // Blocks until stopped
        g_server->start();

    } catch (const ConfigurationError& e) {
        utils::log::error(std::format("Configuration error: {}", e.what()));
        return 1;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
