#pragma once

#include "core/llm_client.hpp"
#include "recognizer/pattern_rules.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace promptguard {

// ============================================================================
// Configuration Types
// ============================================================================

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    size_t thread_pool_size = 4;
    size_t max_prompt_bytes = 32768;
    uint32_t read_timeout_ms = 10000;
    uint32_t shutdown_timeout_ms = 30000;    // drain budget before cancelling
    std::string cors_allow_origin = "*";
};

struct LoggingConfig {
    std::string level = "info";
};

struct NlpConfig {
    bool enabled = true;                                  // statistical recognizer on/off
    std::string language = "es";                          // default request language
    std::vector<std::string> supported_languages{"es"};
    std::string model_path = "models/es_entities.tsv";
};

struct AnalyzerConfig {
    bool parallel = false;
    size_t parallel_min_chars = 256;
    std::string placeholder_style = "category";           // "category" | "numbered"
};

// ============================================================================
// Route Configuration (config-driven URL patterns)
// ============================================================================

struct RouteConfig {
    std::string health      = "/health";
    std::string root_health = "/";          // health alias; empty disables it
    std::string chat        = "/chat/secure";
};

// ============================================================================
// PromptGuardConfig - Complete parsed configuration
// ============================================================================

struct PromptGuardConfig {
    ServerConfig server;
    LoggingConfig logging;
    NlpConfig nlp;
    AnalyzerConfig analyzer;
    std::vector<PatternRule> patterns;      // [[patterns]]: overrides + additions
    LlmClient::Config llm;
    RouteConfig routes;
};

} // namespace promptguard
