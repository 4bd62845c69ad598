#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace promptguard {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

// llm.api_key keeps coming from the environment when no file is present
constexpr const char* kDefaultToml = R"(
[llm]
api_key = "${OPENAI_API_KEY}"
)";

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Helpers ---------------------------------------------------------------

std::optional<PlaceholderStyle> ConfigLoader::parse_placeholder_style(const std::string& name) {
    const std::string lower = utils::to_lower(name);
    if (lower == placeholder_style_to_string(PlaceholderStyle::PER_CATEGORY)) {
        return PlaceholderStyle::PER_CATEGORY;
    }
    if (lower == placeholder_style_to_string(PlaceholderStyle::NUMBERED)) {
        return PlaceholderStyle::NUMBERED;
    }
    return std::nullopt;
}

// ---- Section extractors ----------------------------------------------------

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);
    cfg.port = static_cast<int>(s["port"].value_or(int64_t{8080}));
    cfg.thread_pool_size = static_cast<size_t>(s["threads"].value_or(int64_t{4}));
    cfg.max_prompt_bytes = static_cast<size_t>(s["max_prompt_bytes"].value_or(int64_t{32768}));
    cfg.read_timeout_ms = static_cast<uint32_t>(s["read_timeout_ms"].value_or(int64_t{10000}));
    cfg.shutdown_timeout_ms = static_cast<uint32_t>(s["shutdown_timeout_ms"].value_or(int64_t{30000}));
    cfg.cors_allow_origin = s["cors_allow_origin"].value_or("*"s);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

NlpConfig ConfigLoader::extract_nlp(const toml::table& root) {
    NlpConfig cfg;
    const auto* nlp = root["nlp"].as_table();
    if (!nlp) return cfg;
    const auto& n = *nlp;

    cfg.enabled = n["enabled"].value_or(true);
    cfg.language = n["language"].value_or("es"s);
    cfg.model_path = n["model_path"].value_or(cfg.model_path);

    auto languages = toml_string_array(n, "supported_languages");
    if (!languages.empty()) {
        cfg.supported_languages = std::move(languages);
    } else {
        cfg.supported_languages = {cfg.language};
    }
    return cfg;
}

AnalyzerConfig ConfigLoader::extract_analyzer(const toml::table& root) {
    AnalyzerConfig cfg;
    const auto* analyzer = root["analyzer"].as_table();
    if (!analyzer) return cfg;
    const auto& a = *analyzer;

    cfg.parallel = a["parallel"].value_or(false);
    cfg.parallel_min_chars = static_cast<size_t>(a["parallel_min_chars"].value_or(int64_t{256}));
    cfg.placeholder_style = a["placeholder_style"].value_or("category"s);
    return cfg;
}

std::vector<PatternRule> ConfigLoader::extract_patterns(const toml::table& root) {
    std::vector<PatternRule> rules;
    const auto* arr = root["patterns"].as_array();
    if (!arr) return rules;

    rules.reserve(arr->size());
    for (const auto& elem : *arr) {
        const auto* tbl = elem.as_table();
        if (!tbl) continue;
        const auto& t = *tbl;

        PatternRule rule;
        rule.name = t["name"].value_or(""s);
        rule.entity_type = t["entity_type"].value_or(""s);
        rule.regex = t["regex"].value_or(""s);
        rule.score = t["score"].value_or(-1.0);     // missing score fails validation
        rule.case_insensitive = t["case_insensitive"].value_or(false);
        rules.push_back(std::move(rule));
    }
    return rules;
}

LlmClient::Config ConfigLoader::extract_llm(const toml::table& root) {
    LlmClient::Config cfg;
    const auto* llm = root["llm"].as_table();
    if (!llm) return cfg;
    const auto& l = *llm;

    cfg.provider = utils::to_lower(l["provider"].value_or("openai"s));
    const auto default_endpoint = (cfg.provider == "anthropic")
        ? "https://api.anthropic.com"s : cfg.endpoint;
    cfg.endpoint = l["endpoint"].value_or(default_endpoint);
    cfg.api_key = l["api_key"].value_or(""s);
    cfg.model = l["model"].value_or(cfg.model);
    cfg.temperature = l["temperature"].value_or(cfg.temperature);
    cfg.max_tokens = static_cast<int>(l["max_tokens"].value_or(int64_t{1024}));
    cfg.timeout_ms = static_cast<uint32_t>(l["timeout_ms"].value_or(int64_t{30000}));
    cfg.max_retries = static_cast<uint32_t>(l["max_retries"].value_or(int64_t{2}));
    cfg.retry_backoff_ms = static_cast<uint32_t>(l["retry_backoff_ms"].value_or(int64_t{500}));
    cfg.max_requests_per_minute = static_cast<uint32_t>(
        l["max_requests_per_minute"].value_or(int64_t{60}));
    return cfg;
}

RouteConfig ConfigLoader::extract_routes(const toml::table& root) {
    RouteConfig cfg;
    const auto* routes = root["routes"].as_table();
    if (!routes) return cfg;
    const auto& r = *routes;

    cfg.health = r["health"].value_or(cfg.health);
    cfg.root_health = r["root_health"].value_or(cfg.root_health);
    cfg.chat = r["chat"].value_or(cfg.chat);
    return cfg;
}

PromptGuardConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    PromptGuardConfig config;
    config.server = extract_server(root);
    config.logging = extract_logging(root);
    config.nlp = extract_nlp(root);
    config.analyzer = extract_analyzer(root);
    config.patterns = extract_patterns(root);
    config.llm = extract_llm(root);
    config.routes = extract_routes(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(PromptGuardConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::defaults() {
    return load_from_string(kDefaultToml);
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const PromptGuardConfig& config) {
    std::vector<std::string> errors;

    // ---- server ----
    if (!utils::in_range<1, 65535>(config.server.port)) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (!utils::in_range<1, 1024>(config.server.thread_pool_size)) {
        errors.push_back(std::format("server.threads must be 1-1024, got {}",
            config.server.thread_pool_size));
    }
    if (config.server.max_prompt_bytes == 0) {
        errors.push_back("server.max_prompt_bytes must be positive");
    }
    if (config.server.cors_allow_origin.empty()) {
        errors.push_back("server.cors_allow_origin must not be empty");
    }

    // ---- logging ----
    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is not one of debug, info, warn, error",
            config.logging.level));
    }

    // ---- nlp ----
    if (config.nlp.language.empty()) {
        errors.push_back("nlp.language must not be empty");
    } else {
        bool listed = false;
        for (const auto& lang : config.nlp.supported_languages) {
            listed = listed || lang == config.nlp.language;
        }
        if (!listed) {
            errors.push_back(std::format("nlp.language '{}' is not in nlp.supported_languages",
                config.nlp.language));
        }
    }
    {
        std::unordered_set<std::string> seen;
        for (const auto& lang : config.nlp.supported_languages) {
            if (lang.empty()) {
                errors.push_back("nlp.supported_languages contains an empty entry");
            } else if (!seen.insert(lang).second) {
                errors.push_back(std::format("nlp.supported_languages lists '{}' twice", lang));
            }
        }
    }
    if (config.nlp.enabled && config.nlp.model_path.empty()) {
        errors.push_back("nlp.model_path required when nlp.enabled is true");
    }

    // ---- analyzer ----
    if (!parse_placeholder_style(config.analyzer.placeholder_style)) {
        errors.push_back(std::format(
            "analyzer.placeholder_style '{}' must be 'category' or 'numbered'",
            config.analyzer.placeholder_style));
    }

    // ---- patterns ----
    try {
        (void)apply_overrides(default_rule_table(), config.patterns);
    } catch (const ConfigurationError& e) {
        errors.push_back(std::format("patterns: {}", e.what()));
    }

    // ---- llm ----
    if (config.llm.provider != "openai" && config.llm.provider != "anthropic") {
        errors.push_back(std::format("llm.provider '{}' must be 'openai' or 'anthropic'",
            config.llm.provider));
    }
    if (config.llm.endpoint.empty()) {
        errors.push_back("llm.endpoint must not be empty");
    }
    if (config.llm.model.empty()) {
        errors.push_back("llm.model must not be empty");
    }
    if (config.llm.temperature < 0.0 || config.llm.temperature > 2.0) {
        errors.push_back(std::format("llm.temperature must be 0-2, got {}", config.llm.temperature));
    }
    if (!utils::in_range<1, 1000000>(config.llm.max_tokens)) {
        errors.push_back(std::format("llm.max_tokens must be 1-1000000, got {}",
            config.llm.max_tokens));
    }
    if (!utils::in_range<1, 600000>(config.llm.timeout_ms)) {
        errors.push_back(std::format("llm.timeout_ms must be 1-600000, got {}",
            config.llm.timeout_ms));
    }
    if (config.llm.max_retries > 10) {
        errors.push_back(std::format("llm.max_retries must be 0-10, got {}", config.llm.max_retries));
    }
    if (config.llm.max_requests_per_minute == 0) {
        errors.push_back("llm.max_requests_per_minute must be positive");
    }

    // ---- routes ----
    const auto check_route = [&errors](const char* key, const std::string& path, bool optional) {
        if (path.empty() && optional) return;
        if (path.empty() || path.front() != '/') {
            errors.push_back(std::format("routes.{} must start with '/', got '{}'", key, path));
        }
    };
    check_route("health", config.routes.health, false);
    check_route("root_health", config.routes.root_health, true);
    check_route("chat", config.routes.chat, false);
    if (config.routes.chat == config.routes.health) {
        errors.push_back("routes.chat and routes.health must differ");
    }

    return errors;
}

} // namespace promptguard
