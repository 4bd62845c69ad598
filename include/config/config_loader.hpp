#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

#include <toml++/toml.hpp>

#include <optional>
#include <string>
#include <vector>

namespace promptguard {

// ============================================================================
// ConfigLoader - Extract typed config from TOML (toml++)
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        PromptGuardConfig config;

        static LoadResult ok(PromptGuardConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to promptguard.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Built-in defaults, used when no config file exists
     *
     * Same as an empty file except that llm.api_key still comes from
     * ${OPENAI_API_KEY}.
     */
    [[nodiscard]] static LoadResult defaults();

    /**
     * @brief Validate a typed config
     * @return Every problem found (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const PromptGuardConfig& config);

    [[nodiscard]] static std::optional<PlaceholderStyle> parse_placeholder_style(const std::string& name);

private:
    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static NlpConfig extract_nlp(const toml::table& root);
    static AnalyzerConfig extract_analyzer(const toml::table& root);
    static std::vector<PatternRule> extract_patterns(const toml::table& root);
    static LlmClient::Config extract_llm(const toml::table& root);
    static RouteConfig extract_routes(const toml::table& root);

    static PromptGuardConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(PromptGuardConfig config);
};

} // namespace promptguard
