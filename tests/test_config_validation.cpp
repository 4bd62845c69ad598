#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>

using namespace promptguard;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Config: defaults", "[config]") {
    ::unsetenv("OPENAI_API_KEY");
    auto result = ConfigLoader::defaults();
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.server.host == "0.0.0.0");
    CHECK(cfg.server.port == 8080);
    CHECK(cfg.nlp.language == "es");
    CHECK(cfg.nlp.supported_languages == std::vector<std::string>{"es"});
    CHECK(cfg.analyzer.placeholder_style == "category");
    CHECK(cfg.llm.provider == "openai");
    CHECK(cfg.llm.model == "gpt-3.5-turbo");
    CHECK(cfg.llm.api_key.empty());
    CHECK(cfg.routes.health == "/health");
    CHECK(cfg.routes.root_health == "/");
    CHECK(cfg.routes.chat == "/chat/secure");
}

TEST_CASE("Config: API key from the environment", "[config][env]") {
    ::setenv("OPENAI_API_KEY", "sk-test", 1);
    auto result = ConfigLoader::defaults();
    REQUIRE(result.success);
    CHECK(result.config.llm.api_key == "sk-test");
    ::unsetenv("OPENAI_API_KEY");
}

TEST_CASE("Config: full file", "[config]") {
    const std::string toml = R"(
[server]
host = "127.0.0.1"
port = 9090
threads = 8
max_prompt_bytes = 1024

[logging]
level = "debug"

[nlp]
enabled = false
language = "es"
supported_languages = ["es"]

[analyzer]
parallel = true
parallel_min_chars = 64
placeholder_style = "numbered"

[[patterns]]
name = "cbu_pattern"
entity_type = "BANK_ACCOUNT"
regex = '\b\d{22}\b'
score = 0.9

[llm]
provider = "Anthropic"
api_key = "k"
model = "claude-haiku"
timeout_ms = 5000

[routes]
chat = "/v2/chat"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.server.port == 9090);
    CHECK(cfg.server.thread_pool_size == 8);
    CHECK(cfg.server.max_prompt_bytes == 1024);
    CHECK(cfg.logging.level == "debug");
    CHECK_FALSE(cfg.nlp.enabled);
    CHECK(cfg.analyzer.parallel);
    CHECK(cfg.analyzer.parallel_min_chars == 64);
    CHECK(ConfigLoader::parse_placeholder_style(cfg.analyzer.placeholder_style) ==
          PlaceholderStyle::NUMBERED);
    REQUIRE(cfg.patterns.size() == 1);
    CHECK(cfg.patterns[0].regex == R"(\b\d{22}\b)");
    CHECK(cfg.llm.provider == "anthropic");
    CHECK(cfg.llm.endpoint == "https://api.anthropic.com");
    CHECK(cfg.llm.timeout_ms == 5000);
    CHECK(cfg.routes.chat == "/v2/chat");
    CHECK(cfg.routes.health == "/health");
}

TEST_CASE("Config: validation collects every error", "[config]") {

    SECTION("Bad server and logging values") {
        auto result = ConfigLoader::load_from_string(R"(
[server]
port = 70000
threads = 0

[logging]
level = "verbose"
)");
        REQUIRE_FALSE(result.success);
        CHECK_THAT(result.error_message, ContainsSubstring("server.port"));
        CHECK_THAT(result.error_message, ContainsSubstring("server.threads"));
        CHECK_THAT(result.error_message, ContainsSubstring("logging.level"));
    }

    SECTION("Default language must be served") {
        auto result = ConfigLoader::load_from_string(R"(
[nlp]
language = "en"
supported_languages = ["es"]
)");
        REQUIRE_FALSE(result.success);
        CHECK_THAT(result.error_message, ContainsSubstring("nlp.language"));
    }

    SECTION("Invalid pattern regex names the rule") {
        auto result = ConfigLoader::load_from_string(R"(
[[patterns]]
name = "broken_rule"
entity_type = "X"
regex = "([a-z"
score = 0.5
)");
        REQUIRE_FALSE(result.success);
        CHECK_THAT(result.error_message, ContainsSubstring("broken_rule"));
    }

    SECTION("Pattern without a score") {
        auto result = ConfigLoader::load_from_string(R"(
[[patterns]]
name = "no_score"
entity_type = "X"
regex = "x"
)");
        REQUIRE_FALSE(result.success);
        CHECK_THAT(result.error_message, ContainsSubstring("no_score"));
    }

    SECTION("Unknown provider and placeholder style") {
        auto result = ConfigLoader::load_from_string(R"(
[analyzer]
placeholder_style = "hashed"

[llm]
provider = "cohere"
temperature = 3.0
)");
        REQUIRE_FALSE(result.success);
        CHECK_THAT(result.error_message, ContainsSubstring("placeholder_style"));
        CHECK_THAT(result.error_message, ContainsSubstring("llm.provider"));
        CHECK_THAT(result.error_message, ContainsSubstring("llm.temperature"));
    }

    SECTION("Routes") {
        auto result = ConfigLoader::load_from_string(R"(
[routes]
health = "health"
chat = "health"
)");
        REQUIRE_FALSE(result.success);
        CHECK_THAT(result.error_message, ContainsSubstring("routes.health"));
        CHECK_THAT(result.error_message, ContainsSubstring("must differ"));
    }

    SECTION("TOML syntax error") {
        auto result = ConfigLoader::load_from_string("[server\nport = ");
        REQUIRE_FALSE(result.success);
        CHECK_THAT(result.error_message, ContainsSubstring("Failed to parse config"));
    }

    SECTION("Missing file") {
        auto result = ConfigLoader::load_from_file("/nonexistent/promptguard.toml");
        REQUIRE_FALSE(result.success);
    }
}

TEST_CASE("Config: bundled file is valid", "[config]") {
    auto result = ConfigLoader::load_from_file(
        std::string(PROMPTGUARD_SOURCE_DIR) + "/config/promptguard.toml");
    INFO(result.error_message);
    REQUIRE(result.success);
    CHECK(result.config.nlp.model_path == "models/es_entities.tsv");
}

TEST_CASE("Config: placeholder style names", "[config]") {
    CHECK(ConfigLoader::parse_placeholder_style("category") == PlaceholderStyle::PER_CATEGORY);
    CHECK(ConfigLoader::parse_placeholder_style("NUMBERED") == PlaceholderStyle::NUMBERED);
    CHECK_FALSE(ConfigLoader::parse_placeholder_style("other").has_value());
}
