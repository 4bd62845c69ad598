#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "core/error.hpp"
#include "core/llm_client.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <atomic>
#include <thread>

using namespace promptguard;
using Catch::Matchers::ContainsSubstring;

static LlmClient::Config test_config() {
    LlmClient::Config cfg;
    cfg.endpoint = "http://127.0.0.1:1";
    cfg.api_key = "test-key";
    cfg.timeout_ms = 1000;
    cfg.max_retries = 0;
    cfg.retry_backoff_ms = 10;
    return cfg;
}

TEST_CASE("LlmClient: configuration", "[llm_client]") {

    SECTION("No API key means not configured") {
        LlmClient client;
        CHECK_FALSE(client.is_configured());
        CHECK(client.provider_name() == "openai");
        REQUIRE_THROWS_AS(client.send("sys", "hola", {}), ProviderError);
    }

    SECTION("Configured with key") {
        LlmClient client(test_config());
        CHECK(client.is_configured());
    }

    SECTION("Unreachable endpoint returns ProviderError") {
        LlmClient client(test_config());
        REQUIRE_THROWS_AS(client.send("sys", "hola", {}), ProviderError);
        CHECK(client.get_stats().api_errors == 1);
    }

    SECTION("Per-minute budget") {
        auto cfg = test_config();
        cfg.max_requests_per_minute = 1;
        LlmClient client(cfg);
        REQUIRE_THROWS_AS(client.send("sys", "a", {}), ProviderError);
        REQUIRE_THROWS_WITH(client.send("sys", "b", {}), ContainsSubstring("rate limited"));
        CHECK(client.get_stats().rate_limited == 1);
    }

    SECTION("Cancelled before the call") {
        LlmClient client(test_config());
        std::stop_source stop;
        stop.request_stop();
        REQUIRE_THROWS_AS(client.send("sys", "hola", stop.get_token()), RequestCancelled);
    }
}

TEST_CASE("LlmClient: request bodies", "[llm_client]") {

    SECTION("OpenAI chat completions") {
        LlmClient client(test_config());
        const auto body = client.build_request_body("sys", "Mi DNI es <NATIONAL_ID>");
        CHECK_THAT(body, ContainsSubstring(R"("model":"gpt-3.5-turbo")"));
        CHECK_THAT(body, ContainsSubstring(R"({"role":"system","content":"sys"})"));
        CHECK_THAT(body, ContainsSubstring(R"({"role":"user","content":"Mi DNI es <NATIONAL_ID>"})"));
    }

    SECTION("Anthropic messages") {
        auto cfg = test_config();
        cfg.provider = "anthropic";
        cfg.model = "claude-haiku";
        LlmClient client(cfg);
        const auto body = client.build_request_body("sys", "hola");
        CHECK_THAT(body, ContainsSubstring(R"("system":"sys")"));
        CHECK_THAT(body, ContainsSubstring(R"({"role":"user","content":"hola"})"));
    }

    SECTION("Quotes are escaped") {
        LlmClient client(test_config());
        const auto body = client.build_request_body("sys", R"(dice "hola")");
        CHECK_THAT(body, ContainsSubstring(R"(dice \"hola\")"));
    }
}

TEST_CASE("LlmClient: extract_content", "[llm_client]") {

    SECTION("OpenAI shape") {
        const std::string body =
            R"({"id":"x","choices":[{"index":0,"message":{"role":"assistant","content":"Hola <PERSON>"}}]})";
        CHECK(LlmClient::extract_content(body, "openai") == "Hola <PERSON>");
    }

    SECTION("Anthropic shape joins text blocks") {
        const std::string body =
            R"({"content":[{"type":"text","text":"Hola "},{"type":"text","text":"mundo"}],"role":"assistant"})";
        CHECK(LlmClient::extract_content(body, "anthropic") == "Hola mundo");
    }

    SECTION("Malformed or empty responses") {
        REQUIRE_THROWS_AS(LlmClient::extract_content("not json", "openai"), ProviderError);
        REQUIRE_THROWS_AS(LlmClient::extract_content(R"({"choices":[]})", "openai"), ProviderError);
        REQUIRE_THROWS_AS(LlmClient::extract_content(R"({"content":[]})", "anthropic"), ProviderError);
    }
}

TEST_CASE("LlmClient: retries against a local endpoint", "[llm_client]") {
    httplib::Server server;
    std::atomic<int> calls{0};
    std::string last_auth;

    server.Post("/v1/chat/completions", [&](const httplib::Request& req, httplib::Response& res) {
        last_auth = req.get_header_value("Authorization");
        if (calls.fetch_add(1) == 0) {
            res.status = 503;
            return;
        }
        res.set_content(R"({"choices":[{"message":{"content":"respuesta"}}]})", "application/json");
    });

    const int port = server.bind_to_any_port("127.0.0.1");
    REQUIRE(port > 0);
    std::thread listener([&] { server.listen_after_bind(); });
    server.wait_until_ready();

    auto cfg = test_config();
    cfg.endpoint = "http://127.0.0.1:" + std::to_string(port);
    cfg.max_retries = 2;
    LlmClient client(cfg);

    const auto reply = client.send("sys", "hola", {});

    server.stop();
    listener.join();

    CHECK(reply == "respuesta");
    CHECK(calls.load() == 2);
    CHECK(last_auth == "Bearer test-key");
    CHECK(client.get_stats().api_calls == 2);
}
