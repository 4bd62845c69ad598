#include "core/llm_client.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <glaze/glaze.hpp>

#include <condition_variable>
#include <format>
#include <optional>
#include <vector>

namespace promptguard {

// ============================================================================
// Wire Types
// ============================================================================

namespace {

struct WireMessage {
    std::string role;
    std::string content;
};

struct OpenAiRequest {
    std::string model;
    double temperature;
    int max_tokens;
    std::vector<WireMessage> messages;
};

struct AnthropicRequest {
    std::string model;
    int max_tokens;
    double temperature;
    std::string system;
    std::vector<WireMessage> messages;
};

struct OpenAiMessage {
    std::optional<std::string> content;
};

struct OpenAiChoice {
    OpenAiMessage message;
};

struct OpenAiReply {
    std::vector<OpenAiChoice> choices;
};

struct AnthropicBlock {
    std::string type;
    std::optional<std::string> text;
};

struct AnthropicReply {
    std::vector<AnthropicBlock> content;
};

constexpr glz::opts kLenient{.error_on_unknown_keys = false};

bool is_retryable_status(int status) {
    return status == httplib::StatusCode::TooManyRequests_429 || status >= 500;
}

// Sleep that wakes early when `stop` fires; returns false if stopped
bool backoff(std::chrono::milliseconds delay, const std::stop_token& stop) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    return !cv.wait_for(lock, stop, delay, [] { return false; }) && !stop.stop_requested();
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

LlmClient::LlmClient() = default;

LlmClient::LlmClient(Config config)
    : config_(std::move(config)) {}

// ============================================================================
// Rate Limiting
// ============================================================================

bool LlmClient::check_rate_limit() {
    std::lock_guard lock(rate_mutex_);
    const auto now = std::chrono::steady_clock::now();
    if (now - minute_start_ >= std::chrono::minutes(1)) {
        minute_start_ = now;
        requests_this_minute_ = 0;
    }

    if (requests_this_minute_ >= config_.max_requests_per_minute) {
        return false;
    }
    ++requests_this_minute_;
    return true;
}

// ============================================================================
// Request / Response Bodies
// ============================================================================

std::string LlmClient::build_request_body(const std::string& system_instruction,
                                          const std::string& user_text) const {
    std::string body;
    glz::error_ctx ec;
    if (config_.provider == "anthropic") {
        AnthropicRequest req{config_.model, config_.max_tokens, config_.temperature,
                             system_instruction, {{"user", user_text}}};
        ec = glz::write_json(req, body);
    } else {
        OpenAiRequest req{config_.model, config_.temperature, config_.max_tokens,
                          {{"system", system_instruction}, {"user", user_text}}};
        ec = glz::write_json(req, body);
    }
    if (ec) {
        throw ProviderError("failed to serialize provider request");
    }
    return body;
}

std::string LlmClient::extract_content(const std::string& body, const std::string& provider) {
    if (provider == "anthropic") {
        // {"content":[{"type":"text","text":"..."}]}
        AnthropicReply reply;
        if (glz::read<kLenient>(reply, body)) {
            throw ProviderError("malformed provider response");
        }
        std::string text;
        for (const auto& block : reply.content) {
            if (block.type == "text" && block.text) {
                text += *block.text;
            }
        }
        if (text.empty()) {
            throw ProviderError("provider response has no text content");
        }
        return text;
    }

    // {"choices":[{"message":{"content":"..."}}]}
    OpenAiReply reply;
    if (glz::read<kLenient>(reply, body)) {
        throw ProviderError("malformed provider response");
    }
    if (reply.choices.empty() || !reply.choices.front().message.content) {
        throw ProviderError("provider response has no choices");
    }
    return *reply.choices.front().message.content;
}

// ============================================================================
// Core API
// ============================================================================

std::string LlmClient::send(const std::string& system_instruction,
                            const std::string& user_text,
                            std::stop_token stop) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    if (!is_configured()) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        throw ProviderError("no API key configured");
    }
    if (config_.endpoint.empty()) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        throw ProviderError("no endpoint configured");
    }
    if (!check_rate_limit()) {
        rate_limited_.fetch_add(1, std::memory_order_relaxed);
        throw ProviderError("rate limited: too many LLM API requests");
    }

    return call_api(build_request_body(system_instruction, user_text), stop);
}

// ============================================================================
// API Call
// ============================================================================

std::string LlmClient::call_api(const std::string& body, std::stop_token stop) {
    const utils::Timer timer;
    const auto timeout = std::chrono::milliseconds(config_.timeout_ms);

    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);

    httplib::Headers headers;
    std::string path;

    if (config_.provider == "anthropic") {
        headers = {
            {"x-api-key", config_.api_key},
            {"anthropic-version", "2023-06-01"}
        };
        path = "/v1/messages";
    } else {
        headers = {
            {"Authorization", "Bearer " + config_.api_key}
        };
        path = "/v1/chat/completions";
    }

    // Abort the socket as soon as the request is cancelled
    std::stop_callback on_stop(stop, [&cli] { cli.stop(); });

    for (uint32_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
        if (stop.stop_requested()) {
            throw RequestCancelled("provider call cancelled");
        }
        api_calls_.fetch_add(1, std::memory_order_relaxed);

        const auto res = cli.Post(path, headers, body, "application/json");
        const bool last = attempt == config_.max_retries;
        const auto delay = std::chrono::milliseconds(
            static_cast<int64_t>(config_.retry_backoff_ms) * (attempt + 1));

        if (!res) {
            if (stop.stop_requested()) {
                throw RequestCancelled("provider call cancelled");
            }
            utils::log::warn(std::format("LLM call attempt {} failed: {}",
                attempt + 1, httplib::to_string(res.error())));
            if (!last && backoff(delay, stop)) continue;
            break;
        }

        if (is_retryable_status(res->status)) {
            utils::log::warn(std::format("LLM call attempt {} returned HTTP {}",
                attempt + 1, res->status));
            if (res->status == httplib::StatusCode::TooManyRequests_429) {
                rate_limited_.fetch_add(1, std::memory_order_relaxed);
            }
            if (!last && backoff(delay, stop)) continue;
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            throw ProviderError(std::format("provider returned HTTP {}", res->status));
        }

        if (res->status != httplib::StatusCode::OK_200) {
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            throw ProviderError(std::format("provider rejected request: HTTP {}", res->status));
        }

        auto content = extract_content(res->body, config_.provider);
        utils::log::debug(std::format("LLM call ok ({}, {}ms, {} attempt(s))",
            config_.provider, timer.elapsed_ms().count(), attempt + 1));
        return content;
    }

    if (stop.stop_requested()) {
        throw RequestCancelled("provider call cancelled");
    }
    api_errors_.fetch_add(1, std::memory_order_relaxed);
    throw ProviderError("provider unreachable: connection error");
}

// ============================================================================
// Stats
// ============================================================================

LlmClient::Stats LlmClient::get_stats() const {
    return {
        total_requests_.load(std::memory_order_relaxed),
        api_calls_.load(std::memory_order_relaxed),
        api_errors_.load(std::memory_order_relaxed),
        rate_limited_.load(std::memory_order_relaxed)
    };
}

} // namespace promptguard
