#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>

namespace promptguard {

/**
 * @brief Outbound LLM collaborator
 *
 * Receives only sanitized text. send() throws ProviderError when the
 * provider is unreachable, rejects the call or times out, and
 * RequestCancelled when `stop` fires first.
 */
class ILlmProvider {
public:
    virtual ~ILlmProvider() = default;

    [[nodiscard]] virtual std::string send(const std::string& system_instruction,
                                           const std::string& user_text,
                                           std::stop_token stop) = 0;

    /// False means "run in simulation mode", not an error.
    [[nodiscard]] virtual bool is_configured() const = 0;

    [[nodiscard]] virtual std::string_view provider_name() const = 0;
};

/**
 * @brief LLM client over cpp-httplib
 *
 * Speaks the OpenAI-compatible chat completions API (default) or the
 * Anthropic messages API. Features:
 * - Bounded connect/read/write timeouts
 * - Retries with linear backoff on transport errors, 429 and 5xx
 * - Per-minute request budget
 * - Cancellation of the in-flight socket through a stop token
 *
 * Prompts and responses are never cached or logged.
 */
class LlmClient : public ILlmProvider {
public:
    struct Config {
        std::string provider = "openai";            // "openai" | "anthropic"
        std::string endpoint = "https://api.openai.com";
        std::string api_key;
        std::string model = "gpt-3.5-turbo";
        double temperature = 0.7;
        int max_tokens = 1024;
        uint32_t timeout_ms = 30000;
        uint32_t max_retries = 2;
        uint32_t retry_backoff_ms = 500;
        uint32_t max_requests_per_minute = 60;
    };

    LlmClient();
    explicit LlmClient(Config config);

    [[nodiscard]] std::string send(const std::string& system_instruction,
                                   const std::string& user_text,
                                   std::stop_token stop) override;

    [[nodiscard]] bool is_configured() const override { return !config_.api_key.empty(); }

    [[nodiscard]] std::string_view provider_name() const override { return config_.provider; }

    [[nodiscard]] const Config& config() const { return config_; }

    // Request body for the configured provider (for testing)
    [[nodiscard]] std::string build_request_body(const std::string& system_instruction,
                                                 const std::string& user_text) const;

    /**
     * @brief Extract the assistant text from a provider response body
     * @throws ProviderError if the body has no usable text
     */
    [[nodiscard]] static std::string extract_content(const std::string& body,
                                                     const std::string& provider);

    struct Stats {
        uint64_t total_requests = 0;
        uint64_t api_calls = 0;
        uint64_t api_errors = 0;
        uint64_t rate_limited = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] std::string call_api(const std::string& body, std::stop_token stop);

    [[nodiscard]] bool check_rate_limit();

    Config config_;

    // Rate limiting
    uint32_t requests_this_minute_ = 0;
    std::chrono::steady_clock::time_point minute_start_ =
        std::chrono::steady_clock::now();
    std::mutex rate_mutex_;

    // Stats
    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> api_calls_{0};
    std::atomic<uint64_t> api_errors_{0};
    std::atomic<uint64_t> rate_limited_{0};
};

} // namespace promptguard
