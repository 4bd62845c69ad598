#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "server/shutdown_coordinator.hpp"
#include "core/error.hpp"
#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include "recognizer/recognizer_registry.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <glaze/glaze.hpp>

#include <format>
#include <optional>
#include <string_view>
#include <vector>

namespace promptguard {

// ============================================================================
// Wire bodies
// ============================================================================

namespace {

struct ChatBody {
    std::optional<std::string> prompt;
    std::optional<std::string> user_id;
    std::optional<std::string> language;
};

struct SafetyReportBody {
    std::vector<std::string> detected_items;
    std::string sanitized_prompt;
};

struct ChatReplyBody {
    std::string ai_response;
    SafetyReportBody safety_report;
};

struct HealthBody {
    std::string status;
    std::string mode;
};

struct DetailBody {
    std::string detail;
};

constexpr glz::opts kLenient{.error_on_unknown_keys = false};

template <typename T>
std::string to_json(const T& value) {
    std::string out;
    if (glz::write_json(value, out)) {
        throw std::runtime_error("response serialization failed");
    }
    return out;
}

void reply_detail(httplib::Response& res, int status, std::string detail) {
    res.status = status;
    res.set_content(to_json(DetailBody{std::move(detail)}), http::kJsonContentType);
}

void reply_generic_error(httplib::Response& res) {
    res.status = httplib::StatusCode::InternalServerError_500;
    res.set_content(std::string(http::kGenericError), http::kJsonContentType);
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

HttpServer::HttpServer(std::shared_ptr<Pipeline> pipeline,
                       ServerConfig server_config,
                       RouteConfig routes,
                       std::shared_ptr<ShutdownCoordinator> shutdown)
    : pipeline_(std::move(pipeline)),
      config_(std::move(server_config)),
      routes_(std::move(routes)),
      shutdown_(std::move(shutdown)) {
    if (!pipeline_) {
        throw ConfigurationError("HTTP server needs a pipeline");
    }
    if (!shutdown_) {
        shutdown_ = std::make_shared<ShutdownCoordinator>();
    }
    svr_ = std::make_unique<httplib::Server>();
}

HttpServer::~HttpServer() = default;

// ============================================================================
// Body codecs
// ============================================================================

HttpServer::ParsedChatBody HttpServer::parse_chat_body(const std::string& body) {
    ParsedChatBody parsed;
    ChatBody wire;
    if (glz::read<kLenient>(wire, body) || !wire.prompt) {
        return parsed;
    }
    parsed.valid = true;
    parsed.prompt = std::move(*wire.prompt);
    if (wire.user_id && !wire.user_id->empty()) {
        parsed.user_id = std::move(*wire.user_id);
    }
    if (wire.language) {
        parsed.language = utils::to_lower(*wire.language);
    }
    return parsed;
}

std::string HttpServer::health_body(std::string_view mode) {
    return to_json(HealthBody{"online", std::string(mode)});
}

// ============================================================================
// Lifecycle
// ============================================================================

void HttpServer::start() {
    auto& svr = *svr_;

    const size_t pool_size = config_.thread_pool_size;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    const auto timeout = std::chrono::milliseconds(config_.read_timeout_ms);
    svr.set_read_timeout(timeout);
    svr.set_payload_max_length(config_.max_prompt_bytes * 4 + 1024);

    svr.set_default_headers({
        {"Access-Control-Allow-Origin", config_.cors_allow_origin},
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type, Authorization"},
    });

    register_core_routes(svr);

    utils::log::info(std::format("Starting PromptGuard on {}:{} ({} threads, {})",
        config_.host, config_.port, config_.thread_pool_size, pipeline_->mode()));

    int port = config_.port;
    if (port == 0) {
        port = svr.bind_to_any_port(config_.host);
    } else if (!svr.bind_to_port(config_.host, port)) {
        port = -1;
    }
    if (port < 0) {
        throw std::runtime_error(std::format("Failed to bind {}:{}", config_.host, config_.port));
    }
    bound_port_.store(port, std::memory_order_release);

    if (!svr.listen_after_bind()) {
        throw std::runtime_error("Failed to start HTTP server");
    }
}

void HttpServer::stop() {
    svr_->stop();
    utils::log::info("Server stopped");
}

void HttpServer::wait_until_ready() const {
    svr_->wait_until_ready();
}

HttpServer::HttpStats HttpServer::get_http_stats() const {
    return {
        chat_requests_.load(std::memory_order_relaxed),
        rejected_invalid_.load(std::memory_order_relaxed),
        rejected_too_large_.load(std::memory_order_relaxed),
        rejected_shutdown_.load(std::memory_order_relaxed),
        internal_errors_.load(std::memory_order_relaxed)
    };
}

// ============================================================================
// Route registration
// ============================================================================

void HttpServer::register_core_routes(httplib::Server& svr) {
    svr.Post(routes_.chat, [this](const httplib::Request& req, httplib::Response& res) {
        handle_chat(req, res);
    });
    svr.Get(routes_.health, [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    if (!routes_.root_health.empty() && routes_.root_health != routes_.health) {
        svr.Get(routes_.root_health, [this](const httplib::Request& req, httplib::Response& res) {
            handle_health(req, res);
        });
    }
    svr.Options(R"(.*)", [this](const httplib::Request& req, httplib::Response& res) {
        handle_preflight(req, res);
    });
}

// ============================================================================
// Handlers
// ============================================================================

void HttpServer::handle_health(const httplib::Request&, httplib::Response& res) {
    res.set_content(health_body(pipeline_->mode()), http::kJsonContentType);
}

void HttpServer::handle_preflight(const httplib::Request&, httplib::Response& res) {
    res.status = httplib::StatusCode::NoContent_204;
}

void HttpServer::handle_chat(const httplib::Request& req, httplib::Response& res) {
    RequestGuard guard(*shutdown_);
    if (!guard.admitted()) {
        rejected_shutdown_.fetch_add(1, std::memory_order_relaxed);
        res.status = httplib::StatusCode::ServiceUnavailable_503;
        res.set_content(std::string(http::kShuttingDown), http::kJsonContentType);
        return;
    }
    chat_requests_.fetch_add(1, std::memory_order_relaxed);

    ChatRequest request;
    request.request_id = utils::generate_uuid();
    res.set_header(http::kRequestIdHeader, request.request_id);

    try {
        auto parsed = parse_chat_body(req.body);
        if (!parsed.valid) {
            rejected_invalid_.fetch_add(1, std::memory_order_relaxed);
            reply_detail(res, httplib::StatusCode::UnprocessableContent_422,
                "Body must be a JSON object with a string field 'prompt'");
            return;
        }
        if (parsed.prompt.size() > config_.max_prompt_bytes) {
            rejected_too_large_.fetch_add(1, std::memory_order_relaxed);
            reply_detail(res, httplib::StatusCode::PayloadTooLarge_413,
                std::format("Prompt exceeds {} bytes", config_.max_prompt_bytes));
            return;
        }
        if (!parsed.language.empty() &&
            !pipeline_->components().registry->supports(parsed.language)) {
            rejected_invalid_.fetch_add(1, std::memory_order_relaxed);
            reply_detail(res, httplib::StatusCode::UnprocessableContent_422,
                std::format("Unsupported language '{}'", parsed.language));
            return;
        }

        request.prompt = std::move(parsed.prompt);
        request.user_id = std::move(parsed.user_id);
        request.language = std::move(parsed.language);

        const auto response = pipeline_->execute(request, shutdown_->request_token());

        res.set_content(to_json(ChatReplyBody{
            response.ai_response,
            {response.safety_report.detected_items, response.safety_report.sanitized_prompt}
        }), http::kJsonContentType);
    } catch (const PromptGuardError& e) {
        internal_errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("chat {} -> 500 ({})",
            request.request_id, error_category_to_string(e.category())));
        reply_generic_error(res);
    } catch (const std::exception&) {
        internal_errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("chat {} -> 500 (internal_error)", request.request_id));
        reply_generic_error(res);
    }
}

} // namespace promptguard
