#pragma once

#include "config/config_types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

// Forward declarations for httplib types (avoids pulling httplib.h into every TU)
namespace httplib {
    struct Request;
    struct Response;
    class Server;
}

namespace promptguard {

class Pipeline;
class ShutdownCoordinator;

/**
 * @brief HTTP front end for the sanitizing chat relay
 *
 * Endpoints (paths come from RouteConfig):
 * - GET  /health, GET /   -> {"status":"online","mode":"..."}
 * - POST /chat/secure     -> {"ai_response":..., "safety_report":{...}}
 *
 * Error bodies never echo prompt text or exception messages.
 */
class HttpServer {
public:
    HttpServer(std::shared_ptr<Pipeline> pipeline,
               ServerConfig server_config,
               RouteConfig routes,
               std::shared_ptr<ShutdownCoordinator> shutdown);

    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Blocks in listen() until stop() is called. Port 0 binds any free port.
    void start();

    void stop();

    /// Blocks until start() is accepting connections
    void wait_until_ready() const;

    [[nodiscard]] int bound_port() const { return bound_port_.load(std::memory_order_acquire); }

    struct HttpStats {
        uint64_t chat_requests;
        uint64_t rejected_invalid;
        uint64_t rejected_too_large;
        uint64_t rejected_shutdown;
        uint64_t internal_errors;
    };

    [[nodiscard]] HttpStats get_http_stats() const;

    // Body codecs, public for tests
    struct ParsedChatBody {
        bool valid = false;
        std::string prompt;
        std::string user_id = "guest";
        std::string language;
    };

    [[nodiscard]] static ParsedChatBody parse_chat_body(const std::string& body);

    [[nodiscard]] static std::string health_body(std::string_view mode);

private:
    void register_core_routes(httplib::Server& svr);

    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_chat(const httplib::Request& req, httplib::Response& res);
    void handle_preflight(const httplib::Request& req, httplib::Response& res);

    std::shared_ptr<Pipeline> pipeline_;
    ServerConfig config_;
    RouteConfig routes_;
    std::shared_ptr<ShutdownCoordinator> shutdown_;

    std::unique_ptr<httplib::Server> svr_;
    std::atomic<int> bound_port_{0};

    std::atomic<uint64_t> chat_requests_{0};
    std::atomic<uint64_t> rejected_invalid_{0};
    std::atomic<uint64_t> rejected_too_large_{0};
    std::atomic<uint64_t> rejected_shutdown_{0};
    std::atomic<uint64_t> internal_errors_{0};
};

} // namespace promptguard
