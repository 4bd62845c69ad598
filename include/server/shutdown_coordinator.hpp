#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>

namespace promptguard {

/**
 * @brief Graceful shutdown: stop admitting, drain, then cancel stragglers
 *
 * Every admitted request receives a stop token from a shared stop source.
 * Requests still running when the drain timeout expires are cancelled
 * through that token (detection and the provider call both observe it).
 */
class ShutdownCoordinator {
public:
    struct Config {
        std::chrono::milliseconds shutdown_timeout{30000};
        std::chrono::milliseconds cancel_grace{2000};   // wait after cancelling
    };

    ShutdownCoordinator();
    explicit ShutdownCoordinator(const Config& config);

    /// Called by signal handler to initiate shutdown
    void initiate_shutdown();

    /// Called at start of each request. Returns false if shutting down.
    [[nodiscard]] bool try_enter_request();

    /// Called when request completes.
    void leave_request();

    /// Blocks until all in-flight requests complete or timeout.
    /// Returns true if drained cleanly, false if timed out.
    [[nodiscard]] bool wait_for_drain();

    /**
     * @brief Drain; on timeout cancel remaining requests and wait the grace period
     * @return true if no request was left running
     */
    [[nodiscard]] bool drain_or_cancel();

    /// Token handed to each admitted request
    [[nodiscard]] std::stop_token request_token() const { return cancel_.get_token(); }

    [[nodiscard]] bool is_shutting_down() const {
        return shutting_down_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint32_t in_flight_count() const {
        return in_flight_.load(std::memory_order_relaxed);
    }

private:
    [[nodiscard]] bool wait_until_idle(std::chrono::milliseconds timeout);

    Config config_;
    std::atomic<bool> shutting_down_{false};
    std::atomic<uint32_t> in_flight_{0};
    std::stop_source cancel_;
    std::mutex drain_mutex_;
    std::condition_variable drain_cv_;
};

/**
 * @brief RAII admission: enters on construction, leaves on destruction
 */
class RequestGuard {
public:
    explicit RequestGuard(ShutdownCoordinator& coordinator)
        : coordinator_(coordinator), admitted_(coordinator.try_enter_request()) {}

    ~RequestGuard() {
        if (admitted_) coordinator_.leave_request();
    }

    RequestGuard(const RequestGuard&) = delete;
    RequestGuard& operator=(const RequestGuard&) = delete;

    [[nodiscard]] bool admitted() const { return admitted_; }

private:
    ShutdownCoordinator& coordinator_;
    bool admitted_;
};

} // namespace promptguard
