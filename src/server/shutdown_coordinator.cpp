#include "server/shutdown_coordinator.hpp"
#include "core/utils.hpp"

#include <format>

namespace promptguard {

ShutdownCoordinator::ShutdownCoordinator() = default;

ShutdownCoordinator::ShutdownCoordinator(const Config& config)
    : config_(config) {}

void ShutdownCoordinator::initiate_shutdown() {
    shutting_down_.store(true, std::memory_order_release);
    drain_cv_.notify_all();
}

bool ShutdownCoordinator::try_enter_request() {
    if (shutting_down_.load(std::memory_order_acquire)) {
        return false;
    }
    in_flight_.fetch_add(1, std::memory_order_relaxed);
    // Double-check after increment (avoid race with initiate_shutdown)
    if (shutting_down_.load(std::memory_order_acquire)) {
        in_flight_.fetch_sub(1, std::memory_order_relaxed);
        drain_cv_.notify_all();
        return false;
    }
    return true;
}

void ShutdownCoordinator::leave_request() {
    const uint32_t prev = in_flight_.fetch_sub(1, std::memory_order_relaxed);
    if (prev == 1 && shutting_down_.load(std::memory_order_acquire)) {
        std::lock_guard lock(drain_mutex_);
        drain_cv_.notify_all();
    }
}

bool ShutdownCoordinator::wait_until_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(drain_mutex_);
    return drain_cv_.wait_for(lock, timeout, [this] {
        return in_flight_.load(std::memory_order_relaxed) == 0;
    });
}

bool ShutdownCoordinator::wait_for_drain() {
    return wait_until_idle(config_.shutdown_timeout);
}

bool ShutdownCoordinator::drain_or_cancel() {
    if (wait_for_drain()) {
        return true;
    }
    utils::log::warn(std::format("Shutdown: {} request(s) still running after {}ms; cancelling",
        in_flight_count(), config_.shutdown_timeout.count()));
    cancel_.request_stop();
    return wait_until_idle(config_.cancel_grace);
}

} // namespace promptguard
