/**
 * @file circuit_breaker.hpp
 * @brief Consecutive-failure circuit breaker guarding the telemetry send path.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace edge_sentinel {

enum class CircuitState : uint8_t {
    Closed,
    Open,
    HalfOpen
};

[[nodiscard]] constexpr std::string_view to_string(CircuitState state) noexcept {
    switch (state) {
        case CircuitState::Closed:   return "closed";
        case CircuitState::Open:     return "open";
        case CircuitState::HalfOpen: return "half_open";
    }
    return "unknown";
}

/**
 * @brief Thread-safe circuit breaker.
 *
 * CLOSED → OPEN after failure_threshold consecutive failures.
 * OPEN → HALF_OPEN once timeout has elapsed (evaluated lazily on query).
 * HALF_OPEN → CLOSED after success_threshold successes; any failure re-opens.
 */
class CircuitBreaker {
public:
    using Clock = std::function<SteadyTime()>;

    explicit CircuitBreaker(const CircuitConfig& config,
                            std::string name = "telemetry",
                            Clock clock = {});

    /// True when an attempt may be made now.
    [[nodiscard]] bool may_attempt();

    void record_success();
    void record_failure(const Error& error);

    [[nodiscard]] CircuitState state();
    [[nodiscard]] uint32_t consecutive_failures() const;
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    void refresh_locked();
    void open_locked();

    CircuitConfig config_;
    std::string name_;
    Clock clock_;

    mutable std::mutex mutex_;
    CircuitState state_{CircuitState::Closed};
    uint32_t failures_{0};
    uint32_t half_open_successes_{0};
    SteadyTime opened_at_{};
};

}  // namespace edge_sentinel
