/**
 * @file circuit_breaker.cpp
 * @brief CircuitBreaker implementation.
 */

#include "telemetry/circuit_breaker.hpp"

namespace edge_sentinel {

CircuitBreaker::CircuitBreaker(const CircuitConfig& config, std::string name, Clock clock)
    : config_(config)
    , name_(std::move(name))
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })) {}

bool CircuitBreaker::may_attempt() {
    std::lock_guard lock(mutex_);
    refresh_locked();
    return state_ != CircuitState::Open;
}

void CircuitBreaker::record_success() {
    std::lock_guard lock(mutex_);
    refresh_locked();
    switch (state_) {
        case CircuitState::Closed:
            failures_ = 0;
            break;
        case CircuitState::HalfOpen:
            if (++half_open_successes_ >= config_.success_threshold) {
                state_ = CircuitState::Closed;
                failures_ = 0;
                half_open_successes_ = 0;
            }
            break;
        case CircuitState::Open:
            break;
    }
}

void CircuitBreaker::record_failure(const Error& /*error*/) {
    std::lock_guard lock(mutex_);
    refresh_locked();
    switch (state_) {
        case CircuitState::Closed:
            if (++failures_ >= config_.failure_threshold) {
                open_locked();
            }
            break;
        case CircuitState::HalfOpen:
            open_locked();
            break;
        case CircuitState::Open:
            // Late result from an attempt started before the trip.
            opened_at_ = clock_();
            break;
    }
}

CircuitState CircuitBreaker::state() {
    std::lock_guard lock(mutex_);
    refresh_locked();
    return state_;
}

uint32_t CircuitBreaker::consecutive_failures() const {
    std::lock_guard lock(mutex_);
    return failures_;
}

void CircuitBreaker::refresh_locked() {
    if (state_ == CircuitState::Open
        && clock_() - opened_at_ >= Milliseconds(config_.timeout_ms)) {
        state_ = CircuitState::HalfOpen;
        half_open_successes_ = 0;
    }
}

void CircuitBreaker::open_locked() {
    state_ = CircuitState::Open;
    opened_at_ = clock_();
    half_open_successes_ = 0;
}

}  // namespace edge_sentinel
