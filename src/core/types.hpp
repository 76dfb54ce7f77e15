/**
 * @file types.hpp
 * @brief Fundamental types used throughout EdgeSentinel.
 * @author Dimitris Kafetzis
 *
 * Defines identity aliases, clock aliases and the wall-clock conversions
 * shared by the telemetry and supervisor modules.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace edge_sentinel {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using DeviceId = std::string;
using WorkerName = std::string;
using PayloadId = std::string;

// ─────────────────────────────────────────────
// Clocks
// ─────────────────────────────────────────────

using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;
using Milliseconds = std::chrono::milliseconds;

/**
 * @brief Seconds since the Unix epoch, sub-second precision preserved.
 */
[[nodiscard]] inline double to_epoch_seconds(Timestamp ts) noexcept {
    return std::chrono::duration<double>(ts.time_since_epoch()).count();
}

[[nodiscard]] inline Timestamp from_epoch_seconds(double seconds) noexcept {
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::duration<double>(seconds))};
}

[[nodiscard]] inline int64_t to_epoch_nanos(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        ts.time_since_epoch()).count();
}

}  // namespace edge_sentinel
