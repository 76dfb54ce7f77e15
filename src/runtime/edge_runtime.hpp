/**
 * @file edge_runtime.hpp
 * @brief Top-level runtime facade: supervisor + health monitor + telemetry.
 * @author Dimitris Kafetzis
 *
 * Wires the self-healing loop:
 *   HealthMonitor --overheat--> WorkerSupervisor::pause + telemetry event
 *   HealthMonitor --recover---> WorkerSupervisor::resume + telemetry event
 *   heartbeat emitter ---------> periodic snapshot through TelemetryClient
 *
 * The watchdog restarts dead or zombie workers on its own, whatever the
 * health state.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "health/health_monitor.hpp"
#include "health/system_probe.hpp"
#include "supervisor/worker_supervisor.hpp"
#include "telemetry/metrics_collector.hpp"
#include "telemetry/telemetry_client.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

namespace edge_sentinel {

class EdgeRuntime {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<ISystemProbe> probe;    ///< nullptr = LinuxSystemProbe
        TelemetryTransport transport;           ///< empty = log-only transport
    };

    explicit EdgeRuntime(Options opts);
    ~EdgeRuntime();

    // Non-copyable, non-movable
    EdgeRuntime(const EdgeRuntime&) = delete;
    EdgeRuntime& operator=(const EdgeRuntime&) = delete;

    // ── Lifecycle ────────────────────────────
    Result<void> start();

    /// Stop heartbeat, workers, health and telemetry in that order. Idempotent.
    /// Joins are not timed; every loop wakes on its stop_token.
    void shutdown();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    /// Send one heartbeat snapshot; false if no health sample exists yet
    /// or the snapshot was buffered instead of delivered.
    bool emit_heartbeat();

    /// Heartbeat body for @p status (exposed for tests).
    [[nodiscard]] nlohmann::json heartbeat_event(const HealthStatus& status);

    // ── Accessors (for testing) ─────────────
    WorkerSupervisor& supervisor() { return supervisor_; }
    HealthMonitor& health() { return health_; }
    TelemetryClient& telemetry() { return telemetry_; }
    MetricsCollector& metrics() { return metrics_; }
    Logger& logger() { return logger_; }
    const Config& config() const { return config_; }

private:
    void handle_overheat(const HealthStatus& status);
    void handle_recover(const HealthStatus& status);
    void register_configured_workers();
    void heartbeat_loop(std::stop_token stop);

    Config config_;
    Logger logger_;
    MetricsCollector metrics_;
    TelemetryClient telemetry_;
    WorkerSupervisor supervisor_;
    HealthMonitor health_;

    std::atomic<bool> running_{false};
    std::mutex loop_mutex_;
    std::condition_variable_any loop_cv_;
    std::jthread heartbeat_thread_;
};

}  // namespace edge_sentinel
