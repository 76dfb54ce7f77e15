/**
 * @file worker_supervisor.hpp
 * @brief Owns the worker table and the watchdog that keeps it alive.
 *
 * One lock covers the whole table. Every mutation (register, start, stop,
 * pause, resume, and a full watchdog pass) holds it, so pause/resume block
 * until an in-flight watchdog pass completes and vice versa.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "supervisor/worker.hpp"
#include "telemetry/metrics_collector.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace edge_sentinel {

/// Environment variables handed to every worker.
inline constexpr const char* kHeartbeatFileEnv = "EDGE_SENTINEL_HEARTBEAT_FILE";
inline constexpr const char* kStopSignalEnv = "EDGE_SENTINEL_STOP_SIGNAL";
inline constexpr const char* kWorkerNameEnv = "EDGE_SENTINEL_WORKER_NAME";

class WorkerSupervisor {
public:
    WorkerSupervisor(const SupervisorConfig& config, Logger logger, MetricsCollector& metrics);
    ~WorkerSupervisor();

    WorkerSupervisor(const WorkerSupervisor&) = delete;
    WorkerSupervisor& operator=(const WorkerSupervisor&) = delete;

    /**
     * @brief Add a worker in STOPPED.
     *
     * ErrorCode::DuplicateName if the name is taken; ErrorCode::Config for an
     * empty name, empty command or a zero restart ceiling.
     */
    Result<void> register_worker(const WorkerName& name,
                                 std::vector<std::string> command,
                                 bool essential = false,
                                 std::optional<uint32_t> max_restarts = std::nullopt,
                                 bool heartbeat_enabled = false);

    Result<void> register_worker(const WorkerConfig& worker);

    /**
     * @brief Spawn every STOPPED worker and start the watchdog.
     * @return name → whether that worker is now RUNNING. Spawn failures mark
     *         the worker FAILED and are logged, never returned as errors.
     */
    std::map<WorkerName, bool> start_all();

    /**
     * @brief Liveness check for one worker.
     *
     * Alive means the OS process is running and, for heartbeat workers, the
     * marker was touched within the staleness window. A running process with
     * a stale marker is a zombie: it is terminated here and reported dead.
     * A missing marker counts as alive.
     */
    bool check_alive(const WorkerName& name);

    /// SIGSTOP a RUNNING non-essential worker.
    bool pause(const WorkerName& name);

    /// SIGCONT a PAUSED worker. A worker that died while paused is handled as
    /// a death instead; returns true only if it is RUNNING again afterwards.
    bool resume(const WorkerName& name);

    /// Graceful stop of one worker; ErrorCode::NotFound for unknown names.
    Result<void> stop(const WorkerName& name);

    /// Stop the watchdog, then every live worker. FAILED workers stay FAILED.
    void stop_all();

    /// Run one watchdog pass synchronously.
    void watchdog_tick();

    [[nodiscard]] std::vector<WorkerName> get_non_essential_running_names() const;
    [[nodiscard]] std::vector<WorkerName> get_paused_names() const;
    [[nodiscard]] std::map<WorkerName, WorkerStatus> status() const;
    [[nodiscard]] nlohmann::json status_json() const;

    [[nodiscard]] bool watchdog_running() const noexcept { return watchdog_running_.load(); }
    [[nodiscard]] std::filesystem::path heartbeat_path_for(const WorkerName& name) const;
    [[nodiscard]] std::filesystem::path stop_signal_path_for(const WorkerName& name) const;

private:
    bool start_worker_locked(WorkerProcess& worker);
    bool is_alive_locked(WorkerProcess& worker);
    void stop_worker_locked(WorkerProcess& worker);
    void handle_death_locked(WorkerProcess& worker);
    void update_active_gauge_locked();
    void start_watchdog();
    void stop_watchdog();
    void watchdog_loop(std::stop_token stop);

    SupervisorConfig config_;
    Logger logger_;
    MetricsCollector& metrics_;

    mutable std::mutex mutex_;
    std::map<WorkerName, WorkerProcess> workers_;

    std::atomic<bool> watchdog_running_{false};
    std::mutex loop_mutex_;
    std::condition_variable_any loop_cv_;
    std::jthread watchdog_thread_;
};

}  // namespace edge_sentinel
