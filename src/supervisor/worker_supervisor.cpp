/**
 * @file worker_supervisor.cpp
 * @brief WorkerSupervisor implementation: spawn, watchdog, zombie detection.
 */

#include "supervisor/worker_supervisor.hpp"

#include <signal.h>

#include <chrono>
#include <exception>
#include <fstream>
#include <system_error>

namespace edge_sentinel {

namespace fs = std::filesystem;

namespace {

constexpr auto kTermGrace = std::chrono::seconds(5);
constexpr auto kKillWait = std::chrono::seconds(2);

bool touch_file(const fs::path& path) {
    {
        std::ofstream out(path, std::ios::app);
        if (!out) return false;
    }
    std::error_code ec;
    fs::last_write_time(path, fs::file_time_type::clock::now(), ec);
    return !ec;
}

void remove_file(const std::optional<fs::path>& path) {
    if (!path) return;
    std::error_code ec;
    fs::remove(*path, ec);
}

std::string pid_text(const WorkerProcess& worker) {
    auto pid = worker.pid();
    return pid ? std::to_string(*pid) : std::string("-");
}

}  // anonymous namespace

WorkerSupervisor::WorkerSupervisor(const SupervisorConfig& config, Logger logger, MetricsCollector& metrics)
    : config_(config), logger_(std::move(logger)), metrics_(metrics) {
    std::error_code ec;
    fs::create_directories(config_.heartbeat_dir, ec);
    if (ec) {
        logger_.warn("Cannot create heartbeat directory " + config_.heartbeat_dir.string()
                     + ": " + ec.message());
    }
}

WorkerSupervisor::~WorkerSupervisor() {
    stop_all();
}

fs::path WorkerSupervisor::heartbeat_path_for(const WorkerName& name) const {
    return config_.heartbeat_dir / ("edge_sentinel_" + name + ".beat");
}

fs::path WorkerSupervisor::stop_signal_path_for(const WorkerName& name) const {
    return config_.heartbeat_dir / ("edge_sentinel_" + name + ".stop");
}

// ─────────────────────────────────────────────
// Registration
// ─────────────────────────────────────────────

Result<void> WorkerSupervisor::register_worker(const WorkerName& name,
                                               std::vector<std::string> command,
                                               bool essential,
                                               std::optional<uint32_t> max_restarts,
                                               bool heartbeat_enabled) {
    if (name.empty() || name.find('/') != std::string::npos) {
        return Error{ErrorCode::Config, "invalid worker name '" + name + "'"};
    }
    if (command.empty() || command.front().empty()) {
        return Error{ErrorCode::Config, "worker '" + name + "' has an empty command"};
    }
    uint32_t ceiling = max_restarts.value_or(config_.default_max_restarts);

    std::lock_guard lock(mutex_);
    if (workers_.contains(name)) {
        return Error{ErrorCode::DuplicateName, "worker '" + name + "' is already registered"};
    }

    WorkerProcess worker;
    worker.name = name;
    worker.command = std::move(command);
    worker.essential = essential;
    worker.max_restarts = ceiling;
    worker.heartbeat_enabled = heartbeat_enabled;
    worker.stop_signal_path = stop_signal_path_for(name);
    if (heartbeat_enabled) {
        worker.heartbeat_path = heartbeat_path_for(name);
    }

    std::string argv_text;
    for (const auto& arg : worker.command) {
        if (!argv_text.empty()) argv_text += ' ';
        argv_text += arg;
    }
    logger_.info("Worker registered: " + name + " -> " + argv_text
                 + (essential ? " (essential)" : "")
                 + (heartbeat_enabled ? " (heartbeat)" : ""));

    workers_.emplace(name, std::move(worker));
    return Result<void>{};
}

Result<void> WorkerSupervisor::register_worker(const WorkerConfig& worker) {
    return register_worker(worker.name, worker.command, worker.essential,
                           worker.max_restarts, worker.heartbeat);
}

// ─────────────────────────────────────────────
// Start
// ─────────────────────────────────────────────

std::map<WorkerName, bool> WorkerSupervisor::start_all() {
    std::map<WorkerName, bool> results;
    {
        std::lock_guard lock(mutex_);
        for (auto& [name, worker] : workers_) {
            if (worker.state == WorkerState::Stopped) {
                results[name] = start_worker_locked(worker);
            }
        }
    }
    start_watchdog();
    return results;
}

bool WorkerSupervisor::start_worker_locked(WorkerProcess& worker) {
    worker.process.reset();
    remove_file(worker.stop_signal_path);

    SpawnOptions options;
    options.argv = worker.command;
    options.working_dir = config_.working_dir;
    options.extra_env[kWorkerNameEnv] = worker.name;
    if (worker.stop_signal_path) {
        options.extra_env[kStopSignalEnv] = worker.stop_signal_path->string();
    }
    if (worker.heartbeat_enabled && worker.heartbeat_path) {
        remove_file(worker.heartbeat_path);
        if (!touch_file(*worker.heartbeat_path)) {
            logger_.warn("Cannot create heartbeat file " + worker.heartbeat_path->string()
                         + " for worker '" + worker.name + "'");
        }
        options.extra_env[kHeartbeatFileEnv] = worker.heartbeat_path->string();
    }
    if (!config_.capture_dir.empty()) {
        std::error_code ec;
        fs::create_directories(config_.capture_dir, ec);
        options.stdout_path = config_.capture_dir / (worker.name + ".stdout.log");
        options.stderr_path = config_.capture_dir / (worker.name + ".stderr.log");
    }

    auto spawned = ChildProcess::spawn(options);
    if (!spawned) {
        logger_.error("Failed to start worker '" + worker.name + "': " + spawned.error().message);
        remove_file(worker.heartbeat_path);
        if (auto moved = worker.transition_to(WorkerState::Failed); !moved) {
            logger_.error(moved.error().message);
        }
        update_active_gauge_locked();
        return false;
    }

    worker.process = std::move(*spawned);
    if (auto moved = worker.transition_to(WorkerState::Running); !moved) {
        logger_.error(moved.error().message);
        return false;
    }
    update_active_gauge_locked();
    logger_.info("Worker '" + worker.name + "' started with PID " + pid_text(worker));
    return true;
}

// ─────────────────────────────────────────────
// Liveness
// ─────────────────────────────────────────────

bool WorkerSupervisor::check_alive(const WorkerName& name) {
    std::lock_guard lock(mutex_);
    auto it = workers_.find(name);
    if (it == workers_.end()) return false;

    auto& worker = it->second;
    switch (worker.state) {
        case WorkerState::Running:
            return is_alive_locked(worker);
        case WorkerState::Paused:
            // A stopped process cannot beat; only OS liveness applies.
            return worker.process && worker.process->running();
        default:
            return false;
    }
}

bool WorkerSupervisor::is_alive_locked(WorkerProcess& worker) {
    if (!worker.process || !worker.process->running()) {
        return false;
    }
    if (!worker.heartbeat_enabled || !worker.heartbeat_path) {
        return true;
    }

    std::error_code ec;
    auto last_beat = fs::last_write_time(*worker.heartbeat_path, ec);
    if (ec) {
        logger_.debug("Heartbeat file for '" + worker.name + "' is missing; assuming alive");
        return true;
    }

    auto age = fs::file_time_type::clock::now() - last_beat;
    if (age <= Milliseconds(config_.heartbeat_stale_after_ms)) {
        return true;
    }

    auto age_s = std::chrono::duration_cast<std::chrono::seconds>(age).count();
    logger_.error("ZOMBIE DETECTED: worker '" + worker.name + "' (PID " + pid_text(worker)
                  + ") has not beaten for " + std::to_string(age_s) + "s; terminating");
    metrics_.increment("worker_zombies");

    if (worker.stop_signal_path && !touch_file(*worker.stop_signal_path)) {
        logger_.debug("Cannot touch stop file for '" + worker.name + "'");
    }
    if (!worker.process->terminate(kTermGrace, kKillWait)) {
        logger_.error("Zombie worker '" + worker.name + "' survived SIGKILL");
    }
    remove_file(worker.heartbeat_path);
    remove_file(worker.stop_signal_path);
    return false;
}

// ─────────────────────────────────────────────
// Watchdog
// ─────────────────────────────────────────────

void WorkerSupervisor::watchdog_tick() {
    std::lock_guard lock(mutex_);
    for (auto& [name, worker] : workers_) {
        if (worker.state != WorkerState::Running) continue;
        if (!is_alive_locked(worker)) {
            handle_death_locked(worker);
        }
    }
}

void WorkerSupervisor::handle_death_locked(WorkerProcess& worker) {
    std::string cause = "no longer running";
    if (worker.process) {
        if (auto status = worker.process->wait_status()) {
            cause = describe_wait_status(*status);
        }
    }

    ++worker.restart_count;
    metrics_.increment("worker_restarts");
    logger_.warn("Worker '" + worker.name + "' (PID " + pid_text(worker) + ") died (" + cause
                 + "). Restart " + std::to_string(worker.restart_count) + "/"
                 + std::to_string(worker.max_restarts));

    if (auto moved = worker.transition_to(WorkerState::Restarting); !moved) {
        logger_.error(moved.error().message);
        return;
    }

    if (worker.restart_count >= worker.max_restarts) {
        worker.process.reset();
        remove_file(worker.heartbeat_path);
        remove_file(worker.stop_signal_path);
        if (auto moved = worker.transition_to(WorkerState::Failed); !moved) {
            logger_.error(moved.error().message);
        }
        update_active_gauge_locked();
        logger_.error("Worker '" + worker.name + "' reached its restart limit ("
                      + std::to_string(worker.max_restarts) + "); marked FAILED");
        return;
    }

    start_worker_locked(worker);
}

void WorkerSupervisor::start_watchdog() {
    if (watchdog_running_.exchange(true)) return;
    watchdog_thread_ = std::jthread([this](std::stop_token stop) {
        watchdog_loop(stop);
    });
    logger_.info("Watchdog started (interval " + std::to_string(config_.watchdog_interval_ms) + " ms)");
}

void WorkerSupervisor::stop_watchdog() {
    if (!watchdog_running_.exchange(false)) return;
    watchdog_thread_.request_stop();
    loop_cv_.notify_all();
    if (watchdog_thread_.joinable()) {
        watchdog_thread_.join();
    }
    logger_.info("Watchdog stopped");
}

void WorkerSupervisor::watchdog_loop(std::stop_token stop) {
    const auto interval = Milliseconds(config_.watchdog_interval_ms);
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(loop_mutex_);
            loop_cv_.wait_for(lock, stop, interval, [] { return false; });
        }
        if (stop.stop_requested()) break;

        try {
            watchdog_tick();
        } catch (const std::exception& e) {
            logger_.error(std::string("Watchdog pass failed: ") + e.what());
        }
    }
}

// ─────────────────────────────────────────────
// Pause / Resume
// ─────────────────────────────────────────────

bool WorkerSupervisor::pause(const WorkerName& name) {
    std::lock_guard lock(mutex_);
    auto it = workers_.find(name);
    if (it == workers_.end()) {
        logger_.warn("Cannot pause unknown worker '" + name + "'");
        return false;
    }
    auto& worker = it->second;
    if (worker.essential) {
        logger_.warn("Worker '" + name + "' is essential and cannot be paused");
        return false;
    }
    if (worker.state != WorkerState::Running || !worker.process) {
        return false;
    }

    if (auto sent = worker.process->send_signal(SIGSTOP); !sent) {
        logger_.warn("Cannot pause '" + name + "': " + sent.error().message);
        return false;
    }
    if (auto moved = worker.transition_to(WorkerState::Paused); !moved) {
        logger_.error(moved.error().message);
        return false;
    }
    update_active_gauge_locked();
    logger_.info("Worker '" + name + "' paused (PID " + pid_text(worker) + ")");
    return true;
}

bool WorkerSupervisor::resume(const WorkerName& name) {
    std::lock_guard lock(mutex_);
    auto it = workers_.find(name);
    if (it == workers_.end() || it->second.state != WorkerState::Paused) {
        return false;
    }
    auto& worker = it->second;
    if (!worker.process) return false;

    // Died while stopped; the watchdog skips PAUSED workers, so account for it here.
    if (!worker.process->running()) {
        if (auto moved = worker.transition_to(WorkerState::Running); !moved) {
            logger_.error(moved.error().message);
            return false;
        }
        handle_death_locked(worker);
        return worker.state == WorkerState::Running;
    }

    if (auto sent = worker.process->send_signal(SIGCONT); !sent) {
        logger_.warn("Cannot resume '" + name + "': " + sent.error().message);
        return false;
    }
    if (auto moved = worker.transition_to(WorkerState::Running); !moved) {
        logger_.error(moved.error().message);
        return false;
    }
    update_active_gauge_locked();
    logger_.info("Worker '" + name + "' resumed (PID " + pid_text(worker) + ")");
    return true;
}

// ─────────────────────────────────────────────
// Stop
// ─────────────────────────────────────────────

Result<void> WorkerSupervisor::stop(const WorkerName& name) {
    std::lock_guard lock(mutex_);
    auto it = workers_.find(name);
    if (it == workers_.end()) {
        return Error{ErrorCode::NotFound, "unknown worker '" + name + "'"};
    }
    stop_worker_locked(it->second);
    return Result<void>{};
}

void WorkerSupervisor::stop_all() {
    stop_watchdog();
    std::lock_guard lock(mutex_);
    for (auto& [name, worker] : workers_) {
        stop_worker_locked(worker);
    }
    if (!workers_.empty()) {
        logger_.info("All workers stopped");
    }
}

void WorkerSupervisor::stop_worker_locked(WorkerProcess& worker) {
    if (worker.state == WorkerState::Stopped || worker.state == WorkerState::Failed) {
        return;
    }

    try {
        if (worker.stop_signal_path && !touch_file(*worker.stop_signal_path)) {
            logger_.debug("Cannot touch stop file for '" + worker.name + "'");
        }
        if (worker.process && worker.process->running()) {
            if (worker.state == WorkerState::Paused) {
                if (auto sent = worker.process->send_signal(SIGCONT); !sent) {
                    logger_.debug(sent.error().message);
                }
            }
            if (!worker.process->terminate(kTermGrace, kKillWait)) {
                logger_.error("Worker '" + worker.name + "' (PID " + pid_text(worker)
                              + ") did not exit after SIGKILL");
            }
        }
    } catch (const std::exception& e) {
        logger_.error("Error while stopping '" + worker.name + "': " + e.what());
    }

    worker.process.reset();
    remove_file(worker.heartbeat_path);
    remove_file(worker.stop_signal_path);
    if (auto moved = worker.transition_to(WorkerState::Stopped); !moved) {
        logger_.error(moved.error().message);
    }
    update_active_gauge_locked();
    logger_.info("Worker '" + worker.name + "' stopped");
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

void WorkerSupervisor::update_active_gauge_locked() {
    size_t active = 0;
    for (const auto& [name, worker] : workers_) {
        if (worker.state == WorkerState::Running) ++active;
    }
    metrics_.gauge("workers_active", static_cast<double>(active));
}

std::vector<WorkerName> WorkerSupervisor::get_non_essential_running_names() const {
    std::lock_guard lock(mutex_);
    std::vector<WorkerName> names;
    for (const auto& [name, worker] : workers_) {
        if (!worker.essential && worker.state == WorkerState::Running) {
            names.push_back(name);
        }
    }
    return names;
}

std::vector<WorkerName> WorkerSupervisor::get_paused_names() const {
    std::lock_guard lock(mutex_);
    std::vector<WorkerName> names;
    for (const auto& [name, worker] : workers_) {
        if (worker.state == WorkerState::Paused) {
            names.push_back(name);
        }
    }
    return names;
}

std::map<WorkerName, WorkerStatus> WorkerSupervisor::status() const {
    std::lock_guard lock(mutex_);
    std::map<WorkerName, WorkerStatus> out;
    for (const auto& [name, worker] : workers_) {
        out[name] = WorkerStatus{worker.state, worker.pid(), worker.restart_count, worker.essential};
    }
    return out;
}

nlohmann::json WorkerSupervisor::status_json() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [name, st] : status()) {
        out[name] = {
            {"state", std::string(to_string(st.state))},
            {"pid", st.pid ? nlohmann::json(*st.pid) : nlohmann::json(nullptr)},
            {"restart_count", st.restart_count},
            {"essential", st.essential},
        };
    }
    return out;
}

}  // namespace edge_sentinel
