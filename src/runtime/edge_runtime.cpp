/**
 * @file edge_runtime.cpp
 * @brief EdgeRuntime implementation.
 * @author Dimitris Kafetzis
 */

#include "runtime/edge_runtime.hpp"

#include <exception>

namespace edge_sentinel {

namespace {

std::unique_ptr<ISystemProbe> make_probe(std::unique_ptr<ISystemProbe> injected,
                                         const HealthConfig& health) {
    if (injected) return injected;
    LinuxSystemProbe::Paths paths;
    paths.disk_path = health.disk_path;
    return std::make_unique<LinuxSystemProbe>(std::move(paths));
}

}  // anonymous namespace

EdgeRuntime::EdgeRuntime(Options opts)
    : config_(std::move(opts.config))
    , logger_(std::move(opts.log_sink), opts.log_level, "runtime")
    , telemetry_(config_, logger_.with_component("telemetry"), metrics_, std::move(opts.transport))
    , supervisor_(config_.supervisor, logger_.with_component("supervisor"), metrics_)
    , health_(config_.health, make_probe(std::move(opts.probe), config_.health),
              logger_.with_component("health"), metrics_) {
    health_.on_overheat([this](const HealthStatus& status) { handle_overheat(status); });
    health_.on_recover([this](const HealthStatus& status) { handle_recover(status); });
}

EdgeRuntime::~EdgeRuntime() {
    shutdown();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> EdgeRuntime::start() {
    if (running_.exchange(true)) {
        return Error{ErrorCode::InvalidState, "Already running"};
    }

    logger_.info("EdgeSentinel starting: device=" + config_.device.id
                 + " endpoint=" + config_.telemetry.endpoint);
    for (const auto& warning : config_warnings(config_)) {
        logger_.warn(warning);
    }

    register_configured_workers();

    health_.start();
    telemetry_.start();

    for (const auto& [name, ok] : supervisor_.start_all()) {
        if (ok) {
            logger_.info("Worker '" + name + "' started");
        } else {
            logger_.error("Worker '" + name + "' failed to start");
        }
    }

    heartbeat_thread_ = std::jthread([this](std::stop_token stop) {
        heartbeat_loop(stop);
    });

    logger_.info("EdgeSentinel active");
    return Result<void>{};
}

void EdgeRuntime::shutdown() {
    if (!running_.exchange(false)) return;

    logger_.info("Graceful shutdown started");

    // Loop waits observe the stop_token and wake at once, so each join below
    // lasts at most as long as the blocking step its loop is in (a retry
    // delay or a worker's SIGTERM/SIGKILL wait).
    heartbeat_thread_.request_stop();
    loop_cv_.notify_all();
    if (heartbeat_thread_.joinable()) {
        heartbeat_thread_.join();
    }

    logger_.info("Stopping workers...");
    supervisor_.stop_all();

    logger_.info("Stopping health monitor...");
    health_.stop();

    telemetry_.send(nlohmann::json{
        {"event", "shutdown"},
        {"device_id", config_.device.id},
        {"reason", "graceful_shutdown"},
    });

    logger_.info("Stopping telemetry client...");
    telemetry_.stop();

    logger_.info("Final metrics: " + metrics_.snapshot().dump());
    logger_.info("Graceful shutdown complete");
    logger_.flush();
}

void EdgeRuntime::register_configured_workers() {
    for (const auto& worker : config_.workers) {
        auto registered = supervisor_.register_worker(worker);
        if (!registered) {
            logger_.error("Skipping worker '" + worker.name + "': " + registered.error().message);
        }
    }
}

// ─────────────────────────────────────────────
// Self-preservation callbacks
// ─────────────────────────────────────────────

void EdgeRuntime::handle_overheat(const HealthStatus& status) {
    auto names = supervisor_.get_non_essential_running_names();
    for (const auto& name : names) {
        if (supervisor_.pause(name)) {
            logger_.warn("Worker '" + name + "' paused for thermal protection");
        }
    }

    telemetry_.send(nlohmann::json{
        {"event", "overheat_protection"},
        {"temperature", status.temperature_celsius},
        {"paused_workers", names},
    });
}

void EdgeRuntime::handle_recover(const HealthStatus& status) {
    for (const auto& name : supervisor_.get_paused_names()) {
        if (supervisor_.resume(name)) {
            logger_.info("Worker '" + name + "' resumed after recovery");
        }
    }

    telemetry_.send(nlohmann::json{
        {"event", "temperature_recovered"},
        {"temperature", status.temperature_celsius},
    });
}

// ─────────────────────────────────────────────
// Heartbeat
// ─────────────────────────────────────────────

nlohmann::json EdgeRuntime::heartbeat_event(const HealthStatus& status) {
    return nlohmann::json{
        {"event", "heartbeat"},
        {"device_id", config_.device.id},
        {"cpu_percent", status.cpu_percent},
        {"memory_percent", status.memory_percent},
        {"temperature_celsius", status.temperature_celsius},
        {"disk_usage_percent", status.disk_percent},
        {"workers", supervisor_.status_json()},
        {"telemetry_stats", telemetry_.get_stats().to_json()},
    };
}

bool EdgeRuntime::emit_heartbeat() {
    auto status = health_.last_status();
    if (!status) return false;
    return telemetry_.send(heartbeat_event(*status));
}

void EdgeRuntime::heartbeat_loop(std::stop_token stop) {
    const auto interval = Milliseconds(config_.heartbeat.interval_ms);
    while (!stop.stop_requested()) {
        try {
            emit_heartbeat();
        } catch (const std::exception& e) {
            logger_.error(std::string("Heartbeat emit failed: ") + e.what());
        }

        std::unique_lock lock(loop_mutex_);
        loop_cv_.wait_for(lock, stop, interval, [] { return false; });
    }
}

}  // namespace edge_sentinel
