/**
 * @file health_monitor.cpp
 * @brief HealthMonitor implementation.
 * @author Dimitris Kafetzis
 */

#include "health/health_monitor.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iomanip>
#include <sstream>

namespace edge_sentinel {

namespace {

std::string fixed1(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value;
    return oss.str();
}

}  // anonymous namespace

nlohmann::json HealthStatus::to_json() const {
    return nlohmann::json{
        {"cpu_percent", cpu_percent},
        {"memory_percent", memory_percent},
        {"disk_usage_percent", disk_percent},
        {"temperature_celsius", temperature_celsius},
        {"is_overheating", is_overheating},
        {"timestamp", to_epoch_seconds(timestamp)},
    };
}

float resolve_temperature(const std::map<std::string, std::vector<float>>& sensors) {
    for (const auto& name : kTemperaturePriority) {
        auto it = sensors.find(name);
        if (it != sensors.end() && !it->second.empty()) {
            return it->second.front();
        }
    }

    float hottest = 0.0f;
    for (const auto& [name, readings] : sensors) {
        for (float celsius : readings) {
            hottest = std::max(hottest, celsius);
        }
    }
    return hottest > 0.0f ? hottest : 0.0f;
}

HealthMonitor::HealthMonitor(const HealthConfig& config,
                             std::unique_ptr<ISystemProbe> probe,
                             Logger logger,
                             MetricsCollector& metrics)
    : config_(config)
    , probe_(std::move(probe))
    , logger_(std::move(logger))
    , metrics_(metrics) {}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::on_overheat(HealthCallback callback) {
    std::lock_guard lock(callbacks_mutex_);
    overheat_callbacks_.push_back(std::move(callback));
}

void HealthMonitor::on_recover(HealthCallback callback) {
    std::lock_guard lock(callbacks_mutex_);
    recover_callbacks_.push_back(std::move(callback));
}

std::shared_ptr<const HealthStatus> HealthMonitor::last_status() const {
    return latest_.load();
}

Result<std::shared_ptr<const HealthStatus>> HealthMonitor::sample_now() {
    std::lock_guard sample_lock(sample_mutex_);

    auto raw = probe_->sample();
    if (!raw) {
        logger_.error("Health probe failed: " + raw.error().message);
        return raw.error();
    }

    auto status = std::make_shared<HealthStatus>();
    status->cpu_percent = raw->cpu_percent;
    status->memory_percent = raw->memory_percent;
    status->disk_percent = raw->disk_percent;
    status->temperature_celsius = resolve_temperature(raw->temperatures);
    status->timestamp = std::chrono::system_clock::now();

    if (status->temperature_celsius <= 0.0f) {
        status->temperature_celsius = 0.0f;
        if (!sensor_warning_logged_.exchange(true)) {
            logger_.warn("No temperature sensor available; reporting 0.0 and "
                         "disabling overheat protection until one appears");
        }
    }

    status->is_overheating = status->temperature_celsius > 0.0f
                          && status->temperature_celsius >= config_.temp_threshold_c;

    metrics_.gauge("system_cpu_percent", status->cpu_percent);
    metrics_.gauge("system_memory_percent", status->memory_percent);
    metrics_.gauge("system_disk_percent", status->disk_percent);
    metrics_.gauge("system_temperature_celsius", status->temperature_celsius);

    if (status->cpu_percent >= config_.cpu_threshold_percent) {
        logger_.warn("CPU usage high: " + fixed1(status->cpu_percent) + "% (threshold "
                     + fixed1(config_.cpu_threshold_percent) + "%)");
    }
    if (status->memory_percent >= config_.memory_threshold_percent) {
        logger_.warn("Memory usage high: " + fixed1(status->memory_percent) + "% (threshold "
                     + fixed1(config_.memory_threshold_percent) + "%)");
    }

    std::shared_ptr<const HealthStatus> published = status;
    latest_.store(published);
    ++samples_taken_;

    bool was_overheating = overheating_.exchange(status->is_overheating);
    if (status->is_overheating && !was_overheating) {
        metrics_.increment("overheat_events");
        logger_.warn("Overheat detected: " + fixed1(status->temperature_celsius) + "°C >= "
                     + fixed1(config_.temp_threshold_c) + "°C");
        std::vector<HealthCallback> callbacks;
        {
            std::lock_guard lock(callbacks_mutex_);
            callbacks = overheat_callbacks_;
        }
        fire(callbacks, *status, "on_overheat");
    } else if (!status->is_overheating && was_overheating) {
        metrics_.increment("recovery_events");
        logger_.info("Temperature recovered: " + fixed1(status->temperature_celsius) + "°C");
        std::vector<HealthCallback> callbacks;
        {
            std::lock_guard lock(callbacks_mutex_);
            callbacks = recover_callbacks_;
        }
        fire(callbacks, *status, "on_recover");
    }

    return published;
}

void HealthMonitor::fire(const std::vector<HealthCallback>& callbacks,
                         const HealthStatus& status,
                         std::string_view what) {
    for (const auto& callback : callbacks) {
        try {
            callback(status);
        } catch (const std::exception& e) {
            logger_.error(std::string(what) + " callback threw: " + e.what());
        }
    }
}

nlohmann::json HealthMonitor::report() const {
    auto status = latest_.load();
    return nlohmann::json{
        {"status", status ? status->to_json() : nlohmann::json(nullptr)},
        {"is_overheating", overheating_.load()},
        {"samples", samples_taken_.load()},
        {"thresholds", {
            {"temperature_celsius", config_.temp_threshold_c},
            {"cpu_percent", config_.cpu_threshold_percent},
            {"memory_percent", config_.memory_threshold_percent},
        }},
        {"interval_ms", config_.interval_ms},
    };
}

void HealthMonitor::start() {
    if (running_.exchange(true)) {
        logger_.warn("HealthMonitor already running");
        return;
    }
    sampling_thread_ = std::jthread([this](std::stop_token stop) {
        sampling_loop(stop);
    });
    logger_.info("Health monitor started (interval " + std::to_string(config_.interval_ms)
                 + " ms, temp threshold " + fixed1(config_.temp_threshold_c) + "°C)");
}

void HealthMonitor::stop() {
    if (!running_.exchange(false)) return;
    sampling_thread_.request_stop();
    loop_cv_.notify_all();
    if (sampling_thread_.joinable()) {
        sampling_thread_.join();
    }
    logger_.info("Health monitor stopped");
}

void HealthMonitor::sampling_loop(std::stop_token stop) {
    const auto interval = Milliseconds(config_.interval_ms);
    while (!stop.stop_requested()) {
        try {
            // Probe failures are logged by sample_now; the loop keeps going.
            (void)sample_now();
        } catch (const std::exception& e) {
            logger_.error(std::string("Health sampling error: ") + e.what());
        }

        std::unique_lock lock(loop_mutex_);
        loop_cv_.wait_for(lock, stop, interval, [] { return false; });
    }
}

}  // namespace edge_sentinel
