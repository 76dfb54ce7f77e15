/**
 * @file health_monitor.hpp
 * @brief Periodic host health sampling with hysteretic overheat detection.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "health/system_probe.hpp"
#include "telemetry/metrics_collector.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace edge_sentinel {

/**
 * @brief Immutable snapshot produced once per sampling tick.
 *
 * temperature_celsius == 0.0 means no sensor was available.
 */
struct HealthStatus {
    float cpu_percent{0.0f};
    float memory_percent{0.0f};
    float disk_percent{0.0f};
    float temperature_celsius{0.0f};
    bool is_overheating{false};
    Timestamp timestamp{};

    [[nodiscard]] nlohmann::json to_json() const;
};

/// Sensors tried in order before falling back to the hottest reading.
inline const std::vector<std::string> kTemperaturePriority = {
    "cpu_thermal", "thermal_zone0", "coretemp", "k10temp"
};

/**
 * @brief Pick the CPU temperature from a set of sensor readings.
 *
 * The first priority sensor with a reading wins (its first reading).
 * Otherwise the maximum across all sensors. 0.0 if nothing positive.
 */
[[nodiscard]] float resolve_temperature(const std::map<std::string, std::vector<float>>& sensors);

using HealthCallback = std::function<void(const HealthStatus&)>;

/**
 * @brief Samples an ISystemProbe on an interval and reports overheat edges.
 *
 * on_overheat fires once per normal→overheating transition and on_recover
 * once per overheating→normal transition. CPU and memory breaches are
 * logged only.
 */
class HealthMonitor {
public:
    HealthMonitor(const HealthConfig& config,
                  std::unique_ptr<ISystemProbe> probe,
                  Logger logger,
                  MetricsCollector& metrics);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    void on_overheat(HealthCallback callback);
    void on_recover(HealthCallback callback);

    /// Latest snapshot, or nullptr before the first tick.
    [[nodiscard]] std::shared_ptr<const HealthStatus> last_status() const;
    [[nodiscard]] bool is_overheating() const noexcept { return overheating_.load(); }

    /// Run one sampling tick synchronously.
    Result<std::shared_ptr<const HealthStatus>> sample_now();

    /// {"status":…, "is_overheating":…, "thresholds":{…}, "samples":…}
    [[nodiscard]] nlohmann::json report() const;

    void start();
    void stop();
    [[nodiscard]] bool running() const noexcept { return running_.load(); }

private:
    void sampling_loop(std::stop_token stop);
    void fire(const std::vector<HealthCallback>& callbacks, const HealthStatus& status,
              std::string_view what);

    HealthConfig config_;
    std::unique_ptr<ISystemProbe> probe_;
    Logger logger_;
    MetricsCollector& metrics_;

    std::mutex sample_mutex_;
    std::atomic<std::shared_ptr<const HealthStatus>> latest_;
    std::atomic<bool> overheating_{false};
    std::atomic<bool> sensor_warning_logged_{false};
    std::atomic<uint64_t> samples_taken_{0};

    std::mutex callbacks_mutex_;
    std::vector<HealthCallback> overheat_callbacks_;
    std::vector<HealthCallback> recover_callbacks_;

    std::atomic<bool> running_{false};
    std::mutex loop_mutex_;
    std::condition_variable_any loop_cv_;
    std::jthread sampling_thread_;
};

}  // namespace edge_sentinel
