/**
 * @file system_probe.hpp
 * @brief Raw host readings (CPU, memory, disk, temperature sensors).
 * @author Dimitris Kafetzis
 *
 * ISystemProbe is the seam between HealthMonitor and the host. The Linux
 * implementation reads pseudo-filesystems; the mock returns scripted samples.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace edge_sentinel {

/**
 * @brief One unprocessed probe reading.
 *
 * temperatures maps a sensor name (hwmon "name", thermal zone "type" or
 * directory) to its readings in °C, in sensor order.
 */
struct RawSample {
    float cpu_percent{0.0f};
    float memory_percent{0.0f};
    float disk_percent{0.0f};
    std::map<std::string, std::vector<float>> temperatures;
};

// ─────────────────────────────────────────────
// ISystemProbe (Virtual, runtime-configurable)
// ─────────────────────────────────────────────

class ISystemProbe {
public:
    virtual ~ISystemProbe() = default;

    virtual Result<RawSample> sample() = 0;
};

// ─────────────────────────────────────────────
// LinuxSystemProbe
// ─────────────────────────────────────────────

/**
 * @brief Reads system resources from Linux pseudo-filesystems.
 *
 * Data sources:
 *   <proc_root>/stat           CPU utilization (delta between samples)
 *   <proc_root>/meminfo        MemTotal / MemAvailable
 *   statvfs(<disk_path>)       disk usage
 *   <sys_class_root>/hwmon     temp<N>_input per chip, keyed by "name"
 *   <sys_class_root>/thermal   thermal_zone<N>/temp, keyed by "type"
 *
 * Roots are configurable so tests can point at a fake tree.
 */
class LinuxSystemProbe : public ISystemProbe {
public:
    struct Paths {
        std::filesystem::path proc_root = "/proc";
        std::filesystem::path sys_class_root = "/sys/class";
        std::filesystem::path disk_path = "/";
    };

    LinuxSystemProbe();
    explicit LinuxSystemProbe(Paths paths);

    Result<RawSample> sample() override;

    struct CpuTimes {
        uint64_t user{0}, nice{0}, system{0}, idle{0};
        uint64_t iowait{0}, irq{0}, softirq{0}, steal{0};
    };

private:
    float sample_cpu();
    std::map<std::string, std::vector<float>> read_temperatures() const;

    Paths paths_;
    CpuTimes prev_cpu_times_{};
};

// ─────────────────────────────────────────────
// MockSystemProbe
// ─────────────────────────────────────────────

/**
 * @brief Scripted probe for tests.
 *
 * Queued samples (and queued errors) are returned first, in order; once the
 * queue is empty the static sample is returned on every call.
 */
class MockSystemProbe : public ISystemProbe {
public:
    MockSystemProbe();

    Result<RawSample> sample() override;

    void push_sample(RawSample sample);
    void push_error(Error error);
    void set_static_sample(RawSample sample);

    void set_cpu(float percent);
    void set_memory(float percent);
    void set_temperature(const std::string& sensor, float celsius);
    void clear_temperatures();

    [[nodiscard]] size_t sample_count() const;

private:
    mutable std::mutex mutex_;
    std::deque<Result<RawSample>> queued_;
    RawSample static_sample_;
    size_t sample_count_{0};
};

}  // namespace edge_sentinel
