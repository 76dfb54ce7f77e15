/**
 * @file metrics_collector.hpp
 * @brief In-process counters and gauges shared by the runtime engines.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace edge_sentinel {

/**
 * @brief Thread-safe metrics sink.
 *
 * Counters are monotonic; gauges hold the last value written. Names are
 * free-form snake_case strings (e.g. "worker_restarts").
 */
class MetricsCollector {
public:
    MetricsCollector() = default;

    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    void increment(std::string_view name, uint64_t delta = 1);
    void gauge(std::string_view name, double value);

    [[nodiscard]] uint64_t get_counter(std::string_view name) const;
    [[nodiscard]] std::optional<double> get_gauge(std::string_view name) const;

    /// {"counters":{...},"gauges":{...}}
    [[nodiscard]] nlohmann::json snapshot() const;

    void reset();

private:
    mutable std::mutex mutex_;
    std::map<std::string, uint64_t, std::less<>> counters_;
    std::map<std::string, double, std::less<>> gauges_;
};

}  // namespace edge_sentinel
