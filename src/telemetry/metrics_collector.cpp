/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

namespace edge_sentinel {

void MetricsCollector::increment(std::string_view name, uint64_t delta) {
    std::lock_guard lock(mutex_);
    auto it = counters_.find(name);
    if (it == counters_.end()) {
        counters_.emplace(std::string(name), delta);
    } else {
        it->second += delta;
    }
}

void MetricsCollector::gauge(std::string_view name, double value) {
    std::lock_guard lock(mutex_);
    auto it = gauges_.find(name);
    if (it == gauges_.end()) {
        gauges_.emplace(std::string(name), value);
    } else {
        it->second = value;
    }
}

uint64_t MetricsCollector::get_counter(std::string_view name) const {
    std::lock_guard lock(mutex_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
}

std::optional<double> MetricsCollector::get_gauge(std::string_view name) const {
    std::lock_guard lock(mutex_);
    auto it = gauges_.find(name);
    if (it == gauges_.end()) return std::nullopt;
    return it->second;
}

nlohmann::json MetricsCollector::snapshot() const {
    std::lock_guard lock(mutex_);
    nlohmann::json counters = nlohmann::json::object();
    for (const auto& [name, value] : counters_) {
        counters[name] = value;
    }
    nlohmann::json gauges = nlohmann::json::object();
    for (const auto& [name, value] : gauges_) {
        gauges[name] = value;
    }
    return nlohmann::json{{"counters", std::move(counters)}, {"gauges", std::move(gauges)}};
}

void MetricsCollector::reset() {
    std::lock_guard lock(mutex_);
    counters_.clear();
    gauges_.clear();
}

}  // namespace edge_sentinel
