/**
 * @file mock_probe.cpp
 * @brief MockSystemProbe implementation: scripted readings for testing.
 * @author Dimitris Kafetzis
 */

#include "health/system_probe.hpp"

namespace edge_sentinel {

MockSystemProbe::MockSystemProbe() {
    // Idle Raspberry Pi 4
    static_sample_.cpu_percent = 25.0f;
    static_sample_.memory_percent = 40.0f;
    static_sample_.disk_percent = 30.0f;
    static_sample_.temperatures["cpu_thermal"] = {45.0f};
}

Result<RawSample> MockSystemProbe::sample() {
    std::lock_guard lock(mutex_);
    ++sample_count_;
    if (!queued_.empty()) {
        auto next = std::move(queued_.front());
        queued_.pop_front();
        return next;
    }
    return static_sample_;
}

void MockSystemProbe::push_sample(RawSample sample) {
    std::lock_guard lock(mutex_);
    queued_.emplace_back(std::move(sample));
}

void MockSystemProbe::push_error(Error error) {
    std::lock_guard lock(mutex_);
    queued_.emplace_back(std::move(error));
}

void MockSystemProbe::set_static_sample(RawSample sample) {
    std::lock_guard lock(mutex_);
    static_sample_ = std::move(sample);
}

void MockSystemProbe::set_cpu(float percent) {
    std::lock_guard lock(mutex_);
    static_sample_.cpu_percent = percent;
}

void MockSystemProbe::set_memory(float percent) {
    std::lock_guard lock(mutex_);
    static_sample_.memory_percent = percent;
}

void MockSystemProbe::set_temperature(const std::string& sensor, float celsius) {
    std::lock_guard lock(mutex_);
    static_sample_.temperatures[sensor] = {celsius};
}

void MockSystemProbe::clear_temperatures() {
    std::lock_guard lock(mutex_);
    static_sample_.temperatures.clear();
}

size_t MockSystemProbe::sample_count() const {
    std::lock_guard lock(mutex_);
    return sample_count_;
}

}  // namespace edge_sentinel
