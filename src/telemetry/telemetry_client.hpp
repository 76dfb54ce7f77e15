/**
 * @file telemetry_client.hpp
 * @brief Store-and-forward telemetry client.
 *
 * send() tries the transport under retry and a circuit breaker; anything not
 * delivered lands in the TelemetryBuffer and is drained oldest-first by a
 * periodic flush loop.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "telemetry/circuit_breaker.hpp"
#include "telemetry/metrics_collector.hpp"
#include "telemetry/payload.hpp"
#include "telemetry/telemetry_buffer.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

namespace edge_sentinel {

/**
 * @brief Delivery mechanism. Connection/Timeout/Io errors are retried.
 */
using TelemetryTransport = std::function<Result<void>(const TelemetryPayload&)>;

struct TelemetryStats {
    DeviceId device_id;
    std::string endpoint;
    CircuitState circuit_state{CircuitState::Closed};
    size_t buffered_count{0};
    std::filesystem::path buffer_dir;
    uint64_t buffered_bytes{0};
    uint64_t sent_ok{0};
    uint64_t send_failed{0};
    uint64_t circuit_open{0};
    uint64_t buffered{0};
    uint64_t flushed{0};
    uint64_t quarantined{0};

    [[nodiscard]] nlohmann::json to_json() const;
};

class TelemetryClient {
public:
    TelemetryClient(const Config& config,
                    Logger logger,
                    MetricsCollector& metrics,
                    TelemetryTransport transport = {});
    ~TelemetryClient();

    TelemetryClient(const TelemetryClient&) = delete;
    TelemetryClient& operator=(const TelemetryClient&) = delete;

    /**
     * @brief Wrap @p data in a payload and deliver it.
     * @return true if delivered now; false if it was buffered instead.
     */
    bool send(nlohmann::json data);

    /**
     * @brief Resend up to flush_batch_size buffered payloads, oldest first.
     * @return Number of payloads delivered and removed from the buffer.
     */
    size_t flush();

    void start();
    void stop();
    [[nodiscard]] bool running() const noexcept { return running_.load(); }

    [[nodiscard]] TelemetryStats get_stats();
    [[nodiscard]] CircuitState circuit_state() { return breaker_.state(); }

    [[nodiscard]] CircuitBreaker& breaker() noexcept { return breaker_; }
    [[nodiscard]] TelemetryBuffer& buffer() noexcept { return buffer_; }

private:
    Result<void> send_with_retry(const TelemetryPayload& payload);
    void store_locally(const TelemetryPayload& payload);
    void flush_loop(std::stop_token stop);

    DeviceId device_id_;
    TelemetryConfig telemetry_config_;
    RetryConfig retry_config_;
    Logger logger_;
    MetricsCollector& metrics_;
    TelemetryTransport transport_;
    CircuitBreaker breaker_;
    TelemetryBuffer buffer_;

    std::atomic<bool> running_{false};
    std::mutex loop_mutex_;
    std::condition_variable_any loop_cv_;
    std::jthread flush_thread_;
};

}  // namespace edge_sentinel
