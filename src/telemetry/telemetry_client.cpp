/**
 * @file telemetry_client.cpp
 * @brief TelemetryClient implementation.
 */

#include "telemetry/telemetry_client.hpp"

#include <chrono>
#include <exception>

namespace edge_sentinel {

nlohmann::json TelemetryStats::to_json() const {
    return nlohmann::json{
        {"device_id", device_id},
        {"endpoint", endpoint},
        {"circuit_state", std::string(to_string(circuit_state))},
        {"buffered_count", buffered_count},
        {"buffer_dir", buffer_dir.string()},
        {"buffered_bytes", buffered_bytes},
        {"sent_ok", sent_ok},
        {"send_failed", send_failed},
        {"circuit_open", circuit_open},
        {"buffered", buffered},
        {"flushed", flushed},
        {"quarantined", quarantined},
    };
}

TelemetryClient::TelemetryClient(const Config& config,
                                 Logger logger,
                                 MetricsCollector& metrics,
                                 TelemetryTransport transport)
    : device_id_(config.device.id)
    , telemetry_config_(config.telemetry)
    , retry_config_(config.retry)
    , logger_(std::move(logger))
    , metrics_(metrics)
    , transport_(std::move(transport))
    , breaker_(config.circuit, "telemetry")
    , buffer_(config.buffer, logger_.with_component("buffer"), metrics) {
    if (!transport_) {
        transport_ = [logger = logger_, endpoint = telemetry_config_.endpoint](
                         const TelemetryPayload& payload) -> Result<void> {
            logger.debug("Delivered payload " + payload.payload_id + " to " + endpoint);
            return Result<void>{};
        };
    }
}

TelemetryClient::~TelemetryClient() {
    stop();
}

bool TelemetryClient::send(nlohmann::json data) {
    auto payload = make_payload(device_id_, std::move(data));
    auto result = send_with_retry(payload);

    if (result) {
        metrics_.increment("telemetry_sent_ok");
        logger_.debug("Telemetry sent: " + payload.payload_id);
        return true;
    }

    store_locally(payload);
    if (result.error().code == ErrorCode::CircuitOpen) {
        metrics_.increment("telemetry_circuit_open");
        logger_.warn("Circuit open, telemetry buffered: " + payload.payload_id);
    } else {
        metrics_.increment("telemetry_send_failed");
        logger_.error("Send failed (" + std::string(to_string(result.error().code)) + ": "
                      + result.error().message + "), telemetry buffered: " + payload.payload_id);
    }
    return false;
}

Result<void> TelemetryClient::send_with_retry(const TelemetryPayload& payload) {
    auto delay = Milliseconds(retry_config_.initial_delay_ms);
    Error last_error{ErrorCode::Internal, "no delivery attempt made"};

    for (uint32_t attempt = 1; attempt <= retry_config_.max_attempts; ++attempt) {
        if (!breaker_.may_attempt()) {
            return Error{ErrorCode::CircuitOpen, "circuit '" + breaker_.name() + "' is open"};
        }

        Result<void> result = Error{ErrorCode::Internal, "transport not invoked"};
        try {
            result = transport_(payload);
        } catch (const std::exception& e) {
            result = Error{ErrorCode::Internal, std::string("transport threw: ") + e.what()};
        }

        if (result) {
            breaker_.record_success();
            return Result<void>{};
        }

        last_error = result.error();
        if (!is_transient(last_error.code)) {
            return last_error;
        }
        breaker_.record_failure(last_error);
        logger_.debug("Delivery attempt " + std::to_string(attempt) + "/"
                      + std::to_string(retry_config_.max_attempts) + " failed: "
                      + last_error.message);

        if (attempt < retry_config_.max_attempts) {
            std::this_thread::sleep_for(delay);
            delay *= 2;
        }
    }
    return last_error;
}

void TelemetryClient::store_locally(const TelemetryPayload& payload) {
    try {
        auto result = buffer_.insert(payload);
        if (!result) {
            logger_.error("Cannot buffer payload " + payload.payload_id + ": "
                          + result.error().message);
            return;
        }
        metrics_.increment("telemetry_buffered");
    } catch (const std::exception& e) {
        logger_.error("Cannot buffer payload " + payload.payload_id + ": " + e.what());
    }
}

size_t TelemetryClient::flush() {
    if (breaker_.state() == CircuitState::Open) {
        logger_.debug("Flush skipped: circuit open");
        return 0;
    }

    auto records = buffer_.oldest(telemetry_config_.flush_batch_size);
    size_t flushed = 0;

    for (const auto& record : records) {
        auto result = send_with_retry(record.payload);
        if (!result) {
            if (result.error().code == ErrorCode::CircuitOpen) {
                logger_.debug("Circuit opened during flush, stopping batch");
                break;
            }
            logger_.warn("Resend of " + record.payload.payload_id + " failed: "
                         + result.error().message);
            continue;
        }

        if (auto removed = buffer_.remove(record.id); !removed) {
            logger_.error("Delivered " + record.payload.payload_id
                          + " but could not remove it from the buffer: " + removed.error().message);
        }
        ++flushed;
        metrics_.increment("telemetry_flushed");
        logger_.info("Resent buffered payload " + record.payload.payload_id);
    }

    if (flushed > 0) {
        logger_.info("Flush complete: " + std::to_string(flushed) + " payloads resent");
    }
    return flushed;
}

void TelemetryClient::start() {
    if (running_.exchange(true)) {
        logger_.warn("TelemetryClient already running");
        return;
    }
    flush_thread_ = std::jthread([this](std::stop_token stop) {
        flush_loop(stop);
    });
    logger_.info("Telemetry client started (endpoint " + telemetry_config_.endpoint + ", buffer "
                 + buffer_.dir().string() + ")");
}

void TelemetryClient::stop() {
    if (!running_.exchange(false)) return;
    flush_thread_.request_stop();
    loop_cv_.notify_all();
    if (flush_thread_.joinable()) {
        flush_thread_.join();
    }
    logger_.info("Telemetry client stopped");
}

void TelemetryClient::flush_loop(std::stop_token stop) {
    const auto interval = Milliseconds(telemetry_config_.flush_interval_ms);
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(loop_mutex_);
            loop_cv_.wait_for(lock, stop, interval, [] { return false; });
        }
        if (stop.stop_requested()) break;

        try {
            auto pending = buffer_.count();
            if (pending > 0) {
                logger_.info("Flush loop: " + std::to_string(pending) + " payloads buffered");
                flush();
            }
        } catch (const std::exception& e) {
            logger_.error(std::string("Flush loop error: ") + e.what());
        }
    }
}

TelemetryStats TelemetryClient::get_stats() {
    TelemetryStats stats;
    stats.device_id = device_id_;
    stats.endpoint = telemetry_config_.endpoint;
    stats.circuit_state = breaker_.state();
    stats.buffered_count = buffer_.count();
    stats.buffer_dir = buffer_.dir();
    stats.buffered_bytes = buffer_.total_bytes();
    stats.sent_ok = metrics_.get_counter("telemetry_sent_ok");
    stats.send_failed = metrics_.get_counter("telemetry_send_failed");
    stats.circuit_open = metrics_.get_counter("telemetry_circuit_open");
    stats.buffered = metrics_.get_counter("telemetry_buffered");
    stats.flushed = metrics_.get_counter("telemetry_flushed");
    stats.quarantined = metrics_.get_counter("telemetry_quarantined");
    return stats;
}

}  // namespace edge_sentinel
