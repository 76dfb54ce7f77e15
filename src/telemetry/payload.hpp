/**
 * @file payload.hpp
 * @brief Immutable telemetry unit and its JSON form.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace edge_sentinel {

/**
 * @brief One telemetry message.
 *
 * JSON form: {"device_id":…, "timestamp":…, "data":…, "payload_id":…}.
 */
struct TelemetryPayload {
    DeviceId device_id;
    double timestamp{0.0};          ///< Epoch seconds
    nlohmann::json data;
    PayloadId payload_id;

    bool operator==(const TelemetryPayload&) const = default;
};

/// Random RFC 4122 version 4 identifier, lowercase hex.
std::string generate_payload_id();

/// Stamp @p data with the device id, the current time and a fresh id.
TelemetryPayload make_payload(const DeviceId& device_id, nlohmann::json data);

[[nodiscard]] nlohmann::json to_json(const TelemetryPayload& payload);

/**
 * @brief Parse the JSON form; missing or mistyped fields yield ErrorCode::Parse.
 */
Result<TelemetryPayload> payload_from_json(const nlohmann::json& json);

}  // namespace edge_sentinel
