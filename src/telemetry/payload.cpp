/**
 * @file payload.cpp
 * @brief TelemetryPayload construction and serialization.
 */

#include "telemetry/payload.hpp"

#include <chrono>
#include <random>

namespace edge_sentinel {

std::string generate_payload_id() {
    // xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx, y in {8,9,a,b}
    static thread_local std::random_device rd;
    static thread_local std::mt19937 gen(rd());
    static thread_local std::uniform_int_distribution<> hex_dist(0, 15);
    static thread_local std::uniform_int_distribution<> y_dist(8, 11);

    constexpr char kHex[] = "0123456789abcdef";
    std::string id;
    id.reserve(36);
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            id += '-';
        } else if (i == 14) {
            id += '4';
        } else if (i == 19) {
            id += kHex[y_dist(gen)];
        } else {
            id += kHex[hex_dist(gen)];
        }
    }
    return id;
}

TelemetryPayload make_payload(const DeviceId& device_id, nlohmann::json data) {
    TelemetryPayload payload;
    payload.device_id = device_id;
    payload.timestamp = to_epoch_seconds(std::chrono::system_clock::now());
    payload.data = std::move(data);
    payload.payload_id = generate_payload_id();
    return payload;
}

nlohmann::json to_json(const TelemetryPayload& payload) {
    return nlohmann::json{
        {"device_id", payload.device_id},
        {"timestamp", payload.timestamp},
        {"data", payload.data},
        {"payload_id", payload.payload_id},
    };
}

Result<TelemetryPayload> payload_from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        return Error{ErrorCode::Parse, "payload is not a JSON object"};
    }
    try {
        TelemetryPayload payload;
        payload.device_id = json.at("device_id").get<std::string>();
        payload.timestamp = json.at("timestamp").get<double>();
        payload.data = json.at("data");
        payload.payload_id = json.at("payload_id").get<std::string>();
        if (payload.payload_id.empty()) {
            return Error{ErrorCode::Parse, "payload_id is empty"};
        }
        return payload;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::Parse, std::string("invalid payload: ") + e.what()};
    }
}

}  // namespace edge_sentinel
