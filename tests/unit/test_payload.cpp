/**
 * @file test_payload.cpp
 * @brief Unit tests for telemetry payload construction and parsing.
 */

#include "telemetry/payload.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <regex>
#include <set>

using namespace edge_sentinel;

TEST(PayloadIdTest, IsVersion4Uuid) {
    static const std::regex kUuidV4(
        "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    for (int i = 0; i < 50; ++i) {
        auto id = generate_payload_id();
        EXPECT_TRUE(std::regex_match(id, kUuidV4)) << id;
    }
}

TEST(PayloadIdTest, Unique) {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(generate_payload_id());
    }
    EXPECT_EQ(ids.size(), 1000u);
}

TEST(PayloadTest, MakePayloadStampsFields) {
    auto before = to_epoch_seconds(std::chrono::system_clock::now());
    auto payload = make_payload("edge-7", {{"event", "heartbeat"}});
    auto after = to_epoch_seconds(std::chrono::system_clock::now());

    EXPECT_EQ(payload.device_id, "edge-7");
    EXPECT_EQ(payload.data["event"], "heartbeat");
    EXPECT_GE(payload.timestamp, before);
    EXPECT_LE(payload.timestamp, after);
    EXPECT_EQ(payload.payload_id.size(), 36u);
}

TEST(PayloadTest, JsonShape) {
    auto payload = make_payload("edge-7", {{"temperature", 71.5}});
    auto j = to_json(payload);

    EXPECT_EQ(j["device_id"], "edge-7");
    EXPECT_EQ(j["payload_id"], payload.payload_id);
    EXPECT_DOUBLE_EQ(j["timestamp"].get<double>(), payload.timestamp);
    EXPECT_DOUBLE_EQ(j["data"]["temperature"].get<double>(), 71.5);
}

TEST(PayloadTest, ParsesItsOwnOutput) {
    auto original = make_payload("edge-7", {{"nested", {{"a", 1}, {"b", {1, 2, 3}}}}});
    auto parsed = payload_from_json(nlohmann::json::parse(to_json(original).dump()));
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_EQ(*parsed, original);
}

TEST(PayloadTest, MissingFieldIsParseError) {
    nlohmann::json j = {{"device_id", "d"}, {"timestamp", 1.0}, {"data", {}}};
    auto parsed = payload_from_json(j);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, ErrorCode::Parse);
}

TEST(PayloadTest, MistypedFieldIsParseError) {
    nlohmann::json j = {
        {"device_id", 42}, {"timestamp", 1.0}, {"data", {}}, {"payload_id", "x"}};
    auto parsed = payload_from_json(j);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, ErrorCode::Parse);
}

TEST(PayloadTest, EmptyIdIsParseError) {
    nlohmann::json j = {
        {"device_id", "d"}, {"timestamp", 1.0}, {"data", {}}, {"payload_id", ""}};
    EXPECT_FALSE(payload_from_json(j).has_value());
}

TEST(PayloadTest, NonObjectIsParseError) {
    auto parsed = payload_from_json(nlohmann::json::array({1, 2}));
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, ErrorCode::Parse);
}
