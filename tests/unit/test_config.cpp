/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading and environment overrides.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <map>

using namespace edge_sentinel;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        const auto* test = ::testing::UnitTest::GetInstance()->current_test_info();
        temp_dir_ = std::filesystem::temp_directory_path() / ("es_test_config_" + std::string(test->name()));
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

EnvLookup fake_env(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const std::string& key) -> std::optional<std::string> {
        auto it = values.find(key);
        if (it == values.end()) return std::nullopt;
        return it->second;
    };
}

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.device.id, "edge-001");
    EXPECT_EQ(config.telemetry.flush_interval_ms, 30000u);
    EXPECT_EQ(config.telemetry.flush_batch_size, 10u);
    EXPECT_EQ(config.buffer.max_size_bytes, 50ULL * 1024 * 1024);
    EXPECT_EQ(config.buffer.hysteresis_margin_bytes, 5ULL * 1024 * 1024);
    EXPECT_EQ(config.circuit.failure_threshold, 3u);
    EXPECT_EQ(config.circuit.timeout_ms, 60000u);
    EXPECT_EQ(config.retry.max_attempts, 3u);
    EXPECT_EQ(config.supervisor.watchdog_interval_ms, 5000u);
    EXPECT_EQ(config.supervisor.default_max_restarts, 10u);
    EXPECT_EQ(config.supervisor.heartbeat_stale_after_ms, 30000u);
    EXPECT_FLOAT_EQ(config.health.temp_threshold_c, 75.0f);
    EXPECT_EQ(config.heartbeat.interval_ms, 60000u);
    EXPECT_TRUE(config.workers.empty());
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [device]
        id = "rpi-42"

        [telemetry]
        endpoint = "https://collector.example.com/v1"
        flush_interval_ms = 5000
        flush_batch_size = 25

        [buffer]
        dir = "/var/lib/es/buffer"
        max_size_mb = 20
        hysteresis_margin_mb = 2

        [circuit]
        failure_threshold = 5
        success_threshold = 1
        timeout_ms = 1000

        [retry]
        max_attempts = 4
        initial_delay_ms = 100

        [supervisor]
        watchdog_interval_ms = 250
        heartbeat_dir = "/run/es"
        capture_dir = "/var/log/es/workers"
        default_max_restarts = 3
        heartbeat_stale_after_ms = 10000

        [health]
        interval_ms = 500
        temp_threshold_c = 70.5
        cpu_threshold_percent = 80.0
        memory_threshold_percent = 85.0
        disk_path = "/data"

        [heartbeat]
        interval_ms = 15000

        [logging]
        dir = "/var/log/es"
        level = "debug"
        max_file_size_mb = 10
        rotate_count = 3

        [[workers]]
        name = "sensor"
        command = ["python3", "sensor.py", "--fast"]
        heartbeat = true

        [[workers]]
        name = "bridge"
        command = ["/usr/bin/bridge"]
        essential = true
        max_restarts = 7
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.device.id, "rpi-42");
    EXPECT_EQ(config.telemetry.endpoint, "https://collector.example.com/v1");
    EXPECT_EQ(config.telemetry.flush_interval_ms, 5000u);
    EXPECT_EQ(config.telemetry.flush_batch_size, 25u);
    EXPECT_EQ(config.buffer.dir, "/var/lib/es/buffer");
    EXPECT_EQ(config.buffer.max_size_bytes, 20ULL * 1024 * 1024);
    EXPECT_EQ(config.buffer.hysteresis_margin_bytes, 2ULL * 1024 * 1024);
    EXPECT_EQ(config.circuit.failure_threshold, 5u);
    EXPECT_EQ(config.circuit.success_threshold, 1u);
    EXPECT_EQ(config.retry.max_attempts, 4u);
    EXPECT_EQ(config.retry.initial_delay_ms, 100u);
    EXPECT_EQ(config.supervisor.watchdog_interval_ms, 250u);
    EXPECT_EQ(config.supervisor.heartbeat_dir, "/run/es");
    EXPECT_EQ(config.supervisor.capture_dir, "/var/log/es/workers");
    EXPECT_EQ(config.supervisor.default_max_restarts, 3u);
    EXPECT_FLOAT_EQ(config.health.temp_threshold_c, 70.5f);
    EXPECT_EQ(config.health.disk_path, "/data");
    EXPECT_EQ(config.heartbeat.interval_ms, 15000u);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.rotate_count, 3u);

    ASSERT_EQ(config.workers.size(), 2u);
    EXPECT_EQ(config.workers[0].name, "sensor");
    EXPECT_EQ(config.workers[0].command,
              (std::vector<std::string>{"python3", "sensor.py", "--fast"}));
    EXPECT_TRUE(config.workers[0].heartbeat);
    EXPECT_FALSE(config.workers[0].essential);
    EXPECT_FALSE(config.workers[0].max_restarts.has_value());
    EXPECT_TRUE(config.workers[1].essential);
    ASSERT_TRUE(config.workers[1].max_restarts.has_value());
    EXPECT_EQ(*config.workers[1].max_restarts, 7u);
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [device]
        id = "partial-node"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->device.id, "partial-node");
    EXPECT_EQ(result->telemetry.flush_batch_size, 10u);
    EXPECT_EQ(result->retry.initial_delay_ms, 2000u);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Parse);
}

TEST_F(ConfigTest, WorkerCommandMustBeArray) {
    auto path = write_toml(R"(
        [[workers]]
        name = "shell"
        command = "rm -rf / ; echo"
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, RejectsMarginNotBelowMax) {
    auto path = write_toml(R"(
        [buffer]
        max_size_mb = 5
        hysteresis_margin_mb = 5
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, NegativeIntervalIsConfigError) {
    auto path = write_toml(R"(
        [supervisor]
        watchdog_interval_ms = -1
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
    EXPECT_NE(result.error().message.find("supervisor.watchdog_interval_ms"), std::string::npos);
}

TEST_F(ConfigTest, NegativeBufferSizeIsConfigError) {
    auto path = write_toml(R"(
        [buffer]
        max_size_mb = -1
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, IntegerAboveTargetRangeIsConfigError) {
    auto path = write_toml(R"(
        [telemetry]
        flush_interval_ms = 4294967296
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, ZeroMaxRestartsIsAccepted) {
    auto path = write_toml(R"(
        [supervisor]
        default_max_restarts = 0

        [[workers]]
        name = "oneshot"
        command = ["true"]
        max_restarts = 0
    )");
    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->supervisor.default_max_restarts, 0u);
    ASSERT_TRUE(result->workers[0].max_restarts.has_value());
    EXPECT_EQ(*result->workers[0].max_restarts, 0u);
}

TEST_F(ConfigTest, NegativeWorkerMaxRestartsIsConfigError) {
    auto path = write_toml(R"(
        [[workers]]
        name = "w"
        command = ["true"]
        max_restarts = -3
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

// ─── Environment overrides ───────────────────

TEST(EnvOverrideTest, AppliesValues) {
    auto config = default_config();
    auto result = apply_env_overrides(config, fake_env({
        {"EDGE_SENTINEL_DEVICE_ID", "gw-7"},
        {"EDGE_SENTINEL_TELEMETRY_ENDPOINT", "https://c.example.com"},
        {"EDGE_SENTINEL_FLUSH_INTERVAL_MS", "1500"},
        {"EDGE_SENTINEL_BUFFER_MAX_MB", "12"},
        {"EDGE_SENTINEL_CIRCUIT_FAILURE_THRESHOLD", "4"},
        {"EDGE_SENTINEL_RETRY_MAX_ATTEMPTS", "6"},
        {"EDGE_SENTINEL_WATCHDOG_INTERVAL_MS", "100"},
        {"EDGE_SENTINEL_TEMP_THRESHOLD", "68.5"},
        {"EDGE_SENTINEL_MAX_RESTARTS", "2"},
        {"EDGE_SENTINEL_LOG_LEVEL", "warn"},
    }));
    ASSERT_TRUE(result.has_value()) << result.error().message;

    EXPECT_EQ(config.device.id, "gw-7");
    EXPECT_EQ(config.telemetry.endpoint, "https://c.example.com");
    EXPECT_EQ(config.telemetry.flush_interval_ms, 1500u);
    EXPECT_EQ(config.buffer.max_size_bytes, 12ULL * 1024 * 1024);
    EXPECT_EQ(config.circuit.failure_threshold, 4u);
    EXPECT_EQ(config.retry.max_attempts, 6u);
    EXPECT_EQ(config.supervisor.watchdog_interval_ms, 100u);
    EXPECT_FLOAT_EQ(config.health.temp_threshold_c, 68.5f);
    EXPECT_EQ(config.supervisor.default_max_restarts, 2u);
    EXPECT_EQ(config.logging.level, "warn");
}

TEST(EnvOverrideTest, UnsetVariablesLeaveDefaults) {
    auto config = default_config();
    ASSERT_TRUE(apply_env_overrides(config, fake_env({})).has_value());
    EXPECT_EQ(config.device.id, "edge-001");
    EXPECT_EQ(config.retry.max_attempts, 3u);
}

TEST(EnvOverrideTest, MalformedNumberIsConfigError) {
    auto config = default_config();
    auto result = apply_env_overrides(config, fake_env({
        {"EDGE_SENTINEL_WATCHDOG_INTERVAL_MS", "5s"},
    }));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
    EXPECT_NE(result.error().message.find("EDGE_SENTINEL_WATCHDOG_INTERVAL_MS"), std::string::npos);
}

TEST(EnvOverrideTest, MalformedFloatIsConfigError) {
    auto config = default_config();
    auto result = apply_env_overrides(config, fake_env({
        {"EDGE_SENTINEL_TEMP_THRESHOLD", "hot"},
    }));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST(EnvOverrideTest, SmallBufferMaxShrinksDefaultMargin) {
    auto config = default_config();
    auto result = apply_env_overrides(config, fake_env({
        {"EDGE_SENTINEL_BUFFER_MAX_MB", "4"},
    }));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(config.buffer.max_size_bytes, 4ULL * 1024 * 1024);
    EXPECT_EQ(config.buffer.hysteresis_margin_bytes, 4ULL * 1024 * 1024 / 10);
}

TEST(EnvOverrideTest, BufferMarginOverride) {
    auto config = default_config();
    auto result = apply_env_overrides(config, fake_env({
        {"EDGE_SENTINEL_BUFFER_MAX_MB", "4"},
        {"EDGE_SENTINEL_BUFFER_MARGIN_MB", "1"},
    }));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(config.buffer.hysteresis_margin_bytes, 1ULL * 1024 * 1024);
}

TEST(EnvOverrideTest, ExplicitMarginNotBelowMaxIsRejected) {
    auto config = default_config();
    auto result = apply_env_overrides(config, fake_env({
        {"EDGE_SENTINEL_BUFFER_MAX_MB", "4"},
        {"EDGE_SENTINEL_BUFFER_MARGIN_MB", "4"},
    }));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST(EnvOverrideTest, WorkersReplaceConfiguredList) {
    auto config = default_config();
    config.workers.push_back(WorkerConfig{"old", {"true"}, false, std::nullopt, false});
    auto result = apply_env_overrides(config, fake_env({
        {"EDGE_SENTINEL_WORKERS", "sensor:python3 sensor.py:false, uplink:/usr/bin/uplink --v:true"},
    }));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    ASSERT_EQ(config.workers.size(), 2u);
    EXPECT_EQ(config.workers[0].name, "sensor");
    EXPECT_EQ(config.workers[0].command, (std::vector<std::string>{"python3", "sensor.py"}));
    EXPECT_FALSE(config.workers[0].essential);
    EXPECT_EQ(config.workers[1].name, "uplink");
    EXPECT_EQ(config.workers[1].command, (std::vector<std::string>{"/usr/bin/uplink", "--v"}));
    EXPECT_TRUE(config.workers[1].essential);
}

TEST(WorkerSpecTest, EssentialDefaultsToFalse) {
    auto workers = parse_worker_specs("a:echo hi");
    ASSERT_TRUE(workers.has_value());
    ASSERT_EQ(workers->size(), 1u);
    EXPECT_FALSE((*workers)[0].essential);
}

TEST(WorkerSpecTest, RejectsEntryWithoutCommand) {
    auto workers = parse_worker_specs("lonely");
    ASSERT_FALSE(workers.has_value());
    EXPECT_EQ(workers.error().code, ErrorCode::Config);
}

TEST(WorkerSpecTest, SkipsEmptyEntries) {
    auto workers = parse_worker_specs("a:true,,  ,b:false");
    ASSERT_TRUE(workers.has_value());
    EXPECT_EQ(workers->size(), 2u);
}

TEST(ConfigWarningsTest, LocalEndpointIsFlagged) {
    auto config = default_config();
    config.workers.push_back(WorkerConfig{"w", {"true"}, false, std::nullopt, false});
    auto warnings = config_warnings(config);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("localhost"), std::string::npos);

    config.telemetry.endpoint = "https://collector.example.com";
    EXPECT_TRUE(config_warnings(config).empty());
}
