/**
 * @file config.hpp
 * @brief Runtime configuration with TOML deserialization and environment overrides.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace edge_sentinel {

struct DeviceConfig {
    std::string id = "edge-001";
};

struct TelemetryConfig {
    std::string endpoint = "https://localhost/telemetry";
    uint32_t flush_interval_ms = 30000;
    uint32_t flush_batch_size = 10;
};

struct BufferConfig {
    std::filesystem::path dir = "./data/buffer";
    uint64_t max_size_bytes = 50ULL * 1024 * 1024;
    uint64_t hysteresis_margin_bytes = 5ULL * 1024 * 1024;
};

struct CircuitConfig {
    uint32_t failure_threshold = 3;
    uint32_t success_threshold = 2;
    uint32_t timeout_ms = 60000;
};

struct RetryConfig {
    uint32_t max_attempts = 3;
    uint32_t initial_delay_ms = 2000;
};

struct SupervisorConfig {
    uint32_t watchdog_interval_ms = 5000;
    std::filesystem::path heartbeat_dir = std::filesystem::temp_directory_path();
    std::filesystem::path capture_dir;         ///< Empty = discard child output
    std::filesystem::path working_dir;         ///< Empty = inherit
    uint32_t default_max_restarts = 10;
    uint32_t heartbeat_stale_after_ms = 30000;
};

struct HealthConfig {
    uint32_t interval_ms = 10000;
    float temp_threshold_c = 75.0f;
    float cpu_threshold_percent = 95.0f;
    float memory_threshold_percent = 90.0f;
    std::filesystem::path disk_path = "/";
};

/// Periodic runtime snapshot emitted through telemetry.
struct HeartbeatConfig {
    uint32_t interval_ms = 60000;
};

struct LoggingConfig {
    std::filesystem::path dir;                 ///< Empty = stdout
    std::string level = "info";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

struct WorkerConfig {
    std::string name;
    std::vector<std::string> command;          ///< argv; never shell-interpreted
    bool essential = false;
    std::optional<uint32_t> max_restarts;      ///< Unset = supervisor default
    bool heartbeat = false;
};

/**
 * @brief Top-level runtime configuration.
 */
struct Config {
    DeviceConfig device;
    TelemetryConfig telemetry;
    BufferConfig buffer;
    CircuitConfig circuit;
    RetryConfig retry;
    SupervisorConfig supervisor;
    HealthConfig health;
    HeartbeatConfig heartbeat;
    LoggingConfig logging;
    std::vector<WorkerConfig> workers;
};

/**
 * @brief Environment lookup; returns nullopt for unset variables.
 */
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Lookup backed by the process environment.
EnvLookup system_env();

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Apply EDGE_SENTINEL_* environment overrides on top of @p config.
 */
Result<void> apply_env_overrides(Config& config, const EnvLookup& env = system_env());

/**
 * @brief Parse the compact worker list "name:cmd args:essential,name2:cmd2".
 */
Result<std::vector<WorkerConfig>> parse_worker_specs(const std::string& text);

/**
 * @brief Reject values the runtime cannot operate with.
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Non-fatal findings worth logging at startup.
 */
std::vector<std::string> config_warnings(const Config& config);

}  // namespace edge_sentinel
