/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++, plus
 *        EDGE_SENTINEL_* environment overrides.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <string_view>

namespace edge_sentinel {

namespace {

constexpr uint64_t kMiB = 1024ULL * 1024ULL;
constexpr uint64_t kMaxMiB = std::numeric_limits<uint64_t>::max() / kMiB;

/// Reads an optional non-negative integer key into @p target. Negative or
/// out-of-range values set @p failure; the first failure wins.
template <typename T>
void read_unsigned(toml::node_view<toml::node> section, std::string_view section_name,
                   std::string_view key, T& target, std::optional<Error>& failure,
                   uint64_t max = std::numeric_limits<T>::max()) {
    if (failure) return;
    auto node = section[key];
    if (!node) return;

    const std::string name = std::string{section_name} + "." + std::string{key};
    auto value = node.value<int64_t>();
    if (!value) {
        failure = Error{ErrorCode::Config, name + " must be an integer"};
        return;
    }
    if (*value < 0 || static_cast<uint64_t>(*value) > max) {
        failure = Error{ErrorCode::Config, name + " must be between 0 and " + std::to_string(max)
                                               + ", got " + std::to_string(*value)};
        return;
    }
    target = static_cast<T>(*value);
}

std::string trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char c) { return std::isspace(c) != 0; });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
                                [](unsigned char c) { return std::isspace(c) != 0; }).base();
    if (begin >= end) return {};
    return std::string(begin, end);
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

Result<uint32_t> parse_u32(const std::string& key, const std::string& raw) {
    auto text = trim(raw);
    uint32_t out = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return Error{ErrorCode::Config, key + " must be a non-negative integer, got '" + raw + "'"};
    }
    return out;
}

Result<float> parse_float(const std::string& key, const std::string& raw) {
    try {
        size_t consumed = 0;
        auto text = trim(raw);
        float value = std::stof(text, &consumed);
        if (consumed != text.size()) {
            return Error{ErrorCode::Config, key + " must be a number, got '" + raw + "'"};
        }
        return value;
    } catch (const std::exception&) {
        return Error{ErrorCode::Config, key + " must be a number, got '" + raw + "'"};
    }
}

std::vector<std::string> split(const std::string& text, char delim) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream iss(text);
    while (std::getline(iss, part, delim)) {
        parts.push_back(part);
    }
    return parts;
}

std::vector<std::string> split_whitespace(const std::string& text) {
    std::vector<std::string> parts;
    std::istringstream iss(text);
    std::string token;
    while (iss >> token) {
        parts.push_back(token);
    }
    return parts;
}

Result<std::vector<WorkerConfig>> parse_workers_table(const toml::array& workers) {
    std::vector<WorkerConfig> out;
    for (const auto& elem : workers) {
        const auto* tbl = elem.as_table();
        if (tbl == nullptr) {
            return Error{ErrorCode::Config, "[[workers]] entries must be tables"};
        }

        WorkerConfig worker;
        worker.name = (*tbl)["name"].value_or(std::string{});
        if (worker.name.empty()) {
            return Error{ErrorCode::Config, "[[workers]] entry is missing 'name'"};
        }

        const auto* command = (*tbl)["command"].as_array();
        if (command == nullptr) {
            return Error{ErrorCode::Config,
                         "worker '" + worker.name + "': 'command' must be an array of strings"};
        }
        for (const auto& arg : *command) {
            auto value = arg.value<std::string>();
            if (!value) {
                return Error{ErrorCode::Config,
                             "worker '" + worker.name + "': command arguments must be strings"};
            }
            worker.command.push_back(*value);
        }
        if (worker.command.empty()) {
            return Error{ErrorCode::Config, "worker '" + worker.name + "': empty command"};
        }

        worker.essential = (*tbl)["essential"].value_or(false);
        worker.heartbeat = (*tbl)["heartbeat"].value_or(false);
        if (auto max_restarts = (*tbl)["max_restarts"].value<int64_t>()) {
            if (*max_restarts < 0 || *max_restarts > std::numeric_limits<uint32_t>::max()) {
                return Error{ErrorCode::Config,
                             "worker '" + worker.name + "': max_restarts must be >= 0"};
            }
            worker.max_restarts = static_cast<uint32_t>(*max_restarts);
        }
        out.push_back(std::move(worker));
    }
    return out;
}

}  // anonymous namespace

EnvLookup system_env() {
    return [](const std::string& key) -> std::optional<std::string> {
        const char* value = std::getenv(key.c_str());
        if (value == nullptr) return std::nullopt;
        return std::string(value);
    };
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [device]
        if (auto device = tbl["device"]; device.is_table()) {
            config.device.id = device["id"].value_or(config.device.id);
        }

        std::optional<Error> failure;

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.endpoint = telemetry["endpoint"].value_or(config.telemetry.endpoint);
            read_unsigned(telemetry, "telemetry", "flush_interval_ms",
                          config.telemetry.flush_interval_ms, failure);
            read_unsigned(telemetry, "telemetry", "flush_batch_size",
                          config.telemetry.flush_batch_size, failure);
        }

        // [buffer]
        if (auto buffer = tbl["buffer"]; buffer.is_table()) {
            config.buffer.dir = buffer["dir"].value_or(config.buffer.dir.string());
            uint64_t max_mb = config.buffer.max_size_bytes / kMiB;
            uint64_t margin_mb = config.buffer.hysteresis_margin_bytes / kMiB;
            read_unsigned(buffer, "buffer", "max_size_mb", max_mb, failure, kMaxMiB);
            read_unsigned(buffer, "buffer", "hysteresis_margin_mb", margin_mb, failure, kMaxMiB);
            config.buffer.max_size_bytes = max_mb * kMiB;
            config.buffer.hysteresis_margin_bytes = margin_mb * kMiB;
        }

        // [circuit]
        if (auto circuit = tbl["circuit"]; circuit.is_table()) {
            read_unsigned(circuit, "circuit", "failure_threshold",
                          config.circuit.failure_threshold, failure);
            read_unsigned(circuit, "circuit", "success_threshold",
                          config.circuit.success_threshold, failure);
            read_unsigned(circuit, "circuit", "timeout_ms", config.circuit.timeout_ms, failure);
        }

        // [retry]
        if (auto retry = tbl["retry"]; retry.is_table()) {
            read_unsigned(retry, "retry", "max_attempts", config.retry.max_attempts, failure);
            read_unsigned(retry, "retry", "initial_delay_ms", config.retry.initial_delay_ms, failure);
        }

        // [supervisor]
        if (auto supervisor = tbl["supervisor"]; supervisor.is_table()) {
            read_unsigned(supervisor, "supervisor", "watchdog_interval_ms",
                          config.supervisor.watchdog_interval_ms, failure);
            config.supervisor.heartbeat_dir =
                supervisor["heartbeat_dir"].value_or(config.supervisor.heartbeat_dir.string());
            config.supervisor.capture_dir = supervisor["capture_dir"].value_or(std::string{});
            config.supervisor.working_dir = supervisor["working_dir"].value_or(std::string{});
            read_unsigned(supervisor, "supervisor", "default_max_restarts",
                          config.supervisor.default_max_restarts, failure);
            read_unsigned(supervisor, "supervisor", "heartbeat_stale_after_ms",
                          config.supervisor.heartbeat_stale_after_ms, failure);
        }

        // [health]
        if (auto health = tbl["health"]; health.is_table()) {
            read_unsigned(health, "health", "interval_ms", config.health.interval_ms, failure);
            config.health.temp_threshold_c =
                static_cast<float>(health["temp_threshold_c"].value_or(75.0));
            config.health.cpu_threshold_percent =
                static_cast<float>(health["cpu_threshold_percent"].value_or(95.0));
            config.health.memory_threshold_percent =
                static_cast<float>(health["memory_threshold_percent"].value_or(90.0));
            config.health.disk_path = health["disk_path"].value_or(std::string{"/"});
        }

        // [heartbeat]
        if (auto heartbeat = tbl["heartbeat"]; heartbeat.is_table()) {
            read_unsigned(heartbeat, "heartbeat", "interval_ms", config.heartbeat.interval_ms, failure);
        }

        // [logging]
        if (auto logging = tbl["logging"]; logging.is_table()) {
            config.logging.dir = logging["dir"].value_or(std::string{});
            config.logging.level = logging["level"].value_or(std::string{"info"});
            read_unsigned(logging, "logging", "max_file_size_mb",
                          config.logging.max_file_size_mb, failure);
            read_unsigned(logging, "logging", "rotate_count", config.logging.rotate_count, failure);
        }

        if (failure) return *failure;

        // [[workers]]
        if (const auto* workers = tbl["workers"].as_array()) {
            auto parsed = parse_workers_table(*workers);
            if (!parsed) return parsed.error();
            config.workers = std::move(*parsed);
        }

        if (auto valid = validate_config(config); !valid) {
            return valid.error();
        }
        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Parse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

Result<std::vector<WorkerConfig>> parse_worker_specs(const std::string& text) {
    std::vector<WorkerConfig> workers;
    for (const auto& raw_entry : split(text, ',')) {
        auto entry = trim(raw_entry);
        if (entry.empty()) continue;

        auto parts = split(entry, ':');
        if (parts.size() < 2) {
            return Error{ErrorCode::Config,
                         "Worker entry '" + entry + "' must look like name:command[:essential]"};
        }

        WorkerConfig worker;
        worker.name = trim(parts[0]);
        worker.command = split_whitespace(parts[1]);
        worker.essential = parts.size() > 2 && to_lower(trim(parts[2])) == "true";

        if (worker.name.empty() || worker.command.empty()) {
            return Error{ErrorCode::Config, "Worker entry '" + entry + "' has an empty name or command"};
        }
        workers.push_back(std::move(worker));
    }
    return workers;
}

Result<void> apply_env_overrides(Config& config, const EnvLookup& env) {
    auto str = [&](const char* key, auto&& apply) {
        if (auto value = env(key); value && !value->empty()) {
            apply(*value);
        }
    };

    std::optional<Error> failure;
    auto u32 = [&](const char* key, uint32_t& target) {
        str(key, [&](const std::string& value) {
            auto parsed = parse_u32(key, value);
            if (parsed) {
                target = *parsed;
            } else if (!failure) {
                failure = parsed.error();
            }
        });
    };
    auto f32 = [&](const char* key, float& target) {
        str(key, [&](const std::string& value) {
            auto parsed = parse_float(key, value);
            if (parsed) {
                target = *parsed;
            } else if (!failure) {
                failure = parsed.error();
            }
        });
    };

    str("EDGE_SENTINEL_DEVICE_ID", [&](const std::string& v) { config.device.id = v; });
    str("EDGE_SENTINEL_TELEMETRY_ENDPOINT", [&](const std::string& v) { config.telemetry.endpoint = v; });
    str("EDGE_SENTINEL_BUFFER_DIR", [&](const std::string& v) { config.buffer.dir = v; });
    str("EDGE_SENTINEL_LOG_DIR", [&](const std::string& v) { config.logging.dir = v; });
    str("EDGE_SENTINEL_LOG_LEVEL", [&](const std::string& v) { config.logging.level = v; });

    u32("EDGE_SENTINEL_FLUSH_INTERVAL_MS", config.telemetry.flush_interval_ms);
    u32("EDGE_SENTINEL_CIRCUIT_FAILURE_THRESHOLD", config.circuit.failure_threshold);
    u32("EDGE_SENTINEL_CIRCUIT_TIMEOUT_MS", config.circuit.timeout_ms);
    u32("EDGE_SENTINEL_RETRY_MAX_ATTEMPTS", config.retry.max_attempts);
    u32("EDGE_SENTINEL_RETRY_INITIAL_DELAY_MS", config.retry.initial_delay_ms);
    u32("EDGE_SENTINEL_WATCHDOG_INTERVAL_MS", config.supervisor.watchdog_interval_ms);
    u32("EDGE_SENTINEL_MAX_RESTARTS", config.supervisor.default_max_restarts);
    u32("EDGE_SENTINEL_HEALTH_INTERVAL_MS", config.health.interval_ms);
    u32("EDGE_SENTINEL_HEARTBEAT_INTERVAL_MS", config.heartbeat.interval_ms);
    f32("EDGE_SENTINEL_TEMP_THRESHOLD", config.health.temp_threshold_c);
    f32("EDGE_SENTINEL_CPU_THRESHOLD", config.health.cpu_threshold_percent);
    f32("EDGE_SENTINEL_MEMORY_THRESHOLD", config.health.memory_threshold_percent);

    uint32_t buffer_max_mb = 0;
    uint32_t buffer_margin_mb = 0;
    bool margin_set = false;
    u32("EDGE_SENTINEL_BUFFER_MAX_MB", buffer_max_mb);
    str("EDGE_SENTINEL_BUFFER_MARGIN_MB", [&](const std::string&) { margin_set = true; });
    u32("EDGE_SENTINEL_BUFFER_MARGIN_MB", buffer_margin_mb);
    if (buffer_max_mb > 0) {
        config.buffer.max_size_bytes = static_cast<uint64_t>(buffer_max_mb) * kMiB;
    }
    if (margin_set) {
        config.buffer.hysteresis_margin_bytes = static_cast<uint64_t>(buffer_margin_mb) * kMiB;
    } else if (config.buffer.hysteresis_margin_bytes >= config.buffer.max_size_bytes) {
        // A shrunk maximum keeps a tenth of itself as eviction margin.
        config.buffer.hysteresis_margin_bytes = config.buffer.max_size_bytes / 10;
    }

    if (failure) return *failure;

    if (auto workers = env("EDGE_SENTINEL_WORKERS"); workers && !workers->empty()) {
        auto parsed = parse_worker_specs(*workers);
        if (!parsed) return parsed.error();
        config.workers = std::move(*parsed);
    }

    return validate_config(config);
}

Result<void> validate_config(const Config& config) {
    if (config.device.id.empty()) {
        return Error{ErrorCode::Config, "device.id must not be empty"};
    }
    if (config.telemetry.flush_interval_ms == 0) {
        return Error{ErrorCode::Config, "telemetry.flush_interval_ms must be greater than 0"};
    }
    if (config.telemetry.flush_batch_size == 0) {
        return Error{ErrorCode::Config, "telemetry.flush_batch_size must be greater than 0"};
    }
    if (config.buffer.max_size_bytes == 0) {
        return Error{ErrorCode::Config, "buffer.max_size_mb must be greater than 0"};
    }
    if (config.buffer.hysteresis_margin_bytes >= config.buffer.max_size_bytes) {
        return Error{ErrorCode::Config, "buffer.hysteresis_margin_mb must be below buffer.max_size_mb"};
    }
    if (config.circuit.failure_threshold == 0 || config.circuit.success_threshold == 0) {
        return Error{ErrorCode::Config, "circuit thresholds must be greater than 0"};
    }
    if (config.retry.max_attempts == 0) {
        return Error{ErrorCode::Config, "retry.max_attempts must be at least 1"};
    }
    if (config.supervisor.watchdog_interval_ms == 0) {
        return Error{ErrorCode::Config, "supervisor.watchdog_interval_ms must be greater than 0"};
    }
    if (config.health.interval_ms == 0) {
        return Error{ErrorCode::Config, "health.interval_ms must be greater than 0"};
    }
    if (config.heartbeat.interval_ms == 0) {
        return Error{ErrorCode::Config, "heartbeat.interval_ms must be greater than 0"};
    }
    return Result<void>{};
}

std::vector<std::string> config_warnings(const Config& config) {
    std::vector<std::string> warnings;
    const auto& endpoint = config.telemetry.endpoint;
    if (endpoint.find("localhost") != std::string::npos
        || endpoint.find("127.0.0.1") != std::string::npos) {
        warnings.push_back("Telemetry endpoint points at a local address (" + endpoint
                           + "); this will not reach a real collector");
    }
    if (config.workers.empty()) {
        warnings.push_back("No workers configured");
    }
    return warnings;
}

}  // namespace edge_sentinel
