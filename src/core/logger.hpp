/**
 * @file logger.hpp
 * @brief Logging infrastructure with pluggable sinks.
 * @author Dimitris Kafetzis
 *
 * Provides ILogSink (virtual interface for runtime-configurable log destinations)
 * and a thread-safe Logger front-end. Component loggers derived with
 * with_component() share the parent's sink and lock, so every background loop
 * writes to one NDJSON stream.
 */

#pragma once

#include "core/result.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace edge_sentinel {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

/**
 * @brief Parse "debug" / "info" / "warn" / "warning" / "error" (case-insensitive).
 */
Result<LogLevel> parse_log_level(std::string_view text);

// ─────────────────────────────────────────────
// ILogSink (Virtual, runtime-configurable)
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for log output destinations.
 *
 * Implementations need not be thread-safe; Logger serializes access.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/**
 * @brief Thread-safe logger front-end.
 *
 * Cheap to copy; copies share the sink, the lock and the minimum level.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info,
                    std::string component = {});

    /// Logger tagged with a component name, writing to the same sink.
    [[nodiscard]] Logger with_component(std::string component) const;

    void debug(std::string_view message) const;
    void info(std::string_view message) const;
    void warn(std::string_view message) const;
    void error(std::string_view message) const;

    void log(LogLevel level, std::string_view message) const;
    void flush() const;

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;
    [[nodiscard]] const std::string& component() const noexcept { return component_; }

private:
    struct SharedSink {
        std::unique_ptr<ILogSink> sink;
        std::atomic<LogLevel> min_level;
        std::mutex mutex;
    };

    Logger(std::shared_ptr<SharedSink> shared, std::string component);

    std::shared_ptr<SharedSink> shared_;
    std::string component_;
};

/**
 * @brief Escape a string for embedding inside a JSON string literal.
 */
std::string json_escape(std::string_view text);

}  // namespace edge_sentinel
