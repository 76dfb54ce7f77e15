/**
 * @file logger.cpp
 * @brief Logger implementation with ISO 8601 timestamps.
 * @author Dimitris Kafetzis
 */

#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace edge_sentinel {

Result<LogLevel> parse_log_level(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    return Error{ErrorCode::Config, "Unknown log level: " + std::string(text)};
}

std::string json_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level, std::string component)
    : shared_(std::make_shared<SharedSink>()), component_(std::move(component)) {
    shared_->sink = std::move(sink);
    shared_->min_level.store(min_level);
}

Logger::Logger(std::shared_ptr<SharedSink> shared, std::string component)
    : shared_(std::move(shared)), component_(std::move(component)) {}

Logger Logger::with_component(std::string component) const {
    return Logger(shared_, std::move(component));
}

void Logger::debug(std::string_view message) const { log(LogLevel::Debug, message); }
void Logger::info(std::string_view message) const  { log(LogLevel::Info, message); }
void Logger::warn(std::string_view message) const  { log(LogLevel::Warn, message); }
void Logger::error(std::string_view message) const { log(LogLevel::Error, message); }

void Logger::log(LogLevel level, std::string_view message) const {
    if (!enabled(level)) return;

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_now, &utc);

    std::ostringstream oss;
    oss << R"({"level":")" << to_string(level) << R"(",)"
        << R"("ts":")"
        << std::put_time(&utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << R"(Z",)";
    if (!component_.empty()) {
        oss << R"("component":")" << json_escape(component_) << R"(",)";
    }
    oss << R"("msg":")" << json_escape(message) << R"("})";

    std::lock_guard lock(shared_->mutex);
    if (shared_->sink) {
        shared_->sink->write(oss.str());
    }
}

void Logger::flush() const {
    std::lock_guard lock(shared_->mutex);
    if (shared_->sink) {
        shared_->sink->flush();
    }
}

void Logger::set_level(LogLevel level) noexcept { shared_->min_level.store(level); }
LogLevel Logger::level() const noexcept { return shared_->min_level.load(); }

bool Logger::enabled(LogLevel level) const noexcept {
    return level >= shared_->min_level.load();
}

}  // namespace edge_sentinel
