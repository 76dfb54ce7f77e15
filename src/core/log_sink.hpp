/**
 * @file log_sink.hpp
 * @brief NDJSON file log sink with size-based rotation, plus stdout/null sinks.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace edge_sentinel {

/**
 * @brief Writes NDJSON to rotating log files.
 *
 * Active file: <log_dir>/<prefix>.ndjson. When it grows past the size limit
 * it becomes <prefix>.1.ndjson, older generations shift up, and anything
 * beyond max_files is removed.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    /// Byte limit override, mainly for tests.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

    [[nodiscard]] std::filesystem::path active_path() const;
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t generation) const;

private:
    void open_active();
    void rotate_if_needed();

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout, for development and containers.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace edge_sentinel
