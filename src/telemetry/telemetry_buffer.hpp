/**
 * @file telemetry_buffer.hpp
 * @brief Durable, size-bounded FIFO of undelivered telemetry payloads.
 *
 * Backing store is one JSON file per payload inside a directory. Files are
 * written to "<name>.tmp" and renamed into place, so a crash leaves either a
 * complete record or an orphan .tmp that the next open removes. Record names
 * are "<created_at_ns:020>-<seq:010>-<payload_id>.json" and sort
 * lexicographically in creation order.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "telemetry/metrics_collector.hpp"
#include "telemetry/payload.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace edge_sentinel {

/**
 * @brief A payload read back from the buffer.
 */
struct BufferedRecord {
    std::string id;             ///< Record file name; key for remove()
    double created_at{0.0};     ///< Epoch seconds; FIFO ordering key
    uint64_t size_bytes{0};
    TelemetryPayload payload;
};

class TelemetryBuffer {
public:
    /**
     * @brief Open (creating if needed) the buffer directory and index it.
     *
     * Orphan .tmp files are removed and the size limit is applied to what
     * survived. Failures are logged; the buffer then starts empty and later
     * inserts report Io errors.
     */
    TelemetryBuffer(const BufferConfig& config, Logger logger, MetricsCollector& metrics);

    TelemetryBuffer(const TelemetryBuffer&) = delete;
    TelemetryBuffer& operator=(const TelemetryBuffer&) = delete;

    /// Persist @p payload, then enforce the size limit.
    Result<void> insert(const TelemetryPayload& payload);

    /**
     * @brief Up to @p limit records, oldest first.
     *
     * Records that cannot be parsed are moved to the quarantine directory
     * and skipped.
     */
    std::vector<BufferedRecord> oldest(size_t limit);

    Result<void> remove(const std::string& id);

    /**
     * @brief Evict oldest records while total bytes exceed the maximum,
     *        stopping at max_size_bytes - hysteresis_margin_bytes.
     * @return Number of records evicted.
     */
    size_t enforce_limit();

    [[nodiscard]] size_t count() const;
    [[nodiscard]] uint64_t total_bytes() const;

    [[nodiscard]] const std::filesystem::path& dir() const noexcept { return config_.dir; }
    [[nodiscard]] std::filesystem::path quarantine_dir() const { return config_.dir / ".quarantine"; }
    [[nodiscard]] uint64_t max_size_bytes() const noexcept { return config_.max_size_bytes; }

private:
    void rebuild_index();
    size_t enforce_limit_locked();
    void quarantine_locked(const std::string& id, const std::string& reason);
    std::string next_record_name(Timestamp created_at, const PayloadId& payload_id);

    BufferConfig config_;
    Logger logger_;
    MetricsCollector& metrics_;

    mutable std::mutex mutex_;
    std::map<std::string, uint64_t> index_;   ///< name → size, ordered oldest first
    uint64_t total_bytes_{0};
    uint64_t sequence_{0};
};

}  // namespace edge_sentinel
