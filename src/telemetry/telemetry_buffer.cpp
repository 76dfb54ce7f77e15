/**
 * @file telemetry_buffer.cpp
 * @brief TelemetryBuffer implementation over a directory of JSON files.
 */

#include "telemetry/telemetry_buffer.hpp"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace edge_sentinel {

namespace {

constexpr std::string_view kRecordSuffix = ".json";
constexpr std::string_view kTempSuffix = ".tmp";

bool ends_with(const std::string& text, std::string_view suffix) {
    return text.size() >= suffix.size()
        && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // anonymous namespace

TelemetryBuffer::TelemetryBuffer(const BufferConfig& config, Logger logger, MetricsCollector& metrics)
    : config_(config), logger_(std::move(logger)), metrics_(metrics) {
    std::error_code ec;
    std::filesystem::create_directories(config_.dir, ec);
    if (ec) {
        logger_.error("Cannot create buffer directory " + config_.dir.string() + ": " + ec.message());
        return;
    }
    rebuild_index();
    enforce_limit();
}

void TelemetryBuffer::rebuild_index() {
    std::lock_guard lock(mutex_);
    index_.clear();
    total_bytes_ = 0;

    std::error_code ec;
    size_t orphans = 0;
    for (std::filesystem::directory_iterator it(config_.dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) continue;

        auto name = entry.path().filename().string();
        if (ends_with(name, kTempSuffix)) {
            std::filesystem::remove(entry.path(), entry_ec);
            ++orphans;
            continue;
        }
        if (!ends_with(name, kRecordSuffix)) continue;

        auto size = entry.file_size(entry_ec);
        if (entry_ec) continue;
        index_.emplace(name, size);
        total_bytes_ += size;
    }
    if (ec) {
        logger_.error("Cannot scan buffer directory " + config_.dir.string() + ": " + ec.message());
    }
    if (orphans > 0) {
        logger_.warn("Removed " + std::to_string(orphans) + " incomplete buffer writes");
    }
    if (!index_.empty()) {
        logger_.info("Buffer holds " + std::to_string(index_.size()) + " records ("
                     + std::to_string(total_bytes_) + " bytes) from a previous run");
    }
}

std::string TelemetryBuffer::next_record_name(Timestamp created_at, const PayloadId& payload_id) {
    char prefix[48];
    std::snprintf(prefix, sizeof(prefix), "%020lld-%010llu-",
                  static_cast<long long>(to_epoch_nanos(created_at)),
                  static_cast<unsigned long long>(sequence_++ % 10000000000ULL));
    return std::string(prefix) + payload_id + std::string(kRecordSuffix);
}

Result<void> TelemetryBuffer::insert(const TelemetryPayload& payload) {
    auto created_at = std::chrono::system_clock::now();
    nlohmann::json body{
        {"created_at", to_epoch_seconds(created_at)},
        {"payload", to_json(payload)},
    };
    std::string text;
    try {
        text = body.dump();
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::Parse, std::string("cannot serialize payload: ") + e.what()};
    }

    std::lock_guard lock(mutex_);
    auto name = next_record_name(created_at, payload.payload_id);
    auto final_path = config_.dir / name;
    auto temp_path = config_.dir / (name + std::string(kTempSuffix));

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::Io, "cannot open " + temp_path.string()};
        }
        out << text;
        out.flush();
        if (!out) {
            out.close();
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            return Error{ErrorCode::Io, "short write to " + temp_path.string()};
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, final_path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return Error{ErrorCode::Io, "cannot commit " + final_path.string() + ": " + ec.message()};
    }

    index_.emplace(name, text.size());
    total_bytes_ += text.size();
    enforce_limit_locked();
    return Result<void>{};
}

std::vector<BufferedRecord> TelemetryBuffer::oldest(size_t limit) {
    std::lock_guard lock(mutex_);
    std::vector<BufferedRecord> records;
    std::vector<std::pair<std::string, std::string>> malformed;

    for (auto it = index_.begin(); it != index_.end() && records.size() < limit; ++it) {
        const auto& [name, size] = *it;
        std::ifstream in(config_.dir / name, std::ios::binary);
        if (!in) {
            malformed.emplace_back(name, "unreadable");
            continue;
        }
        std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

        auto body = nlohmann::json::parse(text, nullptr, false);
        if (body.is_discarded() || !body.is_object()
            || !body.contains("payload") || !body.contains("created_at")
            || !body["created_at"].is_number()) {
            malformed.emplace_back(name, "not a buffer record");
            continue;
        }
        auto payload = payload_from_json(body["payload"]);
        if (!payload) {
            malformed.emplace_back(name, payload.error().message);
            continue;
        }

        BufferedRecord record;
        record.id = name;
        record.created_at = body["created_at"].get<double>();
        record.size_bytes = size;
        record.payload = std::move(*payload);
        records.push_back(std::move(record));
    }

    for (const auto& [name, reason] : malformed) {
        quarantine_locked(name, reason);
    }
    return records;
}

void TelemetryBuffer::quarantine_locked(const std::string& id, const std::string& reason) {
    auto it = index_.find(id);
    if (it == index_.end()) return;

    auto source = config_.dir / id;
    auto qdir = quarantine_dir();
    std::error_code ec;
    std::filesystem::create_directories(qdir, ec);

    auto destination = qdir / id;
    if (std::filesystem::exists(destination, ec)) {
        auto stem = std::filesystem::path(id).stem().string();
        auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        auto base = stem + "_" + std::to_string(epoch);
        destination = qdir / (base + std::string(kRecordSuffix));
        for (int n = 1; std::filesystem::exists(destination, ec); ++n) {
            destination = qdir / (base + "_" + std::to_string(n) + std::string(kRecordSuffix));
        }
    }

    std::filesystem::rename(source, destination, ec);
    if (ec) {
        // Stays indexed; retried on the next read.
        logger_.error("Cannot quarantine " + id + ": " + ec.message());
        return;
    }

    total_bytes_ -= it->second;
    index_.erase(it);
    metrics_.increment("telemetry_quarantined");
    logger_.warn("Quarantined malformed buffer record " + id + " (" + reason + ") to "
                 + destination.string());
}

Result<void> TelemetryBuffer::remove(const std::string& id) {
    std::lock_guard lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) {
        return Error{ErrorCode::NotFound, "no buffered record " + id};
    }

    std::error_code ec;
    std::filesystem::remove(config_.dir / id, ec);
    if (ec) {
        return Error{ErrorCode::Io, "cannot delete " + id + ": " + ec.message()};
    }
    total_bytes_ -= it->second;
    index_.erase(it);
    return Result<void>{};
}

size_t TelemetryBuffer::enforce_limit() {
    std::lock_guard lock(mutex_);
    return enforce_limit_locked();
}

size_t TelemetryBuffer::enforce_limit_locked() {
    if (total_bytes_ <= config_.max_size_bytes) return 0;

    const uint64_t target = config_.max_size_bytes > config_.hysteresis_margin_bytes
        ? config_.max_size_bytes - config_.hysteresis_margin_bytes
        : 0;

    size_t evicted = 0;
    uint64_t freed = 0;
    auto it = index_.begin();
    while (it != index_.end() && total_bytes_ > target) {
        std::error_code ec;
        std::filesystem::remove(config_.dir / it->first, ec);
        if (ec) {
            logger_.error("Cannot evict " + it->first + ": " + ec.message());
        }
        // Accounting drops the record even when the unlink failed.
        total_bytes_ -= it->second;
        freed += it->second;
        it = index_.erase(it);
        ++evicted;
    }

    if (evicted > 0) {
        metrics_.increment("telemetry_evicted", evicted);
        logger_.warn("Buffer over " + std::to_string(config_.max_size_bytes) + " bytes: evicted "
                     + std::to_string(evicted) + " oldest records (" + std::to_string(freed)
                     + " bytes)");
    }
    return evicted;
}

size_t TelemetryBuffer::count() const {
    std::lock_guard lock(mutex_);
    return index_.size();
}

uint64_t TelemetryBuffer::total_bytes() const {
    std::lock_guard lock(mutex_);
    return total_bytes_;
}

}  // namespace edge_sentinel
