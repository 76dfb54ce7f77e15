/**
 * @file linux_probe.cpp
 * @brief LinuxSystemProbe: reads CPU, memory, disk and temperature sensors
 *        from /proc, /sys and statvfs.
 * @author Dimitris Kafetzis
 */

#include "health/system_probe.hpp"

#include <sys/statvfs.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace edge_sentinel {

using CpuTimes = LinuxSystemProbe::CpuTimes;

// ─────────────────────────────────────────────
// Internal helpers for /proc and /sys parsing
// ─────────────────────────────────────────────
namespace {

std::string read_file_line(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::string line;
    if (ifs.is_open()) {
        std::getline(ifs, line);
    }
    return line;
}

std::vector<std::string> read_file_lines(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

/**
 * @brief Parse the aggregate CPU line from /proc/stat.
 * Format: "cpu user nice system idle iowait irq softirq steal ..."
 */
CpuTimes parse_cpu_line(const std::string& line) {
    CpuTimes times;
    std::istringstream iss(line);
    std::string label;
    iss >> label >> times.user >> times.nice >> times.system >> times.idle
        >> times.iowait >> times.irq >> times.softirq >> times.steal;
    return times;
}

float compute_cpu_percent(const CpuTimes& prev, const CpuTimes& curr) {
    auto prev_total = prev.user + prev.nice + prev.system + prev.idle
                    + prev.iowait + prev.irq + prev.softirq + prev.steal;
    auto curr_total = curr.user + curr.nice + curr.system + curr.idle
                    + curr.iowait + curr.irq + curr.softirq + curr.steal;
    auto prev_active = prev_total - prev.idle - prev.iowait;
    auto curr_active = curr_total - curr.idle - curr.iowait;

    if (curr_total <= prev_total) return 0.0f;
    uint64_t total_delta = curr_total - prev_total;
    uint64_t active_delta = curr_active >= prev_active ? curr_active - prev_active : 0;
    return std::min(100.0f,
                    100.0f * static_cast<float>(active_delta) / static_cast<float>(total_delta));
}

/// Sysfs temperatures are millidegrees Celsius.
bool read_millidegrees(const std::filesystem::path& path, float& celsius) {
    auto line = read_file_line(path);
    if (line.empty()) return false;
    try {
        celsius = static_cast<float>(std::stol(line)) / 1000.0f;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

/// "temp3_input" → 3, anything else → 0.
int temp_input_index(const std::string& file_name) {
    if (!file_name.starts_with("temp") || !file_name.ends_with("_input")) return 0;
    try {
        return std::stoi(file_name.substr(4, file_name.size() - 4 - 6));
    } catch (const std::exception&) {
        return 0;
    }
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// LinuxSystemProbe implementation
// ─────────────────────────────────────────────

LinuxSystemProbe::LinuxSystemProbe() : LinuxSystemProbe(Paths{}) {}

LinuxSystemProbe::LinuxSystemProbe(Paths paths) : paths_(std::move(paths)) {
    auto lines = read_file_lines(paths_.proc_root / "stat");
    if (!lines.empty()) {
        prev_cpu_times_ = parse_cpu_line(lines[0]);
    }
}

Result<RawSample> LinuxSystemProbe::sample() {
    RawSample raw;

    // Memory
    uint64_t total_kb = 0;
    uint64_t available_kb = 0;
    for (const auto& line : read_file_lines(paths_.proc_root / "meminfo")) {
        if (line.starts_with("MemTotal:")) {
            std::istringstream iss(line.substr(9));
            iss >> total_kb;
        } else if (line.starts_with("MemAvailable:")) {
            std::istringstream iss(line.substr(13));
            iss >> available_kb;
        }
    }
    if (total_kb == 0) {
        return Error{ErrorCode::Io, "cannot read " + (paths_.proc_root / "meminfo").string()};
    }
    raw.memory_percent = 100.0f * static_cast<float>(total_kb - std::min(available_kb, total_kb))
                       / static_cast<float>(total_kb);

    // CPU
    raw.cpu_percent = sample_cpu();

    // Disk
    struct statvfs fs{};
    if (::statvfs(paths_.disk_path.c_str(), &fs) == 0) {
        auto used = static_cast<double>(fs.f_blocks - fs.f_bfree) * fs.f_frsize;
        auto avail = static_cast<double>(fs.f_bavail) * fs.f_frsize;
        if (used + avail > 0.0) {
            raw.disk_percent = static_cast<float>(100.0 * used / (used + avail));
        }
    }

    raw.temperatures = read_temperatures();
    return raw;
}

float LinuxSystemProbe::sample_cpu() {
    auto lines = read_file_lines(paths_.proc_root / "stat");
    if (lines.empty()) return 0.0f;
    auto curr = parse_cpu_line(lines[0]);
    auto percent = compute_cpu_percent(prev_cpu_times_, curr);
    prev_cpu_times_ = curr;
    return percent;
}

std::map<std::string, std::vector<float>> LinuxSystemProbe::read_temperatures() const {
    std::map<std::string, std::vector<float>> sensors;
    std::error_code ec;

    // hwmon: one "name" per chip, several temp*_input files
    auto hwmon_root = paths_.sys_class_root / "hwmon";
    for (std::filesystem::directory_iterator it(hwmon_root, ec), end; !ec && it != end; it.increment(ec)) {
        const auto chip = it->path();
        auto name = read_file_line(chip / "name");
        if (name.empty()) name = chip.filename().string();

        std::vector<std::pair<int, float>> readings;
        std::error_code inner;
        for (std::filesystem::directory_iterator f(chip, inner), fend; !inner && f != fend; f.increment(inner)) {
            auto index = temp_input_index(f->path().filename().string());
            float celsius = 0.0f;
            if (index > 0 && read_millidegrees(f->path(), celsius)) {
                readings.emplace_back(index, celsius);
            }
        }
        std::sort(readings.begin(), readings.end());
        for (const auto& [index, celsius] : readings) {
            sensors[name].push_back(celsius);
        }
    }

    // thermal zones: keyed by "type", and by directory name when it differs
    ec.clear();
    auto thermal_root = paths_.sys_class_root / "thermal";
    for (std::filesystem::directory_iterator it(thermal_root, ec), end; !ec && it != end; it.increment(ec)) {
        const auto zone = it->path();
        const auto dir_name = zone.filename().string();
        if (!dir_name.starts_with("thermal_zone")) continue;

        float celsius = 0.0f;
        if (!read_millidegrees(zone / "temp", celsius)) continue;

        auto type = read_file_line(zone / "type");
        if (type.empty()) type = dir_name;
        sensors[type].push_back(celsius);
        if (type != dir_name) {
            sensors[dir_name].push_back(celsius);
        }
    }

    return sensors;
}

}  // namespace edge_sentinel
