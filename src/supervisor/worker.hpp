/**
 * @file worker.hpp
 * @brief Managed worker entity and its lifecycle state machine.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "supervisor/child_process.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace edge_sentinel {

// ─────────────────────────────────────────────
// Worker State Machine
// ─────────────────────────────────────────────

enum class WorkerState : uint8_t {
    Stopped,
    Running,
    Paused,
    Restarting,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(WorkerState state) noexcept {
    switch (state) {
        case WorkerState::Stopped:    return "stopped";
        case WorkerState::Running:    return "running";
        case WorkerState::Paused:     return "paused";
        case WorkerState::Restarting: return "restarting";
        case WorkerState::Failed:     return "failed";
    }
    return "unknown";
}

/**
 * @brief Legal lifecycle edges.
 *
 *   STOPPED    → RUNNING | RESTARTING | FAILED
 *   RUNNING    → PAUSED (non-essential) | RESTARTING | STOPPED | FAILED
 *   PAUSED     → RUNNING | STOPPED
 *   RESTARTING → RUNNING | FAILED | STOPPED
 *   FAILED     → (terminal)
 */
[[nodiscard]] bool is_legal_transition(WorkerState from, WorkerState to, bool essential) noexcept;

// ─────────────────────────────────────────────
// WorkerProcess
// ─────────────────────────────────────────────

/**
 * @brief One managed child process; owned and mutated only by WorkerSupervisor.
 *
 * The process handle is held iff the state is RUNNING, PAUSED or RESTARTING.
 */
struct WorkerProcess {
    WorkerName name;
    std::vector<std::string> command;
    bool essential{false};
    uint32_t max_restarts{10};
    bool heartbeat_enabled{false};
    std::optional<std::filesystem::path> heartbeat_path;
    std::optional<std::filesystem::path> stop_signal_path;

    WorkerState state{WorkerState::Stopped};
    uint32_t restart_count{0};
    std::unique_ptr<ChildProcess> process;

    [[nodiscard]] std::optional<pid_t> pid() const noexcept {
        if (!process) return std::nullopt;
        return process->pid();
    }

    /// Move to @p next, or ErrorCode::InvalidState if the edge is illegal.
    Result<void> transition_to(WorkerState next);
};

/**
 * @brief Point-in-time view of one worker, as returned by status().
 */
struct WorkerStatus {
    WorkerState state{WorkerState::Stopped};
    std::optional<pid_t> pid;
    uint32_t restart_count{0};
    bool essential{false};
};

}  // namespace edge_sentinel
