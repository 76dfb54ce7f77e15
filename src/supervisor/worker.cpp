/**
 * @file worker.cpp
 * @brief Worker state transition rules.
 */

#include "supervisor/worker.hpp"

namespace edge_sentinel {

bool is_legal_transition(WorkerState from, WorkerState to, bool essential) noexcept {
    switch (from) {
        case WorkerState::Stopped:
            return to == WorkerState::Running
                || to == WorkerState::Restarting
                || to == WorkerState::Failed;
        case WorkerState::Running:
            return (to == WorkerState::Paused && !essential)
                || to == WorkerState::Restarting
                || to == WorkerState::Stopped
                || to == WorkerState::Failed;
        case WorkerState::Paused:
            return to == WorkerState::Running
                || to == WorkerState::Stopped;
        case WorkerState::Restarting:
            return to == WorkerState::Running
                || to == WorkerState::Failed
                || to == WorkerState::Stopped;
        case WorkerState::Failed:
            return false;
    }
    return false;
}

Result<void> WorkerProcess::transition_to(WorkerState next) {
    if (!is_legal_transition(state, next, essential)) {
        return Error{ErrorCode::InvalidState,
                     "worker '" + name + "': illegal transition "
                     + std::string(to_string(state)) + " -> " + std::string(to_string(next))};
    }
    state = next;
    return Result<void>{};
}

}  // namespace edge_sentinel
