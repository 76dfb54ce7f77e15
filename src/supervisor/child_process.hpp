/**
 * @file child_process.hpp
 * @brief RAII handle over a fork+exec'd child process (no shell).
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace edge_sentinel {

struct SpawnOptions {
    std::vector<std::string> argv;                  ///< argv[0] resolved via PATH
    std::map<std::string, std::string> extra_env;   ///< Added to (or overriding) the parent env
    std::filesystem::path stdout_path;              ///< Appended; empty = /dev/null
    std::filesystem::path stderr_path;              ///< Appended; empty = /dev/null
    std::filesystem::path working_dir;              ///< Empty = inherit
};

/**
 * @brief Owns one child process.
 *
 * Exec failures are reported synchronously through a close-on-exec pipe, so
 * spawn() only succeeds once the new program image is running. Destroying a
 * handle whose child is still alive kills and reaps it.
 */
class ChildProcess {
public:
    static Result<std::unique_ptr<ChildProcess>> spawn(const SpawnOptions& options);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    /// Non-blocking liveness check; reaps the child if it has exited.
    [[nodiscard]] bool running();

    /// Raw wait status once the child has been reaped.
    [[nodiscard]] std::optional<int> wait_status() const noexcept { return wait_status_; }

    Result<void> send_signal(int signal);

    /// Poll until the child exits or @p timeout elapses. True if it exited.
    bool wait_for(Milliseconds timeout);

    /**
     * @brief SIGTERM, wait @p grace, then SIGKILL, wait @p kill_wait.
     * @return True if the child has exited.
     */
    bool terminate(Milliseconds grace = std::chrono::seconds(5),
                   Milliseconds kill_wait = std::chrono::seconds(2));

private:
    explicit ChildProcess(pid_t pid) : pid_(pid) {}

    pid_t pid_;
    bool reaped_{false};
    std::optional<int> wait_status_;
};

/// "exited with 1", "killed by signal 9", …
[[nodiscard]] std::string describe_wait_status(int status);

}  // namespace edge_sentinel
