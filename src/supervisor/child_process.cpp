/**
 * @file child_process.cpp
 * @brief ChildProcess implementation over fork/execvpe/waitpid.
 */

#include "supervisor/child_process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

extern char** environ;

namespace edge_sentinel {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);

std::string errno_message(int err) {
    return std::strerror(err);
}

int open_output(const std::filesystem::path& path) {
    if (path.empty()) {
        return ::open("/dev/null", O_WRONLY | O_CLOEXEC);
    }
    return ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
}

/// Closes the descriptors it holds on scope exit.
struct FdGuard {
    std::vector<int> fds;
    ~FdGuard() {
        for (int fd : fds) {
            if (fd >= 0) ::close(fd);
        }
    }
    void release(int fd) {
        for (int& held : fds) {
            if (held == fd) held = -1;
        }
    }
};

}  // anonymous namespace

std::string describe_wait_status(int status) {
    if (WIFEXITED(status)) {
        return "exited with " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "status " + std::to_string(status);
}

Result<std::unique_ptr<ChildProcess>> ChildProcess::spawn(const SpawnOptions& options) {
    if (options.argv.empty() || options.argv.front().empty()) {
        return Error{ErrorCode::Spawn, "empty command"};
    }

    // Everything the child touches is built before fork().
    std::vector<char*> argv;
    argv.reserve(options.argv.size() + 1);
    for (const auto& arg : options.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view kv(*entry);
        auto key = kv.substr(0, kv.find('='));
        if (options.extra_env.find(std::string(key)) == options.extra_env.end()) {
            env_storage.emplace_back(kv);
        }
    }
    for (const auto& [key, value] : options.extra_env) {
        env_storage.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& kv : env_storage) {
        envp.push_back(kv.data());
    }
    envp.push_back(nullptr);

    const char* working_dir = options.working_dir.empty() ? nullptr : options.working_dir.c_str();

    FdGuard guard;
    int stdin_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    int stdout_fd = open_output(options.stdout_path);
    int stderr_fd = open_output(options.stderr_path);
    guard.fds = {stdin_fd, stdout_fd, stderr_fd};
    if (stdin_fd < 0 || stdout_fd < 0 || stderr_fd < 0) {
        return Error{ErrorCode::Spawn, "cannot open child stdio: " + errno_message(errno)};
    }

    int status_pipe[2]{-1, -1};
    if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
        return Error{ErrorCode::Spawn, "pipe2 failed: " + errno_message(errno)};
    }
    guard.fds.push_back(status_pipe[0]);
    guard.fds.push_back(status_pipe[1]);

    const pid_t pid = ::fork();
    if (pid < 0) {
        return Error{ErrorCode::Spawn, "fork failed: " + errno_message(errno)};
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);

        dup2(stdin_fd, STDIN_FILENO);
        dup2(stdout_fd, STDOUT_FILENO);
        dup2(stderr_fd, STDERR_FILENO);

        int err = 0;
        if (working_dir != nullptr && ::chdir(working_dir) != 0) {
            err = errno;
        } else {
            execvpe(argv[0], argv.data(), envp.data());
            err = errno;
        }
        [[maybe_unused]] auto written = ::write(status_pipe[1], &err, sizeof(err));
        _exit(127);
    }

    ::close(status_pipe[1]);
    guard.release(status_pipe[1]);

    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        return Error{ErrorCode::Spawn,
                     "cannot execute '" + options.argv.front() + "': " + errno_message(child_errno)};
    }

    return std::unique_ptr<ChildProcess>(new ChildProcess(pid));
}

ChildProcess::~ChildProcess() {
    if (!reaped_ && pid_ > 0) {
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
    }
}

bool ChildProcess::running() {
    if (reaped_) return false;

    int status = 0;
    pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == 0) return true;
    if (result == pid_) {
        reaped_ = true;
        wait_status_ = status;
        return false;
    }
    if (errno == EINTR) return true;
    // ECHILD: reaped elsewhere
    reaped_ = true;
    return false;
}

Result<void> ChildProcess::send_signal(int signal) {
    if (reaped_) {
        return Error{ErrorCode::InvalidState, "process " + std::to_string(pid_) + " already exited"};
    }
    if (::kill(pid_, signal) != 0) {
        return Error{ErrorCode::Signal, "kill(" + std::to_string(pid_) + ", " + std::to_string(signal)
                                        + ") failed: " + errno_message(errno)};
    }
    return Result<void>{};
}

bool ChildProcess::wait_for(Milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (running()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    return true;
}

bool ChildProcess::terminate(Milliseconds grace, Milliseconds kill_wait) {
    if (!running()) return true;

    if (send_signal(SIGTERM) && wait_for(grace)) {
        return true;
    }
    if (!running()) return true;

    if (auto killed = send_signal(SIGKILL); !killed) {
        return !running();
    }
    return wait_for(kill_wait);
}

}  // namespace edge_sentinel
