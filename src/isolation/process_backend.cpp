/**
 * @file process_backend.cpp
 * @brief Implementation of process-group isolation
 *
 * **Child protocol**:
 * ```
 * parent                         child
 *   fork ───────────────────────▶ close inherited fds, reset signals,
 *                                  setpgid, setrlimit, unshare(NET), chdir
 *   read status  ◀──── 'R' ────── ready
 *   (Launch) write path ────────▶ read path until EOF
 *   read status  ◀──── EOF ────── execv succeeded (status fd is CLOEXEC)
 *                ◀──── 'X' ────── execv failed, errno attached
 * ```
 *
 * Only async-signal-safe calls are made in the child between fork and exec.
 *
 * @date 2025
 */

#include "saferun/isolation/process_backend.hpp"
#include "saferun/core/errors.hpp"
#include "saferun/utils/proc_utils.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <ctime>
#include <string>
#include <vector>

#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <sched.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

namespace saferun {
namespace isolation {

namespace fs = std::filesystem;

using core::ErrorCode;
using core::SandboxError;

namespace {

// Status record sent from the child
struct ChildStatus {
    char kind;    ///< 'R' ready, 'E' setup error, 'X' exec error
    int stage;
    int error;
};

enum ChildStage {
    STAGE_NONE = 0,
    STAGE_PROCESS_GROUP,
    STAGE_MEMORY_LIMIT,
    STAGE_CPU_LIMIT,
    STAGE_CORE_LIMIT,
    STAGE_NETWORK_NAMESPACE,
    STAGE_WORK_DIRECTORY,
    STAGE_READ_TARGET,
    STAGE_EXEC
};

const char* StageName(int stage) {
    switch (stage) {
        case STAGE_PROCESS_GROUP: return "process group";
        case STAGE_MEMORY_LIMIT: return "memory limit";
        case STAGE_CPU_LIMIT: return "CPU limit";
        case STAGE_CORE_LIMIT: return "core dump limit";
        case STAGE_NETWORK_NAMESPACE: return "network namespace";
        case STAGE_WORK_DIRECTORY: return "working directory";
        case STAGE_READ_TARGET: return "target handoff";
        case STAGE_EXEC: return "exec";
        default: return "setup";
    }
}

// Reads one status record; 0 on EOF, -1 on error
ssize_t ReadStatus(int fd, ChildStatus& status) {
    std::size_t done = 0;
    auto* bytes = reinterpret_cast<char*>(&status);
    while (done < sizeof(status)) {
        ssize_t n = read(fd, bytes + done, sizeof(status) - done);
        if (n == 0) {
            return done == 0 ? 0 : -1;
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return -1;
        }
        done += static_cast<std::size_t>(n);
    }
    return static_cast<ssize_t>(done);
}

// Writes to a pipe with SIGPIPE blocked on this thread, consuming any pending SIGPIPE.
// Returns 0 or the errno of the failed write.
int WriteAll(int fd, const std::string& data) {
    sigset_t pipe_set, old_set;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set);

    int error = 0;
    std::size_t done = 0;
    while (done < data.size()) {
        ssize_t n = write(fd, data.data() + done, data.size() - done);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = errno;
            break;
        }
        done += static_cast<std::size_t>(n);
    }

    if (error == EPIPE) {
        struct timespec zero = {0, 0};
        sigtimedwait(&pipe_set, nullptr, &zero);
    }
    pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
    return error;
}

[[noreturn]] void ChildFail(int status_fd, char kind, int stage) {
    ChildStatus status{kind, stage, errno};
    ssize_t ignored = write(status_fd, &status, sizeof(status));
    (void)ignored;
    _exit(kind == 'X' ? 127 : 126);
}

// Lowers a limit; a hard limit already below the value is kept
bool SetLimit(decltype(RLIMIT_AS) resource, rlim_t value) {
    struct rlimit limit;
    if (getrlimit(resource, &limit) == 0 && limit.rlim_max != RLIM_INFINITY &&
        limit.rlim_max < value) {
        value = limit.rlim_max;
    }
    limit.rlim_cur = value;
    limit.rlim_max = value;
    return setrlimit(resource, &limit) == 0;
}

// Descriptors open in this process, gathered before fork
std::vector<int> ListOpenDescriptors() {
    std::vector<int> fds;
    std::error_code ec;
    for (fs::directory_iterator it("/proc/self/fd", ec), end; !ec && it != end; it.increment(ec)) {
        try {
            int fd = std::stoi(it->path().filename().string());
            if (fd > STDERR_FILENO) {
                fds.push_back(fd);
            }
        } catch (const std::exception&) {
            continue;
        }
    }
    return fds;
}

fs::path CreateSessionDirectory(const fs::path& configured_root) {
    static std::atomic<unsigned> counter{0};

    fs::path root = configured_root.empty() ? fs::temp_directory_path() / "saferun" : configured_root;
    fs::create_directories(root);

    fs::path dir = root / ("session-" + std::to_string(getpid()) + "-" +
                           std::to_string(counter++) + "-" + std::to_string(std::time(nullptr)));
    fs::create_directory(dir);
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace);
    return dir;
}

} // anonymous namespace

ProcessBackend::ProcessBackend(const Options& options)
    : options_(options) {
}

ProcessBackend::~ProcessBackend() {
    if (child_ > 0 && !torn_down_) {
        Teardown(BackendHandle{});
    }
}

// ============================================================================
// PREPARE
// ============================================================================

bool ProcessBackend::DeniesNetwork(const core::ResourceLimits& limits) {
    // Only all-or-nothing is enforceable on the host; any finer rule denies the network
    return !limits.network_access_allowed ||
           !limits.network.outbound ||
           !limits.network.restricted_domains.empty();
}

BackendHandle ProcessBackend::Prepare(const core::ResourceLimits& limits) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (child_ > 0) {
        throw SandboxError(ErrorCode::RESOURCE_ALLOCATION_FAILED,
                           "Process backend already prepared");
    }

    try {
        work_dir_ = CreateSessionDirectory(options_.work_root);
    } catch (const fs::filesystem_error& e) {
        throw SandboxError(ErrorCode::RESOURCE_ALLOCATION_FAILED,
                           std::string("Failed to create working directory: ") + e.what());
    }

    auto abandon_work_dir = [this]() {
        std::error_code ec;
        fs::remove_all(work_dir_, ec);
        work_dir_.clear();
    };

    int go_pipe[2];
    int status_pipe[2];
    if (pipe2(go_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        abandon_work_dir();
        throw SandboxError(ErrorCode::RESOURCE_ALLOCATION_FAILED,
                           std::string("pipe failed: ") + std::strerror(saved));
    }
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        close(go_pipe[0]);
        close(go_pipe[1]);
        abandon_work_dir();
        throw SandboxError(ErrorCode::RESOURCE_ALLOCATION_FAILED,
                           std::string("pipe failed: ") + std::strerror(saved));
    }

    // Everything the child touches is computed before fork
    const std::string work_dir = work_dir_.string();
    const rlim_t memory_limit = static_cast<rlim_t>(limits.memory_bytes);
    const rlim_t cpu_seconds = static_cast<rlim_t>(
        (limits.execution_timeout + options_.cpu_backstop_slack).count());
    const bool deny_network = DeniesNetwork(limits);
    if (deny_network && limits.network_access_allowed) {
        spdlog::warn("⚠ Network rules cannot be enforced per host or direction; network denied");
    }
    const std::vector<int> inherited = ListOpenDescriptors();

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close(go_pipe[0]);
        close(go_pipe[1]);
        close(status_pipe[0]);
        close(status_pipe[1]);
        abandon_work_dir();
        throw SandboxError(ErrorCode::RESOURCE_ALLOCATION_FAILED,
                           std::string("fork failed: ") + std::strerror(saved));
    }

    if (pid == 0) {
        // ---- child ----
        close(go_pipe[1]);
        close(status_pipe[0]);
        const int in_fd = go_pipe[0];
        const int status_fd = status_pipe[1];

        for (int fd : inherited) {
            if (fd != in_fd && fd != status_fd) {
                close(fd);
            }
        }

        // The analyzer blocks SIGINT/SIGTERM; the target starts from a clean slate
        struct sigaction default_action;
        std::memset(&default_action, 0, sizeof(default_action));
        default_action.sa_handler = SIG_DFL;
        sigemptyset(&default_action.sa_mask);
        for (int sig = 1; sig < NSIG; ++sig) {
            if (sig != SIGKILL && sig != SIGSTOP) {
                sigaction(sig, &default_action, nullptr);
            }
        }
        sigset_t empty_set;
        sigemptyset(&empty_set);
        sigprocmask(SIG_SETMASK, &empty_set, nullptr);

        if (setpgid(0, 0) != 0) ChildFail(status_fd, 'E', STAGE_PROCESS_GROUP);
        if (!SetLimit(RLIMIT_AS, memory_limit)) ChildFail(status_fd, 'E', STAGE_MEMORY_LIMIT);
        if (!SetLimit(RLIMIT_CPU, cpu_seconds)) ChildFail(status_fd, 'E', STAGE_CPU_LIMIT);
        if (!SetLimit(RLIMIT_CORE, 0)) ChildFail(status_fd, 'E', STAGE_CORE_LIMIT);
        if (deny_network &&
            unshare(CLONE_NEWNET) != 0 &&
            unshare(CLONE_NEWUSER | CLONE_NEWNET) != 0) {
            ChildFail(status_fd, 'E', STAGE_NETWORK_NAMESPACE);
        }
        if (chdir(work_dir.c_str()) != 0) ChildFail(status_fd, 'E', STAGE_WORK_DIRECTORY);

        ChildStatus ready{'R', STAGE_NONE, 0};
        if (write(status_fd, &ready, sizeof(ready)) != static_cast<ssize_t>(sizeof(ready))) {
            _exit(126);
        }

        char path[PATH_MAX];
        std::size_t length = 0;
        for (;;) {
            ssize_t n = read(in_fd, path + length, sizeof(path) - 1 - length);
            if (n == 0) {
                break;
            }
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                ChildFail(status_fd, 'E', STAGE_READ_TARGET);
            }
            length += static_cast<std::size_t>(n);
            if (length >= sizeof(path) - 1) {
                break;
            }
        }
        if (length == 0) {
            _exit(0);  // Torn down before launch
        }
        path[length] = '\0';

        char* const argv[] = {path, nullptr};
        execv(path, argv);
        ChildFail(status_fd, 'X', STAGE_EXEC);
    }

    // ---- parent ----
    close(go_pipe[0]);
    close(status_pipe[1]);
    child_ = pid;
    go_fd_ = go_pipe[1];
    status_fd_ = status_pipe[0];

    ChildStatus status{};
    ssize_t n = ReadStatus(status_fd_, status);
    if (n <= 0 || status.kind != 'R') {
        std::string cause = n > 0
            ? std::string(StageName(status.stage)) + ": " + std::strerror(status.error)
            : std::string("child exited during setup");

        kill(child_, SIGKILL);
        ReapLocked(true);
        CloseDescriptors();
        abandon_work_dir();
        child_ = -1;

        throw SandboxError(ErrorCode::RESOURCE_ALLOCATION_FAILED,
                           "Failed to prepare isolated process (" + cause + ")");
    }

    BackendHandle handle;
    handle.id = work_dir_.filename().string();
    handle.native_id = std::to_string(pid);
    handle.scope.process_group = pid;
    handle.limits = limits;

    spdlog::info("✓ Isolated process group {} ready (network {})",
                 pid, deny_network ? "namespaced" : "shared");
    return handle;
}

// ============================================================================
// LAUNCH
// ============================================================================

void ProcessBackend::Launch(BackendHandle& handle, const fs::path& target) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (child_ <= 0 || go_fd_ < 0 || killed_) {
        throw SandboxError(ErrorCode::LAUNCH_FAILED, "Process backend is not prepared");
    }

    // Stage a private, executable copy
    fs::path staged = work_dir_ / target.filename();
    try {
        fs::copy_file(target, staged, fs::copy_options::overwrite_existing);
        fs::permissions(staged,
                        fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                        fs::perms::others_read | fs::perms::others_exec,
                        fs::perm_options::replace);
    } catch (const fs::filesystem_error& e) {
        throw SandboxError(ErrorCode::LAUNCH_FAILED,
                           std::string("Failed to stage target: ") + e.what());
    }

    int write_error = WriteAll(go_fd_, staged.string());
    close(go_fd_);
    go_fd_ = -1;
    if (write_error != 0) {
        throw SandboxError(ErrorCode::LAUNCH_FAILED,
                           std::string("Failed to hand target to child: ") + std::strerror(write_error));
    }

    ChildStatus status{};
    ssize_t n = ReadStatus(status_fd_, status);
    close(status_fd_);
    status_fd_ = -1;

    if (n > 0) {
        throw SandboxError(ErrorCode::LAUNCH_FAILED,
                           "Failed to execute " + staged.filename().string() + " (" +
                           StageName(status.stage) + ": " + std::strerror(status.error) + ")");
    }
    if (n < 0) {
        throw SandboxError(ErrorCode::LAUNCH_FAILED, "Lost contact with the isolated process");
    }

    launched_ = true;
    handle.native_id = std::to_string(child_);
    spdlog::info("✓ Target launched as pid {} ({})", child_, staged.filename().string());
}

// ============================================================================
// OBSERVATION
// ============================================================================

core::ResourceUsageSample ProcessBackend::CollectStats(const BackendHandle& /*handle*/) {
    std::lock_guard<std::mutex> lock(mutex_);

    core::ResourceUsageSample sample;
    sample.taken_at = std::chrono::steady_clock::now();
    if (child_ <= 0 || torn_down_) {
        return sample;
    }

    std::uint64_t ticks = 0;
    for (pid_t pid : utils::ProcUtils::ListPids(options_.proc_root)) {
        auto stat = utils::ProcUtils::ReadStat(options_.proc_root, pid);
        if (!stat || stat->pgrp != child_ || stat->state == 'Z') {
            continue;
        }
        ticks += stat->utime + stat->stime;
        sample.memory_bytes += utils::ProcUtils::ReadRssBytes(options_.proc_root, pid).value_or(0);
        ++sample.process_count;
    }

    if (sample.process_count == 0) {
        return sample;
    }

    if (has_last_sample_ && ticks >= last_ticks_) {
        double elapsed = std::chrono::duration<double>(sample.taken_at - last_sample_at_).count();
        if (elapsed > 0) {
            double cpu_seconds = static_cast<double>(ticks - last_ticks_) /
                                 static_cast<double>(utils::ProcUtils::ClockTicks());
            sample.cpu_percent = cpu_seconds / elapsed * 100.0;
        }
    }
    last_ticks_ = ticks;
    last_sample_at_ = sample.taken_at;
    has_last_sample_ = true;

    sample.valid = true;
    return sample;
}

std::optional<int> ProcessBackend::Poll(const BackendHandle& /*handle*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!launched_) {
        return std::nullopt;
    }
    return ReapLocked(false);
}

std::optional<int> ProcessBackend::ReapLocked(bool block) {
    if (exit_code_ || child_ <= 0) {
        return exit_code_;
    }

    int status = 0;
    pid_t result;
    do {
        result = waitpid(child_, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == child_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        } else {
            exit_code_ = -1;
        }
    } else if (result < 0 && errno == ECHILD) {
        exit_code_ = -1;
    }
    return exit_code_;
}

// ============================================================================
// TERMINATION
// ============================================================================

void ProcessBackend::EnforceKill(const BackendHandle& /*handle*/) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (killed_ || torn_down_ || child_ <= 0) {
        return;
    }
    killed_ = true;

    if (killpg(child_, SIGKILL) != 0 && errno != ESRCH) {
        spdlog::warn("⚠ killpg({}) failed: {}", child_, std::strerror(errno));
    }
}

void ProcessBackend::Teardown(const BackendHandle& /*handle*/) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (torn_down_) {
        return;
    }
    torn_down_ = true;

    if (child_ > 0) {
        // Survivors of the group go too, even when the leader already exited
        if (!killed_ && killpg(child_, SIGKILL) != 0 && errno != ESRCH) {
            spdlog::warn("⚠ killpg({}) failed: {}", child_, std::strerror(errno));
        }
        killed_ = true;
        ReapLocked(true);
    }
    CloseDescriptors();

    if (!work_dir_.empty()) {
        std::error_code ec;
        fs::remove_all(work_dir_, ec);
        if (ec) {
            spdlog::warn("⚠ Failed to remove {}: {}", work_dir_.string(), ec.message());
        }
    }
}

void ProcessBackend::CloseDescriptors() {
    if (go_fd_ >= 0) {
        close(go_fd_);
        go_fd_ = -1;
    }
    if (status_fd_ >= 0) {
        close(status_fd_);
        status_fd_ = -1;
    }
}

} // namespace isolation
} // namespace saferun
