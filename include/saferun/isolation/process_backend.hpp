/**
 * @file process_backend.hpp
 * @brief Isolation through a constrained process group on the host kernel
 *
 * @date 2025
 */

#pragma once

#include "saferun/isolation/isolation_backend.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <sys/types.h>

namespace saferun {
namespace isolation {

/**
 * @class ProcessBackend
 * @brief Runs the target as the leader of a fresh process group
 *
 * Prepare forks a child that becomes its own process group, applies
 * rlimits (address space, CPU seconds as a timeout backstop, no core
 * dumps) and, when networking is denied, moves into a private network
 * namespace. Inherited descriptors are closed and signal state is reset
 * to defaults. The child then blocks until Launch hands it the staged
 * target path over a pipe. A close-on-exec status pipe reports setup and
 * exec failures back to the parent.
 *
 * The staged copy lives in a per-session working directory that Teardown
 * removes.
 *
 * **Thread Safety**: Poll/CollectStats run on the observer thread while
 * EnforceKill may come from a canceller; state is guarded by a mutex.
 */
class ProcessBackend : public IsolationBackend {
public:
    struct Options {
        std::filesystem::path work_root;                   ///< Parent of session directories (empty = temp dir)
        std::filesystem::path proc_root{"/proc"};          ///< procfs used for statistics
        std::chrono::seconds cpu_backstop_slack{5};        ///< RLIMIT_CPU = timeout + slack
    };

    explicit ProcessBackend(const Options& options);
    ~ProcessBackend() override;

    ProcessBackend(const ProcessBackend&) = delete;
    ProcessBackend& operator=(const ProcessBackend&) = delete;

    BackendHandle Prepare(const core::ResourceLimits& limits) override;
    void Launch(BackendHandle& handle, const std::filesystem::path& target) override;
    core::ResourceUsageSample CollectStats(const BackendHandle& handle) override;
    std::optional<int> Poll(const BackendHandle& handle) override;
    void EnforceKill(const BackendHandle& handle) noexcept override;
    void Teardown(const BackendHandle& handle) noexcept override;
    std::string Name() const override { return "process"; }

    /**
     * @brief Whether Prepare moves the target into a private network namespace
     *
     * The host network can only be shared or withheld as a whole, so denied
     * outbound traffic or any restricted domain denies networking entirely.
     */
    static bool DeniesNetwork(const core::ResourceLimits& limits);

    /// Per-session working directory holding the staged target
    const std::filesystem::path& WorkDirectory() const { return work_dir_; }

private:
    std::optional<int> ReapLocked(bool block);
    void CloseDescriptors();

    Options options_;
    std::mutex mutex_;

    pid_t child_{-1};
    int go_fd_{-1};          ///< Parent writes the target path here
    int status_fd_{-1};      ///< Child reports setup/exec failures here
    std::filesystem::path work_dir_;
    std::optional<int> exit_code_;
    bool launched_{false};
    bool killed_{false};
    bool torn_down_{false};

    // CPU accounting between two samples
    std::uint64_t last_ticks_{0};
    std::chrono::steady_clock::time_point last_sample_at_;
    bool has_last_sample_{false};
};

} // namespace isolation
} // namespace saferun
