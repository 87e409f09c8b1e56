/**
 * @file isolation_backend.hpp
 * @brief Abstract isolation capability used by the orchestrator
 *
 * A backend provides an isolated, resource-constrained environment for one
 * session. Backends signal failures by throwing core::SandboxError with one
 * of BACKEND_UNAVAILABLE, RESOURCE_ALLOCATION_FAILED or LAUNCH_FAILED.
 *
 * @date 2025
 */

#pragma once

#include "saferun/core/types.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>

namespace saferun {
namespace isolation {

/**
 * @struct ProcessScope
 * @brief How collectors recognize processes belonging to the sandbox
 *
 * Exactly one of the fields is meaningful: a process group id for process
 * isolation, or a cgroup token (the container id) for containers.
 */
struct ProcessScope {
    pid_t process_group{-1};    ///< Members have this pgid
    std::string cgroup_token;   ///< Members have this token in /proc/<pid>/cgroup

    bool IsProcessGroup() const { return process_group > 0; }
    bool IsCgroup() const { return !cgroup_token.empty(); }
};

/**
 * @struct BackendHandle
 * @brief Opaque reference to a prepared environment
 */
struct BackendHandle {
    std::string id;               ///< Backend-local identifier
    std::string native_id;        ///< Container id or root pid
    ProcessScope scope;           ///< Attribution scope for collectors
    core::ResourceLimits limits;  ///< Limits fixed at Prepare
};

/**
 * @class IsolationBackend
 * @brief One isolation variant; one instance serves one session
 *
 * Lifecycle: Prepare → Launch → (Poll / CollectStats)* → EnforceKill → Teardown.
 * EnforceKill and Teardown are idempotent and never throw.
 */
class IsolationBackend {
public:
    virtual ~IsolationBackend() = default;

    /**
     * @brief Acquire the environment with the given limits
     * @throws core::SandboxError BACKEND_UNAVAILABLE or RESOURCE_ALLOCATION_FAILED
     */
    virtual BackendHandle Prepare(const core::ResourceLimits& limits) = 0;

    /**
     * @brief Stage the target into the environment and start it
     * @throws core::SandboxError LAUNCH_FAILED
     */
    virtual void Launch(BackendHandle& handle, const std::filesystem::path& target) = 0;

    /// Current usage; `valid == false` when it could not be sampled
    virtual core::ResourceUsageSample CollectStats(const BackendHandle& handle) = 0;

    /// Exit code once the target has exited
    virtual std::optional<int> Poll(const BackendHandle& handle) = 0;

    /// Terminate everything in the environment
    virtual void EnforceKill(const BackendHandle& handle) noexcept = 0;

    /// Release all resources of the environment
    virtual void Teardown(const BackendHandle& handle) noexcept = 0;

    /// Backend name used in reports ("container", "process")
    virtual std::string Name() const = 0;
};

/// Creates the backend serving a request (method and security level)
using BackendFactory =
    std::function<std::unique_ptr<IsolationBackend>(const core::ExecutionRequest&)>;

} // namespace isolation
} // namespace saferun
