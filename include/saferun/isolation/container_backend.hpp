/**
 * @file container_backend.hpp
 * @brief Isolation through a docker / podman container
 *
 * @date 2025
 */

#pragma once

#include "saferun/isolation/isolation_backend.hpp"
#include "saferun/utils/container_utils.hpp"

#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace saferun {
namespace isolation {

/**
 * @class ContainerBackend
 * @brief Runs the target inside an idle, hardened container
 *
 * Prepare starts `<image> tail -f /dev/null` with memory/CPU limits, the
 * network mode of the security profile, per-level capability dropping and
 * restricted domains sinkholed via `--add-host`. Launch copies the target
 * into `/sandbox`, marks it executable and execs it detached; the exit
 * status is written to `/sandbox/.exit_code` for Poll to read.
 *
 * **Security Hardening per level**:
 * - HIGH: `--cap-drop ALL`, `no-new-privileges`, no network
 * - MEDIUM: drop NET_ADMIN and SYS_ADMIN
 * - LOW: runtime defaults
 */
class ContainerBackend : public IsolationBackend {
public:
    struct Options {
        std::string image{"alpine:latest"};
        int pids_limit{128};
        core::SecurityLevel security_level{core::SecurityLevel::MEDIUM};
    };

    ContainerBackend(std::shared_ptr<utils::ContainerUtils> runtime, const Options& options);
    ~ContainerBackend() override = default;

    BackendHandle Prepare(const core::ResourceLimits& limits) override;
    void Launch(BackendHandle& handle, const std::filesystem::path& target) override;
    core::ResourceUsageSample CollectStats(const BackendHandle& handle) override;
    std::optional<int> Poll(const BackendHandle& handle) override;
    void EnforceKill(const BackendHandle& handle) noexcept override;
    void Teardown(const BackendHandle& handle) noexcept override;
    std::string Name() const override { return "container"; }

    /// `run` configuration for the given limits
    utils::ContainerConfig BuildContainerConfig(const core::ResourceLimits& limits,
                                                const std::string& name) const;

    static constexpr const char* kSandboxDir = "/sandbox";
    static constexpr const char* kExitCodeFile = "/sandbox/.exit_code";

private:
    std::shared_ptr<utils::ContainerUtils> runtime_;
    Options options_;

    std::mutex mutex_;
    std::set<std::string> killed_;
    std::set<std::string> torn_down_;
};

} // namespace isolation
} // namespace saferun
