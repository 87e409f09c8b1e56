/**
 * @file container_backend.cpp
 * @brief Implementation of container isolation
 *
 * @date 2025
 */

#include "saferun/isolation/container_backend.hpp"
#include "saferun/core/errors.hpp"
#include "saferun/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>

namespace saferun {
namespace isolation {

using core::ErrorCode;
using core::SandboxError;
using utils::StringUtils;

namespace {

std::string NextContainerName() {
    static std::atomic<unsigned> counter{0};
    auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "saferun-" + std::to_string(stamp) + "-" + std::to_string(counter++);
}

std::string ShortId(const std::string& id) {
    return StringUtils::Truncate(id, 12, "");
}

std::string SingleQuoted(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        quoted += (c == '\'') ? std::string("'\\''") : std::string(1, c);
    }
    return quoted + "'";
}

} // anonymous namespace

ContainerBackend::ContainerBackend(std::shared_ptr<utils::ContainerUtils> runtime,
                                   const Options& options)
    : runtime_(std::move(runtime)), options_(options) {
}

// ============================================================================
// PREPARE
// ============================================================================

utils::ContainerConfig ContainerBackend::BuildContainerConfig(const core::ResourceLimits& limits,
                                                              const std::string& name) const {
    utils::ContainerConfig config;
    config.name = name;
    config.image = options_.image;
    config.memory_limit_mb = std::max<std::uint64_t>(1, limits.memory_bytes / (1024 * 1024));
    config.cpu_limit = limits.cpu_percent / 100.0;
    config.pids_limit = options_.pids_limit;
    config.working_dir = kSandboxDir;

    const bool high = options_.security_level == core::SecurityLevel::HIGH;
    config.network_disabled = high || !limits.network_access_allowed || !limits.network.outbound;

    switch (options_.security_level) {
        case core::SecurityLevel::HIGH:
            config.capabilities_drop = {"ALL"};
            config.security_opts = {"no-new-privileges"};
            break;
        case core::SecurityLevel::MEDIUM:
            config.capabilities_drop = {"NET_ADMIN", "SYS_ADMIN"};
            break;
        case core::SecurityLevel::LOW:
            break;
    }

    // Host entries cannot express wildcards; an unenforceable rule denies the network
    for (const auto& domain : limits.network.restricted_domains) {
        if (StringUtils::Contains(domain, "*") || StringUtils::Contains(domain, "?")) {
            if (!config.network_disabled) {
                spdlog::warn("⚠ Wildcard domain {} cannot be sinkholed; network disabled", domain);
            }
            config.network_disabled = true;
            break;
        }
        config.sinkholed_hosts.push_back(domain);
    }
    if (config.network_disabled) {
        config.sinkholed_hosts.clear();
    }

    return config;
}

BackendHandle ContainerBackend::Prepare(const core::ResourceLimits& limits) {
    if (!runtime_ || !runtime_->IsRuntimeAvailable()) {
        throw SandboxError(ErrorCode::BACKEND_UNAVAILABLE,
                           "Container runtime is not available");
    }

    spdlog::info("Creating {} container...", runtime_->Binary());

    const std::string name = NextContainerName();
    auto id = runtime_->CreateContainer(BuildContainerConfig(limits, name));
    if (!id) {
        throw SandboxError(ErrorCode::RESOURCE_ALLOCATION_FAILED,
                           "Failed to create sandbox container " + name);
    }

    auto mkdir = runtime_->ExecInContainer(*id, {"mkdir", "-p", kSandboxDir});
    if (!mkdir.Success()) {
        if (!runtime_->RemoveContainer(*id, true)) {
            spdlog::warn("⚠ Container {} could not be removed", ShortId(*id));
        }
        throw SandboxError(ErrorCode::RESOURCE_ALLOCATION_FAILED,
                           "Failed to create " + std::string(kSandboxDir) + " in container: " +
                           StringUtils::Trim(mkdir.output));
    }

    BackendHandle handle;
    handle.id = name;
    handle.native_id = *id;
    handle.scope.cgroup_token = *id;
    handle.limits = limits;

    spdlog::info("✓ Container ready: {}", ShortId(*id));
    return handle;
}

// ============================================================================
// LAUNCH
// ============================================================================

void ContainerBackend::Launch(BackendHandle& handle, const std::filesystem::path& target) {
    const std::string inside = std::string(kSandboxDir) + "/" + target.filename().string();

    if (!runtime_->CopyToContainer(handle.native_id, target.string(), inside)) {
        throw SandboxError(ErrorCode::LAUNCH_FAILED,
                           "Failed to copy " + target.string() + " into container");
    }

    auto chmod = runtime_->ExecInContainer(handle.native_id, {"chmod", "755", inside});
    if (!chmod.Success()) {
        throw SandboxError(ErrorCode::LAUNCH_FAILED,
                           "Failed to mark target executable: " + StringUtils::Trim(chmod.output));
    }

    // The wrapper records the exit status once the target returns
    const std::string script = SingleQuoted(inside) + "; echo $? > " + kExitCodeFile;
    auto exec = runtime_->ExecInContainer(handle.native_id, {"sh", "-c", script}, true);
    if (!exec.Success()) {
        throw SandboxError(ErrorCode::LAUNCH_FAILED,
                           "Failed to start target: " + StringUtils::Trim(exec.output));
    }

    spdlog::info("✓ Target launched in container {}", ShortId(handle.native_id));
}

// ============================================================================
// OBSERVATION
// ============================================================================

core::ResourceUsageSample ContainerBackend::CollectStats(const BackendHandle& handle) {
    core::ResourceUsageSample sample;
    sample.taken_at = std::chrono::steady_clock::now();

    auto stats = runtime_->GetContainerStats(handle.native_id);
    if (!stats) {
        return sample;
    }

    sample.memory_bytes = stats->memory_usage_bytes;
    sample.cpu_percent = stats->cpu_percent;
    sample.network_rx_bytes = stats->network_rx_bytes;
    sample.network_tx_bytes = stats->network_tx_bytes;
    sample.process_count = stats->pids;
    sample.valid = true;
    return sample;
}

std::optional<int> ContainerBackend::Poll(const BackendHandle& handle) {
    auto result = runtime_->ExecInContainer(handle.native_id, {"cat", kExitCodeFile});
    if (result.Success()) {
        auto code = StringUtils::ParseInt(result.output);
        if (code) {
            return static_cast<int>(*code);
        }
    }

    // The container itself stopped (OOM kill, runtime failure)
    auto state = runtime_->GetContainerState(handle.native_id);
    if (state == utils::ContainerState::EXITED || state == utils::ContainerState::DEAD) {
        return runtime_->GetExitCode(handle.native_id).value_or(-1);
    }
    return std::nullopt;
}

// ============================================================================
// TERMINATION
// ============================================================================

void ContainerBackend::EnforceKill(const BackendHandle& handle) noexcept {
    try {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!killed_.insert(handle.native_id).second) {
                return;
            }
        }
        if (!runtime_->KillContainer(handle.native_id)) {
            spdlog::debug("Kill of {} reported failure (already stopped?)", ShortId(handle.native_id));
        }
    } catch (const std::exception& e) {
        spdlog::warn("⚠ Failed to kill container {}: {}", ShortId(handle.native_id), e.what());
    }
}

void ContainerBackend::Teardown(const BackendHandle& handle) noexcept {
    try {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!torn_down_.insert(handle.native_id).second) {
                return;
            }
        }
        if (!runtime_->RemoveContainer(handle.native_id, true)) {
            spdlog::warn("⚠ Container {} could not be removed", ShortId(handle.native_id));
        }
    } catch (const std::exception& e) {
        spdlog::warn("⚠ Failed to tear down container {}: {}", ShortId(handle.native_id), e.what());
    }
}

} // namespace isolation
} // namespace saferun
