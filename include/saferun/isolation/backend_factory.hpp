/**
 * @file backend_factory.hpp
 * @brief Default selection of isolation backends
 *
 * @date 2025
 */

#pragma once

#include "saferun/core/sandbox_config.hpp"
#include "saferun/isolation/isolation_backend.hpp"
#include "saferun/utils/container_utils.hpp"

namespace saferun {
namespace isolation {

/**
 * @brief Factory used by the orchestrator outside of tests
 *
 * CONTAINER requests use docker, or podman when docker is absent. Without
 * any runtime the container backend is still returned (its Prepare reports
 * BACKEND_UNAVAILABLE) unless `fallback_to_process` is set, in which case
 * process isolation is used instead.
 *
 * @param config Engine configuration (image, pids limit, fallback, work dir)
 * @param executor Command executor for the runtime CLI; empty = popen
 */
BackendFactory MakeDefaultBackendFactory(const core::SandboxConfig& config,
                                         utils::CommandExecutor executor = {});

} // namespace isolation
} // namespace saferun
