/**
 * @file backend_factory.cpp
 * @brief Implementation of default backend selection
 *
 * @date 2025
 */

#include "saferun/isolation/backend_factory.hpp"
#include "saferun/isolation/container_backend.hpp"
#include "saferun/isolation/process_backend.hpp"

#include <spdlog/spdlog.h>

namespace saferun {
namespace isolation {

BackendFactory MakeDefaultBackendFactory(const core::SandboxConfig& config,
                                         utils::CommandExecutor executor) {
    return [config, executor](const core::ExecutionRequest& request)
               -> std::unique_ptr<IsolationBackend> {
        ProcessBackend::Options process_options;
        process_options.work_root = config.work_directory;

        if (request.isolation_method == core::IsolationMethod::PROCESS) {
            return std::make_unique<ProcessBackend>(process_options);
        }

        auto engine = utils::ContainerUtils::DetectEngine(executor);
        if (!engine && config.fallback_to_process) {
            spdlog::warn("⚠ No container runtime found, falling back to process isolation");
            return std::make_unique<ProcessBackend>(process_options);
        }

        ContainerBackend::Options container_options;
        container_options.image = config.container_image;
        container_options.pids_limit = config.pids_limit;
        container_options.security_level = request.security_level;

        auto runtime = std::make_shared<utils::ContainerUtils>(
            engine.value_or(utils::ContainerEngine::DOCKER), executor);
        return std::make_unique<ContainerBackend>(runtime, container_options);
    };
}

} // namespace isolation
} // namespace saferun
