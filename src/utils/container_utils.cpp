/**
 * @file container_utils.cpp
 * @brief Implementation of the container runtime CLI wrapper
 *
 * Commands are executed synchronously. Output parsing is tolerant: a stats
 * line that cannot be parsed yields std::nullopt rather than an exception,
 * since the container may vanish between two calls.
 *
 * @date 2025
 */

#include "saferun/utils/container_utils.hpp"
#include "saferun/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <array>
#include <cstdio>
#include <sstream>
#include <sys/wait.h>

using json = nlohmann::json;

namespace saferun {
namespace utils {

namespace {

// ============================================================================
// UNIX/LINUX COMMAND EXECUTION
// ============================================================================
// Uses popen with every argument single-quoted

std::string ShellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

// "1.2MiB / 512MiB" -> (usage, limit)
std::pair<std::optional<std::uint64_t>, std::optional<std::uint64_t>>
ParsePair(const std::string& value) {
    auto slash = value.find('/');
    if (slash == std::string::npos) {
        return {StringUtils::ParseSizeBytes(value), std::nullopt};
    }
    return {StringUtils::ParseSizeBytes(value.substr(0, slash)),
            StringUtils::ParseSizeBytes(value.substr(slash + 1))};
}

} // anonymous namespace

std::string ToString(ContainerEngine engine) {
    switch (engine) {
        case ContainerEngine::DOCKER: return "docker";
        case ContainerEngine::PODMAN: return "podman";
    }
    return "unknown";
}

// ============================================================================
// CONSTRUCTOR
// ============================================================================

ContainerUtils::ContainerUtils(ContainerEngine engine, CommandExecutor executor)
    : engine_(engine),
      executor_(executor ? std::move(executor) : CommandExecutor(&ContainerUtils::RunCommand)) {
    spdlog::debug("Container utils initialized with runtime: {}", Binary());
}

CommandResult ContainerUtils::RunCommand(const std::vector<std::string>& argv) {
    CommandResult result;
    if (argv.empty()) {
        return result;
    }

    std::ostringstream cmd;
    for (std::size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            cmd << ' ';
        }
        cmd << ShellQuote(argv[i]);
    }
    // Redirect stderr to stdout (2>&1)
    cmd << " 2>&1";

    FILE* pipe = popen(cmd.str().c_str(), "r");
    if (!pipe) {
        result.output = "Failed to execute command";
        return result;
    }

    std::array<char, 256> buffer;
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        result.output += buffer.data();
    }

    int status = pclose(pipe);
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }
    return result;
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

std::optional<ContainerEngine> ContainerUtils::DetectEngine(const CommandExecutor& executor) {
    for (auto engine : {ContainerEngine::DOCKER, ContainerEngine::PODMAN}) {
        ContainerUtils probe(engine, executor);
        if (probe.IsRuntimeAvailable()) {
            return engine;
        }
    }
    return std::nullopt;
}

std::string ContainerUtils::Binary() const {
    return ToString(engine_);
}

bool ContainerUtils::IsRuntimeAvailable() const {
    // Version check only; a stopped daemon surfaces later as a failed `run`
    auto result = ExecuteRuntimeCommand({"--version"});
    return result.Success();
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

std::optional<std::string> ContainerUtils::CreateContainer(const ContainerConfig& config) {
    spdlog::info("Creating container: {} ({})", config.name, config.image);

    auto result = ExecuteRuntimeCommand(BuildRunCommand(config));
    if (!result.Success()) {
        spdlog::error("Failed to create container: {}", StringUtils::Trim(result.output));
        return std::nullopt;
    }

    // `run -d` prints the id on its last line (image pulls print before it)
    auto lines = StringUtils::Split(result.output, '\n');
    std::string id = lines.empty() ? std::string{} : StringUtils::Trim(lines.back());
    if (id.empty()) {
        spdlog::error("Container runtime returned no container id");
        return std::nullopt;
    }

    spdlog::info("Container created: {}", StringUtils::Truncate(id, 12, ""));
    return id;
}

bool ContainerUtils::CopyToContainer(const std::string& container_id,
                                     const std::string& host_path,
                                     const std::string& container_path) {
    auto result = ExecuteRuntimeCommand({"cp", host_path, container_id + ":" + container_path});
    if (!result.Success()) {
        spdlog::error("Failed to copy {} into container: {}",
                      host_path, StringUtils::Trim(result.output));
    }
    return result.Success();
}

CommandResult ContainerUtils::ExecInContainer(const std::string& container_id,
                                              const std::vector<std::string>& command,
                                              bool detached) {
    std::vector<std::string> args = {"exec"};
    if (detached) {
        args.push_back("-d");
    }
    args.push_back(container_id);
    args.insert(args.end(), command.begin(), command.end());
    return ExecuteRuntimeCommand(args);
}

bool ContainerUtils::KillContainer(const std::string& container_id) {
    spdlog::info("Killing container: {}", StringUtils::Truncate(container_id, 12, ""));

    auto result = ExecuteRuntimeCommand({"kill", container_id});
    return result.Success();
}

bool ContainerUtils::RemoveContainer(const std::string& container_id, bool force) {
    spdlog::info("Removing container: {} (force: {})",
                 StringUtils::Truncate(container_id, 12, ""), force);

    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_id);

    auto result = ExecuteRuntimeCommand(args);
    if (!result.Success()) {
        spdlog::error("Failed to remove container: {}", StringUtils::Trim(result.output));
        return false;
    }
    return true;
}

// ============================================================================
// CONTAINER INFORMATION RETRIEVAL
// ============================================================================

ContainerState ContainerUtils::GetContainerState(const std::string& container_id) {
    auto result = ExecuteRuntimeCommand({
        "inspect",
        "--format", "{{.State.Status}}",
        container_id
    });

    if (result.Success()) {
        return ParseState(StringUtils::Trim(result.output));
    }
    return ContainerState::UNKNOWN;
}

std::optional<int> ContainerUtils::GetExitCode(const std::string& container_id) {
    auto result = ExecuteRuntimeCommand({
        "inspect",
        "--format", "{{.State.ExitCode}}",
        container_id
    });

    if (!result.Success()) {
        return std::nullopt;
    }
    auto code = StringUtils::ParseInt(result.output);
    if (!code) {
        return std::nullopt;
    }
    return static_cast<int>(*code);
}

std::optional<ContainerStats> ContainerUtils::GetContainerStats(const std::string& container_id) {
    auto result = ExecuteRuntimeCommand({
        "stats",
        "--no-stream",  // Single snapshot
        "--format", "{{json .}}",
        container_id
    });

    if (!result.Success()) {
        spdlog::debug("stats failed: {}", StringUtils::Trim(result.output));
        return std::nullopt;
    }
    return ParseStatsOutput(result.output);
}

// ============================================================================
// COMMAND BUILDING AND PARSING
// ============================================================================

std::vector<std::string> ContainerUtils::BuildRunCommand(const ContainerConfig& config) {
    std::vector<std::string> args;

    args.push_back("run");
    args.push_back("-d");  // Detached mode

    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    // Memory limit
    if (config.memory_limit_mb > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(config.memory_limit_mb) + "m");
    }

    // CPU limit
    if (config.cpu_limit > 0) {
        std::ostringstream cpus;
        cpus << config.cpu_limit;
        args.push_back("--cpus");
        args.push_back(cpus.str());
    }

    args.push_back("--network");
    args.push_back(config.network_disabled ? "none" : "bridge");

    // Security: Drop capabilities
    for (const auto& cap : config.capabilities_drop) {
        args.push_back("--cap-drop");
        args.push_back(cap);
    }

    for (const auto& opt : config.security_opts) {
        args.push_back("--security-opt");
        args.push_back(opt);
    }

    // Restricted domains resolve to an unroutable address
    if (!config.network_disabled) {
        for (const auto& host : config.sinkholed_hosts) {
            args.push_back("--add-host");
            args.push_back(host + ":0.0.0.0");
        }
    }

    // Process limit
    if (config.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(config.pids_limit));
    }

    // Working directory
    if (!config.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(config.working_dir);
    }

    // Image (must be last before command)
    args.push_back(config.image);
    args.insert(args.end(), config.command.begin(), config.command.end());

    return args;
}

std::optional<ContainerStats> ContainerUtils::ParseStatsOutput(const std::string& json_str) {
    json j = json::parse(StringUtils::Trim(json_str), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    ContainerStats stats;

    // Parse CPU percentage ("12.34%")
    if (j.contains("CPUPerc") && j["CPUPerc"].is_string()) {
        auto cpu = StringUtils::ParseDouble(j["CPUPerc"].get<std::string>());
        if (!cpu) {
            return std::nullopt;
        }
        stats.cpu_percent = *cpu;
    }

    // Parse memory usage ("123MiB / 2GiB")
    if (j.contains("MemUsage") && j["MemUsage"].is_string()) {
        auto [usage, limit] = ParsePair(j["MemUsage"].get<std::string>());
        if (!usage) {
            return std::nullopt;
        }
        stats.memory_usage_bytes = *usage;
        stats.memory_limit_bytes = limit.value_or(0);
    }

    // Parse network I/O ("1.2kB / 648B")
    if (j.contains("NetIO") && j["NetIO"].is_string()) {
        auto [rx, tx] = ParsePair(j["NetIO"].get<std::string>());
        stats.network_rx_bytes = rx.value_or(0);
        stats.network_tx_bytes = tx.value_or(0);
    }

    if (j.contains("PIDs") && j["PIDs"].is_string()) {
        auto pids = StringUtils::ParseInt(j["PIDs"].get<std::string>());
        stats.pids = pids ? static_cast<int>(*pids) : 0;
    }

    return stats;
}

ContainerState ContainerUtils::ParseState(const std::string& state) {
    const std::string lower = StringUtils::ToLower(state);
    if (lower == "created") return ContainerState::CREATED;
    if (lower == "running") return ContainerState::RUNNING;
    if (lower == "paused") return ContainerState::PAUSED;
    if (lower == "exited" || lower == "stopped") return ContainerState::EXITED;
    if (lower == "dead" || lower == "removing") return ContainerState::DEAD;
    return ContainerState::UNKNOWN;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

CommandResult ContainerUtils::ExecuteRuntimeCommand(const std::vector<std::string>& args) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(Binary());
    argv.insert(argv.end(), args.begin(), args.end());

    spdlog::debug("Executing: {}", StringUtils::Join(argv, " "));
    return executor_(argv);
}

} // namespace utils
} // namespace saferun
