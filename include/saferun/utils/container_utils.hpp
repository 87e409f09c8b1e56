/**
 * @file container_utils.hpp
 * @brief Container runtime CLI wrapper (docker / podman)
 *
 * Thin, synchronous wrapper around the runtime command line: create a
 * hardened container, copy files in, exec, sample stats, kill and remove.
 * Every command goes through a CommandExecutor so that tests can script
 * the runtime's responses.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <cstdint>

namespace saferun {
namespace utils {

/**
 * @enum ContainerEngine
 * @brief Supported container runtime engines
 */
enum class ContainerEngine {
    DOCKER,   ///< Docker Engine
    PODMAN    ///< Podman (daemonless, CLI compatible)
};

/**
 * @enum ContainerState
 * @brief Container lifecycle states as reported by `inspect`
 */
enum class ContainerState {
    CREATED,
    RUNNING,
    PAUSED,
    EXITED,
    DEAD,
    UNKNOWN
};

/**
 * @struct CommandResult
 * @brief Outcome of one external command
 */
struct CommandResult {
    int exit_code{-1};      ///< Process exit status, -1 if it never ran
    std::string output;     ///< Combined stdout/stderr

    bool Success() const { return exit_code == 0; }
};

/// Runs argv (argv[0] is the binary) and returns its result
using CommandExecutor = std::function<CommandResult(const std::vector<std::string>&)>;

/**
 * @struct ContainerConfig
 * @brief Settings for a sandbox container
 */
struct ContainerConfig {
    std::string name;                            ///< Container name
    std::string image{"alpine:latest"};          ///< Base image
    std::uint64_t memory_limit_mb{512};          ///< --memory
    double cpu_limit{0.5};                       ///< --cpus (1.0 = one core)
    bool network_disabled{true};                 ///< --network none, otherwise bridge
    std::vector<std::string> capabilities_drop;  ///< --cap-drop
    std::vector<std::string> security_opts;      ///< --security-opt
    std::vector<std::string> sinkholed_hosts;    ///< --add-host <host>:0.0.0.0
    int pids_limit{0};                           ///< --pids-limit (0 = unlimited)
    std::string working_dir{"/sandbox"};         ///< -w
    std::vector<std::string> command{"tail", "-f", "/dev/null"};  ///< Idle command
};

/**
 * @struct ContainerStats
 * @brief Single `stats --no-stream` snapshot
 */
struct ContainerStats {
    double cpu_percent{0.0};
    std::uint64_t memory_usage_bytes{0};
    std::uint64_t memory_limit_bytes{0};
    std::uint64_t network_rx_bytes{0};
    std::uint64_t network_tx_bytes{0};
    int pids{0};
};

/**
 * @class ContainerUtils
 * @brief Container lifecycle management through the runtime CLI
 *
 * **Usage Example**:
 * @code
 * ContainerUtils runtime(ContainerEngine::DOCKER);
 * if (!runtime.IsRuntimeAvailable()) { ... }
 * auto id = runtime.CreateContainer(config);
 * runtime.CopyToContainer(*id, "/tmp/sample", "/sandbox/target");
 * runtime.KillContainer(*id);
 * runtime.RemoveContainer(*id, true);
 * @endcode
 */
class ContainerUtils {
public:
    /**
     * @brief Construct for an engine
     * @param engine Runtime CLI to drive
     * @param executor Command executor; defaults to running the binary via popen
     */
    explicit ContainerUtils(ContainerEngine engine, CommandExecutor executor = {});

    /// Default executor: shell-quoted popen with stderr merged into stdout
    static CommandResult RunCommand(const std::vector<std::string>& argv);

    /// First engine whose `--version` succeeds, docker before podman
    static std::optional<ContainerEngine> DetectEngine(const CommandExecutor& executor = {});

    /// Runtime binary name ("docker" or "podman")
    std::string Binary() const;

    ContainerEngine Engine() const { return engine_; }

    /// True when `<binary> --version` succeeds
    bool IsRuntimeAvailable() const;

    /**
     * @brief Create and start a detached container (`run -d`)
     * @return Container id, or std::nullopt on failure
     */
    std::optional<std::string> CreateContainer(const ContainerConfig& config);

    /// `cp host_path id:container_path`
    bool CopyToContainer(const std::string& container_id,
                         const std::string& host_path,
                         const std::string& container_path);

    /// `exec [-d] id cmd...`
    CommandResult ExecInContainer(const std::string& container_id,
                                  const std::vector<std::string>& command,
                                  bool detached = false);

    /// `stats --no-stream --format {{json .}}`
    std::optional<ContainerStats> GetContainerStats(const std::string& container_id);

    /// `inspect --format {{.State.Status}}`
    ContainerState GetContainerState(const std::string& container_id);

    /// `inspect --format {{.State.ExitCode}}`
    std::optional<int> GetExitCode(const std::string& container_id);

    bool KillContainer(const std::string& container_id);
    bool RemoveContainer(const std::string& container_id, bool force = true);

    /// Arguments for `run` (without the binary)
    static std::vector<std::string> BuildRunCommand(const ContainerConfig& config);

    /// Parse one line of `stats --format {{json .}}` output
    static std::optional<ContainerStats> ParseStatsOutput(const std::string& json_str);

    static ContainerState ParseState(const std::string& state);

private:
    CommandResult ExecuteRuntimeCommand(const std::vector<std::string>& args) const;

    ContainerEngine engine_;
    CommandExecutor executor_;
};

std::string ToString(ContainerEngine engine);

} // namespace utils
} // namespace saferun
