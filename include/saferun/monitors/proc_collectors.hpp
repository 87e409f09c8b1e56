/**
 * @file proc_collectors.hpp
 * @brief procfs-based event collectors
 *
 * Collectors attribute processes to a session through its ProcessScope: a
 * process belongs to the session when its process group matches, when its
 * cgroup file names the container, or when its parent already belongs.
 *
 * Event attribute vocabulary:
 *
 * | Category       | Attributes                                                   |
 * |----------------|--------------------------------------------------------------|
 * | PROCESS_OP     | operation (spawn/exec/exit/ptrace_attach), pid, ppid, name,  |
 * |                | cmdline, path, target_pid                                    |
 * | FILE_OP        | operation (open), path, access (r/w/rw), pid, name           |
 * | REGISTRY_OP    | operation (write), key, access (w), pid                      |
 * | NETWORK_OP     | operation (connect/listen/scan), protocol, local_address,    |
 * |                | remote_address, pid, distinct_endpoints                      |
 * | RESOURCE_USAGE | memory_bytes, memory_limit_bytes, cpu_percent,               |
 * |                | process_count, network_rx_bytes, network_tx_bytes            |
 *
 * @date 2025
 */

#pragma once

#include "saferun/monitors/activity_monitor.hpp"
#include "saferun/utils/proc_utils.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace saferun {
namespace monitors {

/**
 * @class ScopeTracker
 * @brief Remembers which pids belong to the observed session
 */
class ScopeTracker {
public:
    explicit ScopeTracker(std::filesystem::path proc_root);

    /**
     * @brief Live processes of the session
     *
     * Descendants are followed even after they leave the process group.
     * A pid reused by an unrelated process is dropped (start time differs).
     */
    std::vector<utils::ProcStat> Members(const isolation::ProcessScope& scope);

    const std::filesystem::path& ProcRoot() const { return proc_root_; }

private:
    bool InScope(const utils::ProcStat& stat, const isolation::ProcessScope& scope) const;

    std::filesystem::path proc_root_;
    std::map<pid_t, std::uint64_t> known_;  ///< pid -> start time
};

/**
 * @class ProcessCollector
 * @brief Process spawn, exec, exit and ptrace attachment
 */
class ProcessCollector : public EventCollector {
public:
    explicit ProcessCollector(std::filesystem::path proc_root = "/proc");

    std::vector<CollectedEvent> Poll(const ObservationContext& context) override;
    std::string Name() const override { return "process"; }

private:
    struct Seen {
        std::uint64_t start_time{0};
        std::string exe;
        std::string name;
    };

    ScopeTracker tracker_;
    std::map<pid_t, Seen> seen_;
    std::set<std::pair<pid_t, pid_t>> traced_;  ///< (tracer, tracee) already reported
};

/**
 * @class FileCollector
 * @brief Files newly opened by session processes
 *
 * Pseudo files (pipes, sockets, anonymous inodes) and /dev, /proc, /sys
 * are not reported.
 */
class FileCollector : public EventCollector {
public:
    explicit FileCollector(std::filesystem::path proc_root = "/proc");

    std::vector<CollectedEvent> Poll(const ObservationContext& context) override;
    std::string Name() const override { return "file"; }

    /// "r", "w" or "rw" for open(2) flags
    static std::string AccessFromFlags(int flags);

private:
    ScopeTracker tracker_;
    std::set<std::tuple<pid_t, int, std::string>> open_;  ///< (pid, fd, target)
};

/**
 * @class RegistryCollector
 * @brief Writes to configuration stores
 *
 * Linux has no registry; system and user configuration locations (/etc,
 * cron spools, ~/.config and home-directory dotfiles) play its role. Each
 * file opened for writing there is reported once per descriptor.
 */
class RegistryCollector : public EventCollector {
public:
    explicit RegistryCollector(std::filesystem::path proc_root = "/proc");

    std::vector<CollectedEvent> Poll(const ObservationContext& context) override;
    std::string Name() const override { return "registry"; }

    /// True for paths treated as configuration keys
    static bool IsConfigurationPath(const std::string& path);

private:
    ScopeTracker tracker_;
    std::set<std::tuple<pid_t, int, std::string>> open_;
};

/**
 * @class NetworkCollector
 * @brief Connections and listeners owned by session processes
 *
 * Sockets are read from /proc/<pid>/net so processes in a private network
 * namespace are covered. One "scan" event is emitted when the number of
 * distinct remote endpoints reaches the scan threshold.
 */
class NetworkCollector : public EventCollector {
public:
    explicit NetworkCollector(std::filesystem::path proc_root = "/proc",
                              std::size_t scan_threshold = 20);

    std::vector<CollectedEvent> Poll(const ObservationContext& context) override;
    std::string Name() const override { return "network"; }

private:
    ScopeTracker tracker_;
    std::size_t scan_threshold_;
    std::set<std::uint64_t> reported_inodes_;
    std::set<std::string> remote_endpoints_;
    bool scan_reported_{false};
};

/**
 * @class ResourceUsageCollector
 * @brief Turns the latest backend sample into a RESOURCE_USAGE event
 */
class ResourceUsageCollector : public EventCollector {
public:
    std::vector<CollectedEvent> Poll(const ObservationContext& context) override;
    std::string Name() const override { return "resource"; }
};

/// Process, file, registry, network and resource collectors over a procfs root
std::vector<std::unique_ptr<EventCollector>> MakeDefaultCollectors(
    const std::filesystem::path& proc_root = "/proc");

/// Factory producing MakeDefaultCollectors(proc_root) for every session
CollectorFactory MakeDefaultCollectorFactory(const std::filesystem::path& proc_root = "/proc");

} // namespace monitors
} // namespace saferun
