/**
 * @file proc_collectors.cpp
 * @brief Implementation of the procfs-based collectors
 *
 * Every collector polls a snapshot of procfs and reports the difference to
 * its previous snapshot, so short-lived activity between two windows can be
 * missed. All events of one window carry the window timestamp.
 *
 * @date 2025
 */

#include "saferun/monitors/proc_collectors.hpp"
#include "saferun/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <fcntl.h>

#include <system_error>

namespace saferun {
namespace monitors {

namespace fs = std::filesystem;
using core::EventCategory;
using utils::ProcStat;
using utils::ProcUtils;
using utils::StringUtils;

namespace {

bool IsZombie(const ProcStat& stat) {
    return stat.state == 'Z' || stat.state == 'X';
}

std::string ReadExe(const fs::path& proc_root, pid_t pid) {
    std::error_code ec;
    auto target = fs::read_symlink(proc_root / std::to_string(pid) / "exe", ec);
    return ec ? std::string{} : target.string();
}

CollectedEvent MakeEvent(const ObservationContext& context, EventCategory category,
                         core::EventAttributes attributes) {
    CollectedEvent event;
    event.timestamp = context.now;
    event.category = category;
    event.attributes = std::move(attributes);
    return event;
}

bool IsReportablePath(const std::string& target) {
    if (target.empty() || target[0] != '/') {
        return false;  // pipe:[..], socket:[..], anon_inode:[..]
    }
    return !StringUtils::StartsWith(target, "/dev/") &&
           !StringUtils::StartsWith(target, "/proc/") &&
           !StringUtils::StartsWith(target, "/sys/");
}

bool IsUnconnected(const std::string& remote) {
    return remote == "0.0.0.0:0" || remote == "[::]:0";
}

constexpr int kTcpEstablished = 0x01;
constexpr int kTcpSynSent = 0x02;
constexpr int kTcpListen = 0x0A;

} // anonymous namespace

// ============================================================================
// SCOPE TRACKING
// ============================================================================

ScopeTracker::ScopeTracker(fs::path proc_root)
    : proc_root_(std::move(proc_root)) {
}

bool ScopeTracker::InScope(const ProcStat& stat, const isolation::ProcessScope& scope) const {
    auto known = known_.find(stat.pid);
    if (known != known_.end() && known->second == stat.start_time) {
        return true;
    }
    if (scope.IsProcessGroup()) {
        return stat.pgrp == scope.process_group;
    }
    if (scope.IsCgroup()) {
        return StringUtils::Contains(ProcUtils::ReadCgroup(proc_root_, stat.pid), scope.cgroup_token);
    }
    return false;
}

std::vector<ProcStat> ScopeTracker::Members(const isolation::ProcessScope& scope) {
    std::vector<ProcStat> candidates;
    for (pid_t pid : ProcUtils::ListPids(proc_root_)) {
        if (auto stat = ProcUtils::ReadStat(proc_root_, pid)) {
            candidates.push_back(*stat);
        }
    }

    std::map<pid_t, std::uint64_t> members;
    std::vector<bool> taken(candidates.size(), false);
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (InScope(candidates[i], scope)) {
            members[candidates[i].pid] = candidates[i].start_time;
            taken[i] = true;
        }
    }

    // Children of members belong too, whatever group they moved to
    bool grew = true;
    while (grew) {
        grew = false;
        for (std::size_t i = 0; i < candidates.size(); ++i) {
            if (!taken[i] && members.count(candidates[i].ppid) > 0) {
                members[candidates[i].pid] = candidates[i].start_time;
                taken[i] = true;
                grew = true;
            }
        }
    }

    known_ = members;

    std::vector<ProcStat> result;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (taken[i]) {
            result.push_back(candidates[i]);
        }
    }
    return result;
}

// ============================================================================
// PROCESS COLLECTOR
// ============================================================================

ProcessCollector::ProcessCollector(fs::path proc_root)
    : tracker_(std::move(proc_root)) {
}

std::vector<CollectedEvent> ProcessCollector::Poll(const ObservationContext& context) {
    std::vector<CollectedEvent> events;
    if (context.handle == nullptr) {
        return events;
    }

    const fs::path& proc_root = tracker_.ProcRoot();
    auto members = tracker_.Members(context.handle->scope);

    std::set<pid_t> alive;
    for (const auto& stat : members) {
        if (IsZombie(stat)) {
            continue;
        }
        alive.insert(stat.pid);

        const std::string exe = ReadExe(proc_root, stat.pid);
        auto attributes = [&](const std::string& operation) {
            return core::EventAttributes{
                {"operation", operation},
                {"pid", std::to_string(stat.pid)},
                {"ppid", std::to_string(stat.ppid)},
                {"name", stat.comm},
                {"cmdline", ProcUtils::ReadCmdline(proc_root, stat.pid)},
                {"path", exe},
            };
        };

        auto it = seen_.find(stat.pid);
        if (it == seen_.end() || it->second.start_time != stat.start_time) {
            if (it != seen_.end()) {
                // Pid reused within one window
                events.push_back(MakeEvent(context, EventCategory::PROCESS_OP,
                    {{"operation", "exit"}, {"pid", std::to_string(stat.pid)},
                     {"name", it->second.name}}));
            }
            events.push_back(MakeEvent(context, EventCategory::PROCESS_OP, attributes("spawn")));
            seen_[stat.pid] = Seen{stat.start_time, exe, stat.comm};
        } else if (it->second.exe != exe || it->second.name != stat.comm) {
            events.push_back(MakeEvent(context, EventCategory::PROCESS_OP, attributes("exec")));
            it->second.exe = exe;
            it->second.name = stat.comm;
        }

        auto tracer = ProcUtils::ReadStatusField(proc_root, stat.pid, "TracerPid");
        auto tracer_pid = tracer ? StringUtils::ParseInt(*tracer) : std::nullopt;
        if (tracer_pid && *tracer_pid > 0) {
            auto key = std::make_pair(static_cast<pid_t>(*tracer_pid), stat.pid);
            if (traced_.insert(key).second) {
                events.push_back(MakeEvent(context, EventCategory::PROCESS_OP,
                    {{"operation", "ptrace_attach"},
                     {"pid", std::to_string(key.first)},
                     {"target_pid", std::to_string(stat.pid)},
                     {"name", stat.comm}}));
            }
        }
    }

    for (auto it = seen_.begin(); it != seen_.end();) {
        if (alive.count(it->first) == 0) {
            events.push_back(MakeEvent(context, EventCategory::PROCESS_OP,
                {{"operation", "exit"}, {"pid", std::to_string(it->first)},
                 {"name", it->second.name}}));
            it = seen_.erase(it);
        } else {
            ++it;
        }
    }

    return events;
}

// ============================================================================
// FILE COLLECTOR
// ============================================================================

FileCollector::FileCollector(fs::path proc_root)
    : tracker_(std::move(proc_root)) {
}

std::string FileCollector::AccessFromFlags(int flags) {
    switch (flags & O_ACCMODE) {
        case O_WRONLY: return "w";
        case O_RDWR:   return "rw";
        default:       return "r";
    }
}

std::vector<CollectedEvent> FileCollector::Poll(const ObservationContext& context) {
    std::vector<CollectedEvent> events;
    if (context.handle == nullptr) {
        return events;
    }

    std::set<std::tuple<pid_t, int, std::string>> current;
    for (const auto& stat : tracker_.Members(context.handle->scope)) {
        if (IsZombie(stat)) {
            continue;
        }
        for (const auto& file : ProcUtils::ListOpenFiles(tracker_.ProcRoot(), stat.pid)) {
            if (!IsReportablePath(file.target)) {
                continue;
            }
            auto key = std::make_tuple(stat.pid, file.fd, file.target);
            current.insert(key);
            if (open_.count(key) > 0) {
                continue;
            }
            events.push_back(MakeEvent(context, EventCategory::FILE_OP,
                {{"operation", "open"},
                 {"path", file.target},
                 {"access", AccessFromFlags(file.flags)},
                 {"pid", std::to_string(stat.pid)},
                 {"name", stat.comm}}));
        }
    }

    open_ = std::move(current);
    return events;
}

// ============================================================================
// REGISTRY COLLECTOR
// ============================================================================

RegistryCollector::RegistryCollector(fs::path proc_root)
    : tracker_(std::move(proc_root)) {
}

bool RegistryCollector::IsConfigurationPath(const std::string& path) {
    if (StringUtils::StartsWith(path, "/etc/") ||
        StringUtils::StartsWith(path, "/var/spool/cron") ||
        StringUtils::Contains(path, "/.config/") ||
        StringUtils::Contains(path, "/.ssh/")) {
        return true;
    }

    // Dotfiles directly under a home directory
    const fs::path file(path);
    const std::string name = file.filename().string();
    if (name.size() < 2 || name[0] != '.') {
        return false;
    }
    const fs::path parent = file.parent_path();
    return parent == "/root" || parent.parent_path() == "/home";
}

std::vector<CollectedEvent> RegistryCollector::Poll(const ObservationContext& context) {
    std::vector<CollectedEvent> events;
    if (context.handle == nullptr) {
        return events;
    }

    std::set<std::tuple<pid_t, int, std::string>> current;
    for (const auto& stat : tracker_.Members(context.handle->scope)) {
        if (IsZombie(stat)) {
            continue;
        }
        for (const auto& file : ProcUtils::ListOpenFiles(tracker_.ProcRoot(), stat.pid)) {
            if ((file.flags & O_ACCMODE) == O_RDONLY || !IsConfigurationPath(file.target)) {
                continue;
            }
            auto key = std::make_tuple(stat.pid, file.fd, file.target);
            current.insert(key);
            if (open_.count(key) > 0) {
                continue;
            }
            events.push_back(MakeEvent(context, EventCategory::REGISTRY_OP,
                {{"operation", "write"},
                 {"key", file.target},
                 {"access", "w"},
                 {"pid", std::to_string(stat.pid)}}));
        }
    }

    open_ = std::move(current);
    return events;
}

// ============================================================================
// NETWORK COLLECTOR
// ============================================================================

NetworkCollector::NetworkCollector(fs::path proc_root, std::size_t scan_threshold)
    : tracker_(std::move(proc_root))
    , scan_threshold_(scan_threshold) {
}

std::vector<CollectedEvent> NetworkCollector::Poll(const ObservationContext& context) {
    std::vector<CollectedEvent> events;
    if (context.handle == nullptr) {
        return events;
    }

    const fs::path& proc_root = tracker_.ProcRoot();
    static const std::vector<std::string> kProtocols = {"tcp", "tcp6", "udp", "udp6"};

    for (const auto& stat : tracker_.Members(context.handle->scope)) {
        if (IsZombie(stat)) {
            continue;
        }

        std::set<std::uint64_t> inodes;
        for (const auto& file : ProcUtils::ListOpenFiles(proc_root, stat.pid)) {
            auto inode = ProcUtils::SocketInode(file.target);
            if (inode != 0 && reported_inodes_.count(inode) == 0) {
                inodes.insert(inode);
            }
        }
        if (inodes.empty()) {
            continue;
        }

        // The per-process view follows the network namespace of the process
        const fs::path pid_root = proc_root / std::to_string(stat.pid);
        for (const auto& protocol : kProtocols) {
            const bool tcp = StringUtils::StartsWith(protocol, "tcp");
            for (const auto& socket : ProcUtils::ReadSockets(pid_root, protocol)) {
                if (inodes.count(socket.inode) == 0) {
                    continue;
                }

                std::string operation;
                if (tcp && socket.state == kTcpListen) {
                    operation = "listen";
                } else if (tcp && (socket.state == kTcpEstablished || socket.state == kTcpSynSent)) {
                    operation = "connect";
                } else if (!tcp && !IsUnconnected(socket.remote_address)) {
                    operation = "connect";
                } else {
                    continue;  // Not yet meaningful; look again next window
                }

                reported_inodes_.insert(socket.inode);
                inodes.erase(socket.inode);

                core::EventAttributes attributes{
                    {"operation", operation},
                    {"protocol", protocol},
                    {"local_address", socket.local_address},
                    {"pid", std::to_string(stat.pid)},
                };
                if (operation == "connect") {
                    remote_endpoints_.insert(socket.remote_address);
                    attributes["remote_address"] = socket.remote_address;
                    attributes["distinct_endpoints"] = std::to_string(remote_endpoints_.size());
                }
                events.push_back(MakeEvent(context, EventCategory::NETWORK_OP, std::move(attributes)));
            }
        }
    }

    if (!scan_reported_ && scan_threshold_ > 0 && remote_endpoints_.size() >= scan_threshold_) {
        scan_reported_ = true;
        spdlog::debug("Scan threshold reached: {} distinct endpoints", remote_endpoints_.size());
        events.push_back(MakeEvent(context, EventCategory::NETWORK_OP,
            {{"operation", "scan"},
             {"distinct_endpoints", std::to_string(remote_endpoints_.size())}}));
    }

    return events;
}

// ============================================================================
// RESOURCE USAGE COLLECTOR
// ============================================================================

std::vector<CollectedEvent> ResourceUsageCollector::Poll(const ObservationContext& context) {
    std::vector<CollectedEvent> events;
    if (!context.sample || !context.sample->valid) {
        return events;
    }

    const auto& sample = *context.sample;
    core::EventAttributes attributes{
        {"memory_bytes", std::to_string(sample.memory_bytes)},
        {"cpu_percent", fmt::format("{:.2f}", sample.cpu_percent)},
        {"process_count", std::to_string(sample.process_count)},
        {"network_rx_bytes", std::to_string(sample.network_rx_bytes)},
        {"network_tx_bytes", std::to_string(sample.network_tx_bytes)},
    };
    if (context.handle != nullptr) {
        attributes["memory_limit_bytes"] = std::to_string(context.handle->limits.memory_bytes);
    }

    events.push_back(MakeEvent(context, EventCategory::RESOURCE_USAGE, std::move(attributes)));
    return events;
}

// ============================================================================
// FACTORIES
// ============================================================================

std::vector<std::unique_ptr<EventCollector>> MakeDefaultCollectors(const fs::path& proc_root) {
    std::vector<std::unique_ptr<EventCollector>> collectors;
    collectors.push_back(std::make_unique<ProcessCollector>(proc_root));
    collectors.push_back(std::make_unique<FileCollector>(proc_root));
    collectors.push_back(std::make_unique<NetworkCollector>(proc_root));
    collectors.push_back(std::make_unique<RegistryCollector>(proc_root));
    collectors.push_back(std::make_unique<ResourceUsageCollector>());
    return collectors;
}

CollectorFactory MakeDefaultCollectorFactory(const fs::path& proc_root) {
    return [proc_root]() { return MakeDefaultCollectors(proc_root); };
}

} // namespace monitors
} // namespace saferun
