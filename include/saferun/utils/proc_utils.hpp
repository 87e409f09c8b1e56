/**
 * @file proc_utils.hpp
 * @brief Readers for the Linux procfs
 *
 * All readers take the procfs root as a parameter so tests can point them
 * at a fabricated tree. Readers return std::nullopt (or empty values) when a
 * process vanished between listing and reading, which is routine.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace saferun {
namespace utils {

/**
 * @struct ProcStat
 * @brief Selected fields of /proc/<pid>/stat
 */
struct ProcStat {
    pid_t pid{0};
    std::string comm;           ///< Executable name (without parentheses)
    char state{'?'};
    pid_t ppid{0};
    pid_t pgrp{0};
    std::uint64_t utime{0};     ///< Clock ticks in user mode
    std::uint64_t stime{0};     ///< Clock ticks in kernel mode
    std::uint64_t start_time{0};///< Clock ticks after boot
};

/**
 * @struct SocketEntry
 * @brief One row of /proc/net/{tcp,tcp6,udp,udp6}
 */
struct SocketEntry {
    std::string protocol;       ///< "tcp", "tcp6", "udp", "udp6"
    std::string local_address;  ///< "ip:port"
    std::string remote_address; ///< "ip:port"
    int state{0};               ///< Kernel TCP state number
    std::uint64_t inode{0};
};

/**
 * @struct OpenFile
 * @brief Resolved file descriptor of a process
 */
struct OpenFile {
    int fd{-1};
    std::string target;         ///< readlink of /proc/<pid>/fd/<fd>
    int flags{0};               ///< open(2) flags from fdinfo
};

/**
 * @class ProcUtils
 * @brief Static procfs readers
 */
class ProcUtils {
public:
    /// Numeric entries of the procfs root
    static std::vector<pid_t> ListPids(const std::filesystem::path& proc_root);

    static std::optional<ProcStat> ReadStat(const std::filesystem::path& proc_root, pid_t pid);

    /// Parse the content of a stat file; comm may contain spaces and parentheses
    static std::optional<ProcStat> ParseStat(const std::string& content);

    /// Resident set size in bytes (statm field 2 × page size)
    static std::optional<std::uint64_t> ReadRssBytes(const std::filesystem::path& proc_root, pid_t pid);

    /// NUL-separated argv joined with spaces
    static std::string ReadCmdline(const std::filesystem::path& proc_root, pid_t pid);

    /// Value of a "Key:\tvalue" line in /proc/<pid>/status
    static std::optional<std::string> ReadStatusField(const std::filesystem::path& proc_root,
                                                      pid_t pid, const std::string& key);

    /// Raw /proc/<pid>/cgroup content
    static std::string ReadCgroup(const std::filesystem::path& proc_root, pid_t pid);

    /// Open descriptors with their targets and flags
    static std::vector<OpenFile> ListOpenFiles(const std::filesystem::path& proc_root, pid_t pid);

    /// Rows of /proc/net/<protocol>
    static std::vector<SocketEntry> ReadSockets(const std::filesystem::path& proc_root,
                                                const std::string& protocol);

    /// Decode a kernel hex address ("0100007F:1F90") into "127.0.0.1:8080"
    static std::string DecodeAddress(const std::string& hex, bool ipv6);

    /// Inode of a "socket:[12345]" link target, 0 otherwise
    static std::uint64_t SocketInode(const std::string& link_target);

    /// Clock ticks per second (sysconf(_SC_CLK_TCK))
    static long ClockTicks();
};

} // namespace utils
} // namespace saferun
