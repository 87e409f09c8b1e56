/**
 * @file proc_utils.cpp
 * @brief Implementation of procfs readers
 *
 * @date 2025
 */

#include "saferun/utils/proc_utils.hpp"
#include "saferun/utils/string_utils.hpp"

#include <arpa/inet.h>
#include <unistd.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <system_error>

namespace saferun {
namespace utils {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> ReadFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

fs::path PidDir(const fs::path& proc_root, pid_t pid) {
    return proc_root / std::to_string(pid);
}

} // anonymous namespace

// ============================================================================
// PROCESS LISTING
// ============================================================================

std::vector<pid_t> ProcUtils::ListPids(const fs::path& proc_root) {
    std::vector<pid_t> pids;
    std::error_code ec;
    for (fs::directory_iterator it(proc_root, ec), end; !ec && it != end; it.increment(ec)) {
        auto pid = StringUtils::ParseInt(it->path().filename().string());
        if (pid && *pid > 0) {
            pids.push_back(static_cast<pid_t>(*pid));
        }
    }
    return pids;
}

std::optional<ProcStat> ProcUtils::ReadStat(const fs::path& proc_root, pid_t pid) {
    auto content = ReadFile(PidDir(proc_root, pid) / "stat");
    if (!content) {
        return std::nullopt;
    }
    return ParseStat(*content);
}

std::optional<ProcStat> ProcUtils::ParseStat(const std::string& content) {
    // "pid (comm) state ppid pgrp session tty tpgid flags minflt cminflt majflt cmajflt utime stime ..."
    auto open = content.find('(');
    auto close = content.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return std::nullopt;
    }

    ProcStat stat;
    auto pid = StringUtils::ParseInt(content.substr(0, open));
    if (!pid) {
        return std::nullopt;
    }
    stat.pid = static_cast<pid_t>(*pid);
    stat.comm = content.substr(open + 1, close - open - 1);

    auto fields = StringUtils::SplitWhitespace(content.substr(close + 1));
    // fields[0] is state (field 3); utime is field 14, stime 15, starttime 22
    if (fields.size() < 20) {
        return std::nullopt;
    }
    stat.state = fields[0].empty() ? '?' : fields[0][0];

    auto ppid = StringUtils::ParseInt(fields[1]);
    auto pgrp = StringUtils::ParseInt(fields[2]);
    auto utime = StringUtils::ParseInt(fields[11]);
    auto stime = StringUtils::ParseInt(fields[12]);
    auto start = StringUtils::ParseInt(fields[19]);
    if (!ppid || !pgrp || !utime || !stime || !start) {
        return std::nullopt;
    }
    stat.ppid = static_cast<pid_t>(*ppid);
    stat.pgrp = static_cast<pid_t>(*pgrp);
    stat.utime = static_cast<std::uint64_t>(*utime);
    stat.stime = static_cast<std::uint64_t>(*stime);
    stat.start_time = static_cast<std::uint64_t>(*start);
    return stat;
}

// ============================================================================
// PER-PROCESS DETAILS
// ============================================================================

std::optional<std::uint64_t> ProcUtils::ReadRssBytes(const fs::path& proc_root, pid_t pid) {
    auto content = ReadFile(PidDir(proc_root, pid) / "statm");
    if (!content) {
        return std::nullopt;
    }
    auto fields = StringUtils::SplitWhitespace(*content);
    if (fields.size() < 2) {
        return std::nullopt;
    }
    auto pages = StringUtils::ParseInt(fields[1]);
    if (!pages || *pages < 0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(*pages) * static_cast<std::uint64_t>(sysconf(_SC_PAGESIZE));
}

std::string ProcUtils::ReadCmdline(const fs::path& proc_root, pid_t pid) {
    auto content = ReadFile(PidDir(proc_root, pid) / "cmdline");
    if (!content) {
        return {};
    }
    return StringUtils::Join(StringUtils::Split(*content, '\0'), " ");
}

std::optional<std::string> ProcUtils::ReadStatusField(const fs::path& proc_root,
                                                      pid_t pid, const std::string& key) {
    std::ifstream file(PidDir(proc_root, pid) / "status");
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::string line;
    const std::string prefix = key + ":";
    while (std::getline(file, line)) {
        if (StringUtils::StartsWith(line, prefix)) {
            return StringUtils::Trim(line.substr(prefix.size()));
        }
    }
    return std::nullopt;
}

std::string ProcUtils::ReadCgroup(const fs::path& proc_root, pid_t pid) {
    return ReadFile(PidDir(proc_root, pid) / "cgroup").value_or("");
}

std::vector<OpenFile> ProcUtils::ListOpenFiles(const fs::path& proc_root, pid_t pid) {
    std::vector<OpenFile> files;
    const fs::path fd_dir = PidDir(proc_root, pid) / "fd";

    std::error_code ec;
    for (fs::directory_iterator it(fd_dir, ec), end; !ec && it != end; it.increment(ec)) {
        auto fd = StringUtils::ParseInt(it->path().filename().string());
        if (!fd) {
            continue;
        }

        std::error_code link_ec;
        auto target = fs::read_symlink(it->path(), link_ec);
        if (link_ec) {
            continue;
        }

        OpenFile file;
        file.fd = static_cast<int>(*fd);
        file.target = target.string();

        // fdinfo "flags:\t0100002" is octal
        std::ifstream info(PidDir(proc_root, pid) / "fdinfo" / std::to_string(file.fd));
        std::string line;
        while (std::getline(info, line)) {
            if (StringUtils::StartsWith(line, "flags:")) {
                try {
                    file.flags = std::stoi(StringUtils::Trim(line.substr(6)), nullptr, 8);
                } catch (const std::exception&) {
                    file.flags = 0;
                }
                break;
            }
        }
        files.push_back(file);
    }
    return files;
}

// ============================================================================
// SOCKETS
// ============================================================================

std::vector<SocketEntry> ProcUtils::ReadSockets(const fs::path& proc_root,
                                                const std::string& protocol) {
    std::vector<SocketEntry> entries;
    std::ifstream file(proc_root / "net" / protocol);
    if (!file.is_open()) {
        return entries;
    }

    const bool ipv6 = StringUtils::EndsWith(protocol, "6");
    std::string line;
    std::getline(file, line);  // Header

    // sl local_address rem_address st tx_queue:rx_queue tr:tm->when retrnsmt uid timeout inode
    while (std::getline(file, line)) {
        auto fields = StringUtils::SplitWhitespace(line);
        if (fields.size() < 10) {
            continue;
        }
        SocketEntry entry;
        entry.protocol = protocol;
        entry.local_address = DecodeAddress(fields[1], ipv6);
        entry.remote_address = DecodeAddress(fields[2], ipv6);
        try {
            entry.state = std::stoi(fields[3], nullptr, 16);
        } catch (const std::exception&) {
            continue;
        }
        auto inode = StringUtils::ParseInt(fields[9]);
        entry.inode = inode ? static_cast<std::uint64_t>(*inode) : 0;
        entries.push_back(entry);
    }
    return entries;
}

std::string ProcUtils::DecodeAddress(const std::string& hex, bool ipv6) {
    auto colon = hex.find(':');
    if (colon == std::string::npos) {
        return hex;
    }
    const std::string addr_hex = hex.substr(0, colon);
    unsigned port = 0;
    try {
        port = static_cast<unsigned>(std::stoul(hex.substr(colon + 1), nullptr, 16));
    } catch (const std::exception&) {
        return hex;
    }

    // The kernel prints each 32-bit word in host byte order
    const std::size_t words = ipv6 ? 4 : 1;
    if (addr_hex.size() != words * 8) {
        return hex;
    }
    std::uint32_t raw[4] = {0, 0, 0, 0};
    for (std::size_t i = 0; i < words; ++i) {
        try {
            raw[i] = static_cast<std::uint32_t>(std::stoul(addr_hex.substr(i * 8, 8), nullptr, 16));
        } catch (const std::exception&) {
            return hex;
        }
    }

    char buffer[INET6_ADDRSTRLEN] = {0};
    if (inet_ntop(ipv6 ? AF_INET6 : AF_INET, raw, buffer, sizeof(buffer)) == nullptr) {
        return hex;
    }
    return ipv6 ? "[" + std::string(buffer) + "]:" + std::to_string(port)
                : std::string(buffer) + ":" + std::to_string(port);
}

std::uint64_t ProcUtils::SocketInode(const std::string& link_target) {
    if (!StringUtils::StartsWith(link_target, "socket:[") || !StringUtils::EndsWith(link_target, "]")) {
        return 0;
    }
    auto inode = StringUtils::ParseInt(link_target.substr(8, link_target.size() - 9));
    return inode ? static_cast<std::uint64_t>(*inode) : 0;
}

long ProcUtils::ClockTicks() {
    static const long ticks = sysconf(_SC_CLK_TCK);
    return ticks > 0 ? ticks : 100;
}

} // namespace utils
} // namespace saferun
