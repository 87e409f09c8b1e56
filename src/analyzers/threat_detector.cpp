/**
 * @file threat_detector.cpp
 * @brief Implementation of signature matching and behavior heuristics
 *
 * Heuristics work on the attribute vocabulary produced by the collectors:
 *
 * | Category       | Attributes used                                   |
 * |----------------|---------------------------------------------------|
 * | process_op     | operation, name, cmdline, path                    |
 * | file_op        | operation, path, access                           |
 * | network_op     | operation, remote_address, distinct_endpoints     |
 * | registry_op    | operation, key, access                            |
 * | resource_usage | cpu_percent, memory_bytes, memory_limit_bytes     |
 *
 * @date 2025
 */

#include "saferun/analyzers/threat_detector.hpp"
#include "saferun/core/sandbox_config.hpp"
#include "saferun/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <regex>

namespace saferun {
namespace analyzers {

using core::BehaviorKind;
using core::EventCategory;
using core::MonitoredEvent;
using core::ThreatLevel;
using core::ThreatScore;
using utils::StringUtils;

namespace {

const std::vector<std::string> kEncryptedExtensions = {
    ".encrypted", ".locked", ".crypt", ".crypted", ".enc", ".locky", ".wncry"
};

const std::vector<std::string> kRansomNoteNames = {
    "readme_decrypt", "how_to_decrypt", "decrypt_instructions",
    "restore_files", "how_to_recover", "ransom_note"
};

const std::vector<std::string> kPersistencePrefixes = {
    "/etc/cron", "/var/spool/cron", "/etc/systemd/", "/lib/systemd/system/",
    "/etc/init.d/", "/etc/rc.local", "/etc/profile.d/", "/etc/xdg/autostart/"
};

const std::vector<std::string> kPersistenceSuffixes = {
    "/.bashrc", "/.bash_profile", "/.profile", "/.zshrc",
    "/.ssh/authorized_keys", ".desktop"
};

const std::vector<std::string> kScannerTools = {
    "nmap", "masscan", "zmap", "unicornscan"
};

bool IsWriteAccess(const MonitoredEvent& event) {
    const std::string access = event.Attribute("access");
    // Events without access information are treated as writes
    return access.empty() || StringUtils::Contains(access, "w");
}

std::string Basename(const std::string& path) {
    auto slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

ThreatDetector::ThreatDetector(std::shared_ptr<const SignatureSet> signatures, const Config& config)
    : signatures_(signatures ? std::move(signatures) : SignatureSet::Defaults()),
      config_(config) {
    spdlog::debug("Threat detector ready: {} signatures, {} behaviors, thresholds {}/{}",
                  signatures_->Size(), config_.weights.size(),
                  config_.suspicious_threshold, config_.malicious_threshold);
}

ThreatDetector::ThreatDetector(std::shared_ptr<const SignatureSet> signatures,
                               const core::SandboxConfig& config)
    : ThreatDetector(std::move(signatures), ConfigFrom(config)) {
}

ThreatDetector::Config ThreatDetector::ConfigFrom(const core::SandboxConfig& config) {
    Config result;
    result.suspicious_threshold = config.suspicious_threshold;
    result.malicious_threshold = config.malicious_threshold;
    for (auto kind : config.enabled_behaviors) {
        double weight = config.WeightFor(kind);
        if (weight > 0.0) {
            result.weights[kind] = weight;
        }
    }
    return result;
}

// ============================================================================
// SCORING
// ============================================================================

ThreatScore ThreatDetector::Observe(const MonitoredEvent& event, const ThreatScore& running) const {
    ThreatScore next = running;
    double added = 0.0;

    for (const auto& signature : signatures_->Signatures()) {
        if (next.matched_signatures.count(signature.id) > 0) {
            continue;
        }
        if (SignatureSet::Matches(signature, event)) {
            next.matched_signatures.insert(signature.id);
            added += signature.severity_weight;
            spdlog::warn("Signature matched: {} ({}) on {} event",
                         signature.id, signature.name, core::ToString(event.category));
        }
    }

    for (auto kind : DetectBehaviors(event)) {
        auto weight = config_.weights.find(kind);
        if (weight == config_.weights.end()) {
            continue;  // Disabled
        }
        if (next.behavior_flags.insert(kind).second) {
            added += weight->second;
            spdlog::warn("Suspicious behavior: {}", core::ToString(kind));
        }
    }

    next.aggregate = std::clamp(running.aggregate + added, 0.0, 1.0);
    return next;
}

ThreatLevel ThreatDetector::Classify(const ThreatScore& score) const {
    for (const auto& id : score.matched_signatures) {
        const Signature* signature = signatures_->Find(id);
        if (signature && signature->conclusive) {
            return ThreatLevel::CRITICAL;
        }
    }

    if (score.aggregate >= CriticalBoundary()) return ThreatLevel::CRITICAL;
    if (score.aggregate >= config_.malicious_threshold) return ThreatLevel::HIGH;
    if (score.aggregate >= config_.suspicious_threshold) return ThreatLevel::MEDIUM;
    if (score.aggregate >= MinorBoundary()) return ThreatLevel::LOW;
    return ThreatLevel::NONE;
}

double ThreatDetector::MinorBoundary() const {
    return config_.suspicious_threshold <= 0.1 ? config_.suspicious_threshold / 2.0 : 0.1;
}

double ThreatDetector::CriticalBoundary() const {
    return std::max(0.9, config_.malicious_threshold);
}

// ============================================================================
// BEHAVIOR HEURISTICS
// ============================================================================

std::set<BehaviorKind> ThreatDetector::DetectBehaviors(const MonitoredEvent& event) const {
    std::set<BehaviorKind> kinds;

    if (event.category == EventCategory::REGISTRY_OP && IsWriteAccess(event)) {
        kinds.insert(BehaviorKind::REGISTRY_MODIFICATION);
    }
    if (IsFileEncryption(event)) {
        kinds.insert(BehaviorKind::FILE_ENCRYPTION);
    }
    if (IsPersistence(event)) {
        kinds.insert(BehaviorKind::PERSISTENCE_MECHANISM);
    }
    if (IsProcessInjection(event)) {
        kinds.insert(BehaviorKind::PROCESS_INJECTION);
    }
    if (IsNetworkScanning(event)) {
        kinds.insert(BehaviorKind::NETWORK_SCANNING);
    }
    if (IsHighResourceUsage(event)) {
        kinds.insert(BehaviorKind::HIGH_RESOURCE_USAGE);
    }

    return kinds;
}

bool ThreatDetector::IsFileEncryption(const MonitoredEvent& event) const {
    if (event.category != EventCategory::FILE_OP) {
        return false;
    }
    const std::string path = StringUtils::ToLower(event.Attribute("path"));
    if (path.empty()) {
        return false;
    }

    for (const auto& extension : kEncryptedExtensions) {
        if (StringUtils::EndsWith(path, extension)) {
            return true;
        }
    }

    const std::string name = Basename(path);
    for (const auto& note : kRansomNoteNames) {
        if (StringUtils::StartsWith(name, note)) {
            return true;
        }
    }
    return false;
}

bool ThreatDetector::IsPersistence(const MonitoredEvent& event) const {
    std::string location;
    if (event.category == EventCategory::FILE_OP) {
        location = event.Attribute("path");
    } else if (event.category == EventCategory::REGISTRY_OP) {
        location = event.Attribute("key");
    } else {
        return false;
    }
    if (location.empty() || !IsWriteAccess(event)) {
        return false;
    }

    const std::string lower = StringUtils::ToLower(location);
    for (const auto& prefix : kPersistencePrefixes) {
        if (StringUtils::StartsWith(lower, prefix)) {
            return true;
        }
    }
    for (const auto& suffix : kPersistenceSuffixes) {
        if (StringUtils::EndsWith(lower, suffix)) {
            return true;
        }
    }
    // Windows autorun keys
    return StringUtils::Contains(lower, "\\currentversion\\run");
}

bool ThreatDetector::IsProcessInjection(const MonitoredEvent& event) const {
    const std::string operation = event.Attribute("operation");
    if (event.category == EventCategory::PROCESS_OP &&
        (operation == "ptrace_attach" || operation == "memory_write")) {
        return true;
    }

    if (event.category == EventCategory::FILE_OP || event.category == EventCategory::PROCESS_OP) {
        static const std::regex kProcMem(R"(^/proc/[0-9]+/mem$)");
        const std::string path = event.Attribute("path");
        return !path.empty() && std::regex_match(path, kProcMem);
    }
    return false;
}

bool ThreatDetector::IsNetworkScanning(const MonitoredEvent& event) const {
    if (event.category == EventCategory::NETWORK_OP) {
        return event.Attribute("operation") == "scan";
    }

    if (event.category == EventCategory::PROCESS_OP) {
        const std::string name = StringUtils::ToLower(event.Attribute("name"));
        const auto argv = StringUtils::SplitWhitespace(
            StringUtils::ToLower(event.Attribute("cmdline")));
        const std::string program = argv.empty() ? std::string{} : Basename(argv.front());
        for (const auto& tool : kScannerTools) {
            if (name == tool || program == tool) {
                return true;
            }
        }
    }
    return false;
}

bool ThreatDetector::IsHighResourceUsage(const MonitoredEvent& event) const {
    if (event.category != EventCategory::RESOURCE_USAGE) {
        return false;
    }

    auto cpu = StringUtils::ParseDouble(event.Attribute("cpu_percent"));
    if (cpu && *cpu >= config_.high_cpu_percent) {
        return true;
    }

    auto memory = StringUtils::ParseDouble(event.Attribute("memory_bytes"));
    auto limit = StringUtils::ParseDouble(event.Attribute("memory_limit_bytes"));
    return memory && limit && *limit > 0 && *memory >= config_.high_memory_ratio * *limit;
}

} // namespace analyzers
} // namespace saferun
