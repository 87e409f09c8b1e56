/**
 * @file sandbox_config.hpp
 * @brief Engine configuration: security profiles, blacklist and detection tuning
 *
 * Configuration is plain data loaded once per process. The JSON layout
 * mirrors the classic SafeRun file, so keys may sit at top level or inside
 * `sandbox` / `threat_detection` sections:
 *
 * @code{.json}
 * {
 *   "sandbox": {
 *     "default_security_level": "medium",
 *     "isolation_method": "container",
 *     "resource_limits": { "memory_mb": 512, "high": { "memory_mb": 256 } },
 *     "blacklisted_applications": ["netcat", "nmap"],
 *     "network_rules": { "medium": { "outbound": true, "restricted_domains": ["*.malware.com"] } }
 *   },
 *   "threat_detection": {
 *     "suspicious_threshold": 0.3,
 *     "malicious_threshold": 0.7,
 *     "suspicious_behaviors": ["process_injection", "network_scanning"]
 *   }
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "saferun/core/types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <set>
#include <vector>
#include <string>
#include <chrono>
#include <filesystem>

namespace saferun {
namespace core {

/**
 * @struct SandboxConfig
 * @brief Validated engine configuration
 */
struct SandboxConfig {
    // Execution defaults
    SecurityLevel default_security_level{SecurityLevel::MEDIUM};
    IsolationMethod isolation_method{IsolationMethod::CONTAINER};
    std::map<SecurityLevel, ResourceLimits> profiles;         ///< Limits per security level
    std::vector<std::string> blacklisted_applications;        ///< Wildcard patterns

    // Threat detection
    double suspicious_threshold{0.3};
    double malicious_threshold{0.7};
    std::set<BehaviorKind> enabled_behaviors;                 ///< Heuristics that may score
    std::map<BehaviorKind, double> behavior_weights;          ///< Weight per behavior kind
    nlohmann::json inline_signatures;                         ///< `signatures` array, null if absent
    std::filesystem::path signatures_file;                    ///< External signature file, empty if none

    // Backend tuning
    std::string container_image{"alpine:latest"};
    int pids_limit{128};                                      ///< Process cap inside containers
    bool fallback_to_process{false};                          ///< Use process isolation if no runtime
    std::filesystem::path work_directory;                     ///< Staging root, empty = temp dir

    // Observer loop
    std::chrono::milliseconds sampling_interval{250};
    std::chrono::milliseconds grace_window{2000};

    /// Built-in profile table and detection defaults
    static SandboxConfig Defaults();

    /**
     * @brief Overlay a JSON document onto the defaults
     * @throws ConfigError on unknown names, wrong types or invalid ranges
     */
    static SandboxConfig FromJson(const nlohmann::json& document);

    /// Read and parse a JSON file (@throws ConfigError)
    static SandboxConfig LoadFromFile(const std::filesystem::path& path);

    /// Limits of a security level
    ResourceLimits LimitsFor(SecurityLevel level) const;

    /// Check ranges and cross-field constraints (@throws ConfigError)
    void Validate() const;

    /// Weight of a behavior, 0 when the behavior is disabled
    double WeightFor(BehaviorKind kind) const;
};

} // namespace core
} // namespace saferun
