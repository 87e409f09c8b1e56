/**
 * @file sandbox_config.cpp
 * @brief Default profiles, JSON parsing and validation of SandboxConfig
 *
 * @date 2025
 */

#include "saferun/core/sandbox_config.hpp"
#include "saferun/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

using json = nlohmann::json;

namespace saferun {
namespace core {

namespace {

constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;

const std::vector<SecurityLevel> kLevels = {
    SecurityLevel::LOW, SecurityLevel::MEDIUM, SecurityLevel::HIGH
};

// Returns the section if present, otherwise the document itself
const json& Section(const json& document, const char* name) {
    if (document.contains(name) && document[name].is_object()) {
        return document[name];
    }
    return document;
}

// Looks a key up in the section first, then at top level
const json* Find(const json& document, const json& section, const char* key) {
    if (section.contains(key)) {
        return &section[key];
    }
    if (document.contains(key)) {
        return &document[key];
    }
    return nullptr;
}

template <typename T>
T Get(const json& value, const std::string& key) {
    try {
        return value.get<T>();
    } catch (const json::exception& e) {
        throw ConfigError("Invalid value for '" + key + "': " + e.what());
    }
}

void ApplyLimitFields(const json& fields, ResourceLimits& limits, bool& network_access) {
    if (fields.contains("memory_mb")) {
        auto mb = Get<double>(fields["memory_mb"], "memory_mb");
        if (mb <= 0) {
            throw ConfigError("memory_mb must be positive");
        }
        limits.memory_bytes = static_cast<std::uint64_t>(mb * kMiB);
    }
    if (fields.contains("cpu_percent")) {
        limits.cpu_percent = Get<double>(fields["cpu_percent"], "cpu_percent");
    }
    if (fields.contains("execution_time_seconds")) {
        auto seconds = Get<long long>(fields["execution_time_seconds"], "execution_time_seconds");
        limits.execution_timeout = std::chrono::seconds(seconds);
    }
    if (fields.contains("network_access")) {
        network_access = Get<bool>(fields["network_access"], "network_access");
    }
}

void ApplyNetworkRule(const json& rule, NetworkPolicy& policy) {
    if (!rule.is_object()) {
        throw ConfigError("network rule must be an object");
    }
    if (rule.contains("outbound")) {
        policy.outbound = Get<bool>(rule["outbound"], "outbound");
    }
    if (rule.contains("inbound")) {
        policy.inbound = Get<bool>(rule["inbound"], "inbound");
    }
    if (rule.contains("restricted_domains")) {
        policy.restricted_domains =
            Get<std::vector<std::string>>(rule["restricted_domains"], "restricted_domains");
    }
}

SecurityLevel RequireLevel(const std::string& name) {
    auto level = ParseSecurityLevel(name);
    if (!level) {
        throw ConfigError("Unknown security level: " + name);
    }
    return *level;
}

BehaviorKind RequireBehavior(const std::string& name) {
    auto kind = ParseBehaviorKind(name);
    if (!kind) {
        throw ConfigError("Unknown behavior: " + name);
    }
    return *kind;
}

} // anonymous namespace

// ============================================================================
// DEFAULTS
// ============================================================================

SandboxConfig SandboxConfig::Defaults() {
    SandboxConfig config;

    ResourceLimits low;
    low.memory_bytes = 1024 * kMiB;
    low.cpu_percent = 75.0;
    low.execution_timeout = std::chrono::seconds(300);
    low.network = NetworkPolicy{true, false, {}};
    low.network_access_allowed = true;

    ResourceLimits medium;
    medium.memory_bytes = 512 * kMiB;
    medium.cpu_percent = 50.0;
    medium.execution_timeout = std::chrono::seconds(120);
    medium.network = NetworkPolicy{true, false, {"*.malware.com"}};
    medium.network_access_allowed = true;

    ResourceLimits high;
    high.memory_bytes = 256 * kMiB;
    high.cpu_percent = 30.0;
    high.execution_timeout = std::chrono::seconds(60);
    high.network = NetworkPolicy{false, false, {}};
    high.network_access_allowed = false;

    config.profiles[SecurityLevel::LOW] = low;
    config.profiles[SecurityLevel::MEDIUM] = medium;
    config.profiles[SecurityLevel::HIGH] = high;

    config.blacklisted_applications = {"netcat", "nc", "nmap", "wireshark"};

    for (auto kind : AllBehaviorKinds()) {
        config.enabled_behaviors.insert(kind);
    }
    config.behavior_weights = {
        {BehaviorKind::REGISTRY_MODIFICATION, 0.2},
        {BehaviorKind::FILE_ENCRYPTION, 0.6},
        {BehaviorKind::PROCESS_INJECTION, 0.8},
        {BehaviorKind::PERSISTENCE_MECHANISM, 0.4},
        {BehaviorKind::NETWORK_SCANNING, 0.3},
        {BehaviorKind::HIGH_RESOURCE_USAGE, 0.1}
    };

    return config;
}

// ============================================================================
// JSON PARSING
// ============================================================================

SandboxConfig SandboxConfig::FromJson(const json& document) {
    if (!document.is_object()) {
        throw ConfigError("Configuration root must be a JSON object");
    }

    SandboxConfig config = Defaults();
    const json& sandbox = Section(document, "sandbox");
    const json& detection = Section(document, "threat_detection");

    if (auto* v = Find(document, sandbox, "default_security_level")) {
        config.default_security_level = RequireLevel(Get<std::string>(*v, "default_security_level"));
    }

    if (auto* v = Find(document, sandbox, "isolation_method")) {
        auto name = Get<std::string>(*v, "isolation_method");
        auto method = ParseIsolationMethod(name);
        if (!method) {
            throw ConfigError("Unknown isolation method: " + name);
        }
        config.isolation_method = *method;
    }

    // Network access flag per level; combined with direction rules below
    std::map<SecurityLevel, bool> network_access;
    for (auto level : kLevels) {
        network_access[level] = config.profiles[level].network_access_allowed;
    }

    if (auto* v = Find(document, sandbox, "resource_limits")) {
        if (!v->is_object()) {
            throw ConfigError("resource_limits must be an object");
        }
        // Scalars apply to every level, per-level objects refine one level
        for (auto level : kLevels) {
            ApplyLimitFields(*v, config.profiles[level], network_access[level]);
        }
        for (auto level : kLevels) {
            const std::string name = ToString(level);
            if (v->contains(name)) {
                if (!(*v)[name].is_object()) {
                    throw ConfigError("resource_limits." + name + " must be an object");
                }
                ApplyLimitFields((*v)[name], config.profiles[level], network_access[level]);
            }
        }
    }

    if (auto* v = Find(document, sandbox, "network_rules")) {
        if (!v->is_object()) {
            throw ConfigError("network_rules must be an object");
        }
        for (const auto& [name, rule] : v->items()) {
            ApplyNetworkRule(rule, config.profiles[RequireLevel(name)].network);
        }
    }

    for (auto level : kLevels) {
        auto& limits = config.profiles[level];
        limits.network_access_allowed =
            network_access[level] && (limits.network.outbound || limits.network.inbound);
    }

    if (auto* v = Find(document, sandbox, "blacklisted_applications")) {
        config.blacklisted_applications =
            Get<std::vector<std::string>>(*v, "blacklisted_applications");
    }

    if (auto* v = Find(document, sandbox, "container_image")) {
        config.container_image = Get<std::string>(*v, "container_image");
    }
    if (auto* v = Find(document, sandbox, "pids_limit")) {
        config.pids_limit = Get<int>(*v, "pids_limit");
    }
    if (auto* v = Find(document, sandbox, "fallback_to_process")) {
        config.fallback_to_process = Get<bool>(*v, "fallback_to_process");
    }
    if (auto* v = Find(document, sandbox, "work_directory")) {
        config.work_directory = Get<std::string>(*v, "work_directory");
    }
    if (auto* v = Find(document, sandbox, "sampling_interval_ms")) {
        config.sampling_interval = std::chrono::milliseconds(Get<long long>(*v, "sampling_interval_ms"));
    }
    if (auto* v = Find(document, sandbox, "grace_window_ms")) {
        config.grace_window = std::chrono::milliseconds(Get<long long>(*v, "grace_window_ms"));
    }

    if (auto* v = Find(document, detection, "suspicious_threshold")) {
        config.suspicious_threshold = Get<double>(*v, "suspicious_threshold");
    }
    if (auto* v = Find(document, detection, "malicious_threshold")) {
        config.malicious_threshold = Get<double>(*v, "malicious_threshold");
    }

    if (auto* v = Find(document, detection, "suspicious_behaviors")) {
        config.enabled_behaviors.clear();
        for (const auto& name : Get<std::vector<std::string>>(*v, "suspicious_behaviors")) {
            config.enabled_behaviors.insert(RequireBehavior(name));
        }
    }

    if (auto* v = Find(document, detection, "behavior_weights")) {
        if (!v->is_object()) {
            throw ConfigError("behavior_weights must be an object");
        }
        for (const auto& [name, weight] : v->items()) {
            config.behavior_weights[RequireBehavior(name)] = Get<double>(weight, name);
        }
    }

    if (auto* v = Find(document, detection, "signatures")) {
        if (!v->is_array()) {
            throw ConfigError("signatures must be an array");
        }
        config.inline_signatures = *v;
    }
    if (auto* v = Find(document, detection, "signatures_file")) {
        config.signatures_file = Get<std::string>(*v, "signatures_file");
    }

    config.Validate();
    return config;
}

SandboxConfig SandboxConfig::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open configuration file: " + path.string());
    }

    json document;
    try {
        file >> document;
    } catch (const json::parse_error& e) {
        throw ConfigError("Malformed configuration file " + path.string() + ": " + e.what());
    }

    auto config = FromJson(document);

    // Relative signature paths are resolved against the config file
    if (!config.signatures_file.empty() && config.signatures_file.is_relative()) {
        config.signatures_file = path.parent_path() / config.signatures_file;
    }

    spdlog::info("Loaded configuration from {}", path.string());
    return config;
}

// ============================================================================
// VALIDATION AND LOOKUP
// ============================================================================

void SandboxConfig::Validate() const {
    if (!(suspicious_threshold > 0.0 && suspicious_threshold < malicious_threshold &&
          malicious_threshold <= 1.0)) {
        throw ConfigError("Thresholds must satisfy 0 < suspicious < malicious <= 1");
    }

    for (auto level : kLevels) {
        auto it = profiles.find(level);
        if (it == profiles.end()) {
            throw ConfigError("Missing profile for level " + ToString(level));
        }
        const auto& limits = it->second;
        if (limits.memory_bytes == 0) {
            throw ConfigError("memory limit must be positive (" + ToString(level) + ")");
        }
        if (limits.cpu_percent <= 0.0) {
            throw ConfigError("cpu_percent must be positive (" + ToString(level) + ")");
        }
        if (limits.execution_timeout.count() <= 0) {
            throw ConfigError("execution_time_seconds must be positive (" + ToString(level) + ")");
        }
    }

    for (const auto& [kind, weight] : behavior_weights) {
        if (!(weight > 0.0 && weight <= 1.0)) {
            throw ConfigError("Weight of " + ToString(kind) + " must be in (0, 1]");
        }
    }

    if (sampling_interval.count() <= 0) {
        throw ConfigError("sampling_interval_ms must be positive");
    }
    if (grace_window.count() < 0) {
        throw ConfigError("grace_window_ms must not be negative");
    }
    if (container_image.empty()) {
        throw ConfigError("container_image must not be empty");
    }
}

ResourceLimits SandboxConfig::LimitsFor(SecurityLevel level) const {
    auto it = profiles.find(level);
    if (it == profiles.end()) {
        throw ConfigError("No profile for level " + ToString(level));
    }
    return it->second;
}

double SandboxConfig::WeightFor(BehaviorKind kind) const {
    if (enabled_behaviors.count(kind) == 0) {
        return 0.0;
    }
    auto it = behavior_weights.find(kind);
    return it != behavior_weights.end() ? it->second : 0.0;
}

} // namespace core
} // namespace saferun
