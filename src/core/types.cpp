/**
 * @file types.cpp
 * @brief String conversions for the engine's enumerations
 *
 * Names here are the wire names used in configuration files and JSON
 * reports, so they must stay stable.
 *
 * @date 2025
 */

#include "saferun/core/types.hpp"
#include "saferun/core/errors.hpp"
#include "saferun/utils/string_utils.hpp"

namespace saferun {
namespace core {

std::string MonitoredEvent::Attribute(const std::string& key) const {
    auto it = attributes.find(key);
    return it != attributes.end() ? it->second : std::string{};
}

std::string ToString(SecurityLevel level) {
    switch (level) {
        case SecurityLevel::LOW: return "low";
        case SecurityLevel::MEDIUM: return "medium";
        case SecurityLevel::HIGH: return "high";
    }
    return "unknown";
}

std::string ToString(IsolationMethod method) {
    switch (method) {
        case IsolationMethod::CONTAINER: return "container";
        case IsolationMethod::PROCESS: return "process";
    }
    return "unknown";
}

std::string ToString(SessionState state) {
    switch (state) {
        case SessionState::PENDING: return "pending";
        case SessionState::PREPARING: return "preparing";
        case SessionState::RUNNING: return "running";
        case SessionState::MONITORING: return "monitoring";
        case SessionState::COMPLETED: return "completed";
        case SessionState::TIMED_OUT: return "timed_out";
        case SessionState::BLOCKED: return "blocked";
        case SessionState::FAILED: return "failed";
    }
    return "unknown";
}

std::string ToString(EventCategory category) {
    switch (category) {
        case EventCategory::PROCESS_OP: return "process_op";
        case EventCategory::FILE_OP: return "file_op";
        case EventCategory::NETWORK_OP: return "network_op";
        case EventCategory::REGISTRY_OP: return "registry_op";
        case EventCategory::RESOURCE_USAGE: return "resource_usage";
    }
    return "unknown";
}

std::string ToString(BehaviorKind kind) {
    switch (kind) {
        case BehaviorKind::REGISTRY_MODIFICATION: return "registry_modification";
        case BehaviorKind::FILE_ENCRYPTION: return "file_encryption";
        case BehaviorKind::PROCESS_INJECTION: return "process_injection";
        case BehaviorKind::PERSISTENCE_MECHANISM: return "persistence_mechanism";
        case BehaviorKind::NETWORK_SCANNING: return "network_scanning";
        case BehaviorKind::HIGH_RESOURCE_USAGE: return "high_resource_usage";
    }
    return "unknown";
}

std::string ToString(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::NONE: return "none";
        case ThreatLevel::LOW: return "low";
        case ThreatLevel::MEDIUM: return "medium";
        case ThreatLevel::HIGH: return "high";
        case ThreatLevel::CRITICAL: return "critical";
    }
    return "unknown";
}

std::string ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::BACKEND_UNAVAILABLE: return "backend_unavailable";
        case ErrorCode::RESOURCE_ALLOCATION_FAILED: return "resource_allocation_failed";
        case ErrorCode::LAUNCH_FAILED: return "launch_failed";
        case ErrorCode::TIMEOUT_EXCEEDED: return "timeout_exceeded";
        case ErrorCode::BLACKLISTED_OPERATION_DETECTED: return "blacklisted_operation_detected";
        case ErrorCode::HARD_RESOURCE_BREACH: return "hard_resource_breach";
        case ErrorCode::CANCELLED: return "cancelled";
        case ErrorCode::INTERNAL_ERROR: return "internal_error";
    }
    return "unknown";
}

std::optional<SecurityLevel> ParseSecurityLevel(const std::string& name) {
    const std::string lower = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));
    if (lower == "low") return SecurityLevel::LOW;
    if (lower == "medium") return SecurityLevel::MEDIUM;
    if (lower == "high") return SecurityLevel::HIGH;
    return std::nullopt;
}

std::optional<IsolationMethod> ParseIsolationMethod(const std::string& name) {
    const std::string lower = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));
    if (lower == "container") return IsolationMethod::CONTAINER;
    if (lower == "process") return IsolationMethod::PROCESS;
    return std::nullopt;
}

std::optional<BehaviorKind> ParseBehaviorKind(const std::string& name) {
    const std::string lower = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));
    for (auto kind : AllBehaviorKinds()) {
        if (ToString(kind) == lower) {
            return kind;
        }
    }
    // Older configurations call it "anomalous_resource_usage"
    if (lower == "anomalous_resource_usage") {
        return BehaviorKind::HIGH_RESOURCE_USAGE;
    }
    return std::nullopt;
}

const std::vector<BehaviorKind>& AllBehaviorKinds() {
    static const std::vector<BehaviorKind> kinds = {
        BehaviorKind::REGISTRY_MODIFICATION,
        BehaviorKind::FILE_ENCRYPTION,
        BehaviorKind::PROCESS_INJECTION,
        BehaviorKind::PERSISTENCE_MECHANISM,
        BehaviorKind::NETWORK_SCANNING,
        BehaviorKind::HIGH_RESOURCE_USAGE
    };
    return kinds;
}

bool IsTerminal(SessionState state) {
    return state == SessionState::COMPLETED ||
           state == SessionState::TIMED_OUT ||
           state == SessionState::BLOCKED ||
           state == SessionState::FAILED;
}

} // namespace core
} // namespace saferun
