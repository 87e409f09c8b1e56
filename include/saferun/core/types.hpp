/**
 * @file types.hpp
 * @brief Data model shared by the execution-and-observation engine
 *
 * Security profiles, resource limits, execution requests, monitored events,
 * threat scores and the final execution report. Every component of the
 * engine exchanges these values; none of them own behavior beyond
 * conversion helpers.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <filesystem>
#include <chrono>
#include <cstdint>

namespace saferun {
namespace core {

/**
 * @enum SecurityLevel
 * @brief Named profile bundling resource limits and network policy
 */
enum class SecurityLevel {
    LOW,      ///< Generous limits, outbound network allowed
    MEDIUM,   ///< Moderate limits, outbound network with restricted domains
    HIGH      ///< Tight limits, no network
};

/**
 * @enum IsolationMethod
 * @brief Isolation backend variant selected per request
 */
enum class IsolationMethod {
    CONTAINER,  ///< Container runtime (docker / podman)
    PROCESS     ///< Constrained process group on the host kernel
};

/**
 * @enum SessionState
 * @brief Lifecycle of a sandbox session
 *
 * PENDING → PREPARING → RUNNING → MONITORING → terminal state.
 */
enum class SessionState {
    PENDING,      ///< Request accepted, nothing allocated
    PREPARING,    ///< Backend acquisition in progress
    RUNNING,      ///< Target launched inside the backend
    MONITORING,   ///< Observer loop active alongside the target
    COMPLETED,    ///< Target exited within the timeout, no blocking breach
    TIMED_OUT,    ///< Timeout elapsed before the target exited
    BLOCKED,      ///< Blacklisted operation, hard breach or cancellation
    FAILED        ///< Sandbox could not be established
};

/**
 * @enum EventCategory
 * @brief Category of a monitored event
 *
 * Declaration order is the delivery priority used to break timestamp ties.
 */
enum class EventCategory {
    PROCESS_OP,
    FILE_OP,
    NETWORK_OP,
    REGISTRY_OP,
    RESOURCE_USAGE
};

/**
 * @enum BehaviorKind
 * @brief Named suspicious-behavior kinds recognized by the heuristics
 */
enum class BehaviorKind {
    REGISTRY_MODIFICATION,
    FILE_ENCRYPTION,
    PROCESS_INJECTION,
    PERSISTENCE_MECHANISM,
    NETWORK_SCANNING,
    HIGH_RESOURCE_USAGE
};

/**
 * @enum ThreatLevel
 * @brief Categorical verdict derived from a ThreatScore
 */
enum class ThreatLevel {
    NONE,
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

/**
 * @struct NetworkPolicy
 * @brief Per-level network rule, fixed when the backend is prepared
 */
struct NetworkPolicy {
    bool outbound{false};                        ///< Outbound connections allowed
    bool inbound{false};                         ///< Inbound connections allowed
    std::vector<std::string> restricted_domains; ///< Domains that must not resolve (wildcards allowed)
};

/**
 * @struct ResourceLimits
 * @brief Enforceable constraints for one execution
 */
struct ResourceLimits {
    std::uint64_t memory_bytes{512ULL * 1024 * 1024};     ///< Memory ceiling
    double cpu_percent{50.0};                             ///< CPU share (100 = one core)
    std::chrono::seconds execution_timeout{120};          ///< Wall-clock timeout
    bool network_access_allowed{false};                   ///< Any network interface exposed
    NetworkPolicy network;                                ///< Direction and domain rules
};

/**
 * @struct ExecutionRequest
 * @brief One analysis request; immutable once created
 */
struct ExecutionRequest {
    std::filesystem::path target_path;
    SecurityLevel security_level{SecurityLevel::MEDIUM};
    IsolationMethod isolation_method{IsolationMethod::CONTAINER};
    ResourceLimits limits;
};

/// Attribute map carried by an event (all values rendered as strings)
using EventAttributes = std::map<std::string, std::string>;

/**
 * @struct MonitoredEvent
 * @brief Single behavioral observation from a running sandbox
 */
struct MonitoredEvent {
    std::string session_id;                           ///< Owning session
    std::uint64_t sequence{0};                        ///< Delivery position within the session
    std::chrono::system_clock::time_point timestamp;  ///< Observation time
    EventCategory category{EventCategory::PROCESS_OP};
    EventAttributes attributes;

    /// Attribute value or empty string
    std::string Attribute(const std::string& key) const;
};

/**
 * @struct ResourceUsageSample
 * @brief Point-in-time usage of the isolated environment
 */
struct ResourceUsageSample {
    std::chrono::steady_clock::time_point taken_at;
    std::uint64_t memory_bytes{0};
    double cpu_percent{0.0};
    std::uint64_t network_rx_bytes{0};
    std::uint64_t network_tx_bytes{0};
    int process_count{0};
    bool valid{false};   ///< False when the backend could not be sampled
};

/**
 * @struct ThreatScore
 * @brief Running verdict; aggregate never decreases within a session
 */
struct ThreatScore {
    double aggregate{0.0};
    std::set<std::string> matched_signatures;
    std::set<BehaviorKind> behavior_flags;
};

/**
 * @struct SessionSummary
 * @brief Lifecycle facts about a finished session
 */
struct SessionSummary {
    std::string session_id;
    std::string backend;                                  ///< Backend name ("container", "process")
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::chrono::milliseconds duration{0};
    std::optional<int> exit_code;                         ///< Present when the target exited
    std::uint64_t peak_memory_bytes{0};
    double peak_cpu_percent{0.0};
    std::size_t event_count{0};
};

/**
 * @struct ExecutionReport
 * @brief Final, immutable result returned to the caller
 *
 * FAILED reports carry `error_code`/`diagnostic` and `has_verdict == false`:
 * the file could not be sandboxed, which is distinct from a BLOCKED run.
 */
struct ExecutionReport {
    ExecutionRequest request;
    SessionState final_state{SessionState::FAILED};
    SessionSummary session;
    bool has_verdict{false};
    ThreatScore score;
    ThreatLevel threat_level{ThreatLevel::NONE};
    std::vector<MonitoredEvent> events;
    std::string error_code;         ///< Error code name for FAILED/BLOCKED/TIMED_OUT causes
    std::string diagnostic;         ///< Human-readable cause
    std::string sample_sha256;      ///< Identifies the analyzed file
};

// String conversions
std::string ToString(SecurityLevel level);
std::string ToString(IsolationMethod method);
std::string ToString(SessionState state);
std::string ToString(EventCategory category);
std::string ToString(BehaviorKind kind);
std::string ToString(ThreatLevel level);

/// Parse helpers; return std::nullopt for unknown names (case-insensitive)
std::optional<SecurityLevel> ParseSecurityLevel(const std::string& name);
std::optional<IsolationMethod> ParseIsolationMethod(const std::string& name);
std::optional<BehaviorKind> ParseBehaviorKind(const std::string& name);

/// All behavior kinds in declaration order
const std::vector<BehaviorKind>& AllBehaviorKinds();

/// True for COMPLETED, TIMED_OUT, BLOCKED and FAILED
bool IsTerminal(SessionState state);

} // namespace core
} // namespace saferun
