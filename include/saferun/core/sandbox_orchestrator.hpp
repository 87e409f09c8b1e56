/**
 * @file sandbox_orchestrator.hpp
 * @brief Drives one sandbox session from request to report
 *
 * The orchestrator owns the session state machine:
 *
 * ```
 * PENDING → PREPARING → RUNNING → MONITORING → COMPLETED
 *                                            → TIMED_OUT
 *                                            → BLOCKED
 *         (any pre-run step fails)           → FAILED
 * ```
 *
 * An observer task on its own thread polls the backend, samples resource
 * usage, pumps the activity monitor, feeds the resource limiter and scores
 * every delivered event with the threat detector.
 *
 * @date 2025
 */

#pragma once

#include "saferun/analyzers/signature_set.hpp"
#include "saferun/analyzers/threat_detector.hpp"
#include "saferun/core/errors.hpp"
#include "saferun/core/resource_limiter.hpp"
#include "saferun/core/sandbox_config.hpp"
#include "saferun/core/types.hpp"
#include "saferun/isolation/isolation_backend.hpp"
#include "saferun/monitors/activity_monitor.hpp"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace saferun {
namespace core {

/**
 * @class SandboxOrchestrator
 * @brief Executes requests inside an isolation backend and reports the verdict
 *
 * `Execute` blocks until the session reaches a terminal state and always
 * returns a report. Backend errors never escape: they become a FAILED
 * report with a diagnostic. The backend is torn down exactly once on every
 * path that follows a successful Prepare, and never when Prepare failed.
 *
 * Within one observation window, a blocking cause wins over the timeout,
 * which wins over a normal exit.
 *
 * **Thread Safety**: `Cancel` and `GetState` may be called from any thread.
 * Sessions of one orchestrator run one at a time.
 *
 * **Usage Example**:
 * ```cpp
 * auto config = SandboxConfig::LoadFromFile("saferun.json");
 * SandboxOrchestrator orchestrator(config,
 *     analyzers::SignatureSet::FromConfig(config),
 *     isolation::MakeDefaultBackendFactory(config),
 *     monitors::MakeDefaultCollectorFactory());
 *
 * auto report = orchestrator.Analyze("sample.bin", SecurityLevel::HIGH, IsolationMethod::PROCESS);
 * ```
 */
class SandboxOrchestrator {
public:
    /// Invoked on the observer thread for every scored event
    using EventCallback = std::function<void(const MonitoredEvent&, const ThreatScore&)>;

    SandboxOrchestrator(SandboxConfig config,
                        std::shared_ptr<const analyzers::SignatureSet> signatures,
                        isolation::BackendFactory backend_factory,
                        monitors::CollectorFactory collector_factory);
    ~SandboxOrchestrator() = default;

    SandboxOrchestrator(const SandboxOrchestrator&) = delete;
    SandboxOrchestrator& operator=(const SandboxOrchestrator&) = delete;

    /**
     * @brief Run one request to a terminal state
     * @return Final report; FAILED reports carry a diagnostic instead of a verdict
     */
    ExecutionReport Execute(const ExecutionRequest& request);

    /**
     * @brief Build a request from the configured profile and execute it
     * @param level Security level, configured default when absent
     * @param method Isolation method, configured default when absent
     */
    ExecutionReport Analyze(const std::filesystem::path& path,
                            std::optional<SecurityLevel> level = std::nullopt,
                            std::optional<IsolationMethod> method = std::nullopt);

    /// Request with limits taken from the security level's profile
    ExecutionRequest MakeRequest(const std::filesystem::path& path,
                                 std::optional<SecurityLevel> level = std::nullopt,
                                 std::optional<IsolationMethod> method = std::nullopt) const;

    /**
     * @brief Stop the active session
     *
     * Safe from any thread and in any state. The session ends BLOCKED with
     * CANCELLED; a session still preparing is cancelled right after Prepare.
     * A cancellation issued while idle applies to the next session.
     */
    void Cancel();

    /// State of the active (or last) session
    SessionState GetState() const { return state_.load(); }

    void SetEventCallback(EventCallback callback) { event_callback_ = std::move(callback); }

    const SandboxConfig& Config() const { return config_; }

    /**
     * @brief Check a PROCESS_OP event against blacklist patterns
     * @return The matching pattern, if any
     */
    static std::optional<std::string> MatchBlacklist(const MonitoredEvent& event,
                                                     const std::vector<std::string>& patterns);

private:
    /// Terminal outcome of the observer loop
    struct Outcome {
        SessionState state{SessionState::COMPLETED};
        std::optional<ErrorCode> code;
        std::string diagnostic;
        std::optional<int> exit_code;
    };

    /// Mutable per-session data shared by Execute and the observer
    struct Session {
        std::string id;
        const ExecutionRequest* request{nullptr};
        isolation::IsolationBackend* backend{nullptr};
        isolation::BackendHandle* handle{nullptr};
        monitors::ActivityMonitor* monitor{nullptr};
        ResourceLimiter* limiter{nullptr};
        ThreatScore score;
        std::vector<MonitoredEvent> events;
        std::optional<Outcome> blocked;  ///< First blacklist hit
    };

    Outcome ObserveLoop(Session& session);
    void DrainEvents(Session& session, bool enforce_blacklist);
    bool WaitForNextWindow(std::chrono::steady_clock::duration timeout);

    void SetState(SessionState state);
    ExecutionReport Finalize(ExecutionReport report, Session& session, const Outcome& outcome,
                             const ResourceLimiter* limiter);

    static std::string GenerateSessionId();
    /// Outcome for an error code (FAILED, TIMED_OUT or BLOCKED)
    static Outcome FromError(ErrorCode code, const std::string& diagnostic);

    SandboxConfig config_;
    std::shared_ptr<const analyzers::SignatureSet> signatures_;
    analyzers::ThreatDetector detector_;
    isolation::BackendFactory backend_factory_;
    monitors::CollectorFactory collector_factory_;
    EventCallback event_callback_;

    std::mutex execution_mutex_;   ///< Serializes sessions
    std::atomic<SessionState> state_{SessionState::PENDING};
    std::atomic<bool> cancel_requested_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_;
};

} // namespace core
} // namespace saferun
