/**
 * @file sandbox_orchestrator.cpp
 * @brief Implementation of the session state machine and observer loop
 *
 * Every window of the observer loop performs, in order: resource sampling,
 * exit polling, one collector pass, scoring of all delivered events and the
 * limiter evaluation. The terminal outcome of a window is chosen by
 * priority (blocking cause, then timeout, then normal exit).
 *
 * @date 2025
 */

#include "saferun/core/sandbox_orchestrator.hpp"
#include "saferun/utils/hash_utils.hpp"
#include "saferun/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <ctime>
#include <future>
#include <iomanip>
#include <random>
#include <sstream>

namespace saferun {
namespace core {

namespace fs = std::filesystem;
using utils::StringUtils;

namespace {

/**
 * Kills and tears down a prepared backend exactly once, on the first of
 * Release() or destruction.
 */
class BackendLease {
public:
    BackendLease(isolation::IsolationBackend& backend, const isolation::BackendHandle& handle)
        : backend_(backend), handle_(handle) {}

    ~BackendLease() { Release(); }

    BackendLease(const BackendLease&) = delete;
    BackendLease& operator=(const BackendLease&) = delete;

    void Release() noexcept {
        if (released_) {
            return;
        }
        released_ = true;
        backend_.EnforceKill(handle_);
        backend_.Teardown(handle_);
    }

private:
    isolation::IsolationBackend& backend_;
    const isolation::BackendHandle& handle_;
    bool released_{false};
};

std::string Basename(const std::string& path) {
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

SandboxOrchestrator::SandboxOrchestrator(SandboxConfig config,
                                         std::shared_ptr<const analyzers::SignatureSet> signatures,
                                         isolation::BackendFactory backend_factory,
                                         monitors::CollectorFactory collector_factory)
    : config_(std::move(config))
    , signatures_(signatures ? std::move(signatures) : analyzers::SignatureSet::Defaults())
    , detector_(signatures_, config_)
    , backend_factory_(std::move(backend_factory))
    , collector_factory_(std::move(collector_factory)) {

    spdlog::debug("Sandbox orchestrator ready: {} signatures, {} blacklist patterns",
                  signatures_->Size(), config_.blacklisted_applications.size());
}

// ============================================================================
// PUBLIC API
// ============================================================================

ExecutionRequest SandboxOrchestrator::MakeRequest(const fs::path& path,
                                                  std::optional<SecurityLevel> level,
                                                  std::optional<IsolationMethod> method) const {
    ExecutionRequest request;
    request.target_path = path;
    request.security_level = level.value_or(config_.default_security_level);
    request.isolation_method = method.value_or(config_.isolation_method);
    request.limits = config_.LimitsFor(request.security_level);
    return request;
}

ExecutionReport SandboxOrchestrator::Analyze(const fs::path& path,
                                             std::optional<SecurityLevel> level,
                                             std::optional<IsolationMethod> method) {
    return Execute(MakeRequest(path, level, method));
}

void SandboxOrchestrator::Cancel() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        cancel_requested_ = true;
    }
    wake_.notify_all();
    spdlog::warn("⚠ Cancellation requested (state: {})", ToString(state_.load()));
}

std::optional<std::string> SandboxOrchestrator::MatchBlacklist(
    const MonitoredEvent& event, const std::vector<std::string>& patterns) {

    if (event.category != EventCategory::PROCESS_OP) {
        return std::nullopt;
    }

    const std::string cmdline = event.Attribute("cmdline");
    const auto argv = StringUtils::SplitWhitespace(cmdline);

    std::vector<std::string> candidates;
    candidates.push_back(event.Attribute("name"));
    candidates.push_back(Basename(event.Attribute("path")));
    if (!argv.empty()) {
        candidates.push_back(Basename(argv.front()));
    }
    candidates.push_back(cmdline);

    for (const auto& pattern : patterns) {
        for (const auto& candidate : candidates) {
            if (!candidate.empty() && StringUtils::WildcardMatch(pattern, candidate)) {
                return pattern;
            }
        }
    }
    return std::nullopt;
}

// ============================================================================
// EXECUTION
// ============================================================================

ExecutionReport SandboxOrchestrator::Execute(const ExecutionRequest& request) {
    std::lock_guard<std::mutex> execution_lock(execution_mutex_);

    Session session;
    session.id = GenerateSessionId();
    session.request = &request;

    ExecutionReport report;
    report.request = request;
    report.session.session_id = session.id;
    report.session.start_time = std::chrono::system_clock::now();
    SetState(SessionState::PENDING);

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("SANDBOX SESSION {}", session.id);
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("Target: {}", request.target_path.string());
    spdlog::info("Security level: {}, isolation: {}",
                 ToString(request.security_level), ToString(request.isolation_method));
    spdlog::info("Limits: {} MB, {:.0f}% CPU, {}s, network {}",
                 request.limits.memory_bytes / (1024 * 1024), request.limits.cpu_percent,
                 request.limits.execution_timeout.count(),
                 request.limits.network_access_allowed ? "allowed" : "denied");

    try {
        report.sample_sha256 = utils::HashUtils::ComputeSHA256(request.target_path);
        spdlog::debug("Sample SHA-256: {}", report.sample_sha256);
    } catch (const std::exception& e) {
        spdlog::warn("⚠ Could not hash target: {}", e.what());
    }

    if (cancel_requested_) {
        return Finalize(std::move(report), session,
                        FromError(ErrorCode::CANCELLED, "Cancelled before preparation"), nullptr);
    }

    // Prepare: nothing to tear down if this fails
    SetState(SessionState::PREPARING);
    std::unique_ptr<isolation::IsolationBackend> backend;
    isolation::BackendHandle handle;
    try {
        backend = backend_factory_ ? backend_factory_(request) : nullptr;
        if (!backend) {
            throw SandboxError(ErrorCode::BACKEND_UNAVAILABLE,
                               "No isolation backend for method " + ToString(request.isolation_method));
        }
        report.session.backend = backend->Name();
        handle = backend->Prepare(request.limits);
    } catch (const SandboxError& e) {
        spdlog::error("Sandbox preparation failed: {}", e.what());
        return Finalize(std::move(report), session, FromError(e.code(), e.what()), nullptr);
    } catch (const std::exception& e) {
        spdlog::error("Sandbox preparation failed: {}", e.what());
        return Finalize(std::move(report), session, FromError(ErrorCode::INTERNAL_ERROR, e.what()), nullptr);
    }

    BackendLease lease(*backend, handle);
    spdlog::info("✓ {} backend prepared: {}", backend->Name(), handle.id);

    if (cancel_requested_) {
        lease.Release();
        return Finalize(std::move(report), session,
                        FromError(ErrorCode::CANCELLED, "Cancelled during preparation"), nullptr);
    }

    std::vector<std::unique_ptr<monitors::EventCollector>> collectors;
    if (collector_factory_) {
        collectors = collector_factory_();
    }
    monitors::ActivityMonitor monitor(std::move(collectors));
    monitor.Start(session.id);
    ResourceLimiter limiter(request.limits, config_.grace_window);

    try {
        backend->Launch(handle, request.target_path);
    } catch (const SandboxError& e) {
        spdlog::error("Launch failed: {}", e.what());
        lease.Release();
        return Finalize(std::move(report), session, FromError(e.code(), e.what()), nullptr);
    } catch (const std::exception& e) {
        spdlog::error("Launch failed: {}", e.what());
        lease.Release();
        return Finalize(std::move(report), session, FromError(ErrorCode::LAUNCH_FAILED, e.what()), nullptr);
    }

    SetState(SessionState::RUNNING);
    limiter.Start(std::chrono::steady_clock::now());
    spdlog::info("✓ Target launched");

    session.backend = backend.get();
    session.handle = &handle;
    session.monitor = &monitor;
    session.limiter = &limiter;
    SetState(SessionState::MONITORING);

    Outcome outcome;
    try {
        auto observer = std::async(std::launch::async, [this, &session]() {
            return ObserveLoop(session);
        });
        outcome = observer.get();
    } catch (const std::exception& e) {
        spdlog::error("Observer failed: {}", e.what());
        outcome = FromError(ErrorCode::INTERNAL_ERROR, e.what());
    }

    lease.Release();

    // Events still buffered are scored but no longer change the outcome
    monitor.Finish();
    DrainEvents(session, false);

    return Finalize(std::move(report), session, outcome, &limiter);
}

// ============================================================================
// OBSERVER LOOP
// ============================================================================

SandboxOrchestrator::Outcome SandboxOrchestrator::ObserveLoop(Session& session) {
    auto& backend = *session.backend;
    auto& handle = *session.handle;
    auto& limiter = *session.limiter;

    while (true) {
        ResourceUsageSample sample;
        try {
            sample = backend.CollectStats(handle);
        } catch (const std::exception& e) {
            spdlog::debug("Resource sampling failed: {}", e.what());
            sample = ResourceUsageSample{};
        }

        // A failed poll counts as "still running" for this window
        std::optional<int> exit_code;
        try {
            exit_code = backend.Poll(handle);
        } catch (const std::exception& e) {
            spdlog::warn("⚠ Exit status poll failed: {}", e.what());
        }

        monitors::ObservationContext context;
        context.handle = &handle;
        if (sample.valid) {
            context.sample = sample;
        }
        context.now = std::chrono::system_clock::now();
        session.monitor->Collect(context);
        DrainEvents(session, true);

        const auto now = std::chrono::steady_clock::now();
        const auto breach = limiter.Evaluate(sample, now);

        if (session.blocked) {
            Outcome outcome = *session.blocked;
            outcome.exit_code = exit_code;
            return outcome;
        }
        if (breach && breach->code == ErrorCode::HARD_RESOURCE_BREACH) {
            spdlog::warn("⚠ Hard resource breach: {}", breach->detail);
            Outcome outcome = FromError(breach->code, breach->detail);
            outcome.exit_code = exit_code;
            return outcome;
        }
        if (cancel_requested_) {
            Outcome outcome = FromError(ErrorCode::CANCELLED, "Cancelled while running");
            outcome.exit_code = exit_code;
            return outcome;
        }
        if (breach) {
            spdlog::warn("⚠ Execution timeout: {}", breach->detail);
            Outcome outcome = FromError(breach->code, breach->detail);
            outcome.exit_code = exit_code;
            return outcome;
        }
        if (exit_code) {
            spdlog::info("✓ Target exited with code {}", *exit_code);
            Outcome outcome;
            outcome.state = SessionState::COMPLETED;
            outcome.exit_code = exit_code;
            return outcome;
        }

        std::chrono::steady_clock::duration wait = config_.sampling_interval;
        const auto remaining = limiter.Deadline() - now;
        if (remaining < wait) {
            wait = remaining;
        }
        if (wait < std::chrono::steady_clock::duration::zero()) {
            wait = std::chrono::steady_clock::duration::zero();
        }
        WaitForNextWindow(wait);
    }
}

void SandboxOrchestrator::DrainEvents(Session& session, bool enforce_blacklist) {
    while (auto event = session.monitor->NextEvent()) {
        session.score = detector_.Observe(*event, session.score);

        if (enforce_blacklist && !session.blocked) {
            if (auto pattern = MatchBlacklist(*event, config_.blacklisted_applications)) {
                const std::string diagnostic = fmt::format(
                    "Blacklisted application '{}' matched pattern '{}'",
                    event->Attribute("name"), *pattern);
                spdlog::warn("⚠ {}", diagnostic);
                session.blocked = FromError(ErrorCode::BLACKLISTED_OPERATION_DETECTED, diagnostic);
            }
        }

        if (event_callback_) {
            event_callback_(*event, session.score);
        }
        session.events.push_back(std::move(*event));
    }
}

bool SandboxOrchestrator::WaitForNextWindow(std::chrono::steady_clock::duration timeout) {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    return wake_.wait_for(lock, timeout, [this]() { return cancel_requested_.load(); });
}

// ============================================================================
// REPORTING
// ============================================================================

ExecutionReport SandboxOrchestrator::Finalize(ExecutionReport report, Session& session,
                                              const Outcome& outcome,
                                              const ResourceLimiter* limiter) {
    report.final_state = outcome.state;
    report.has_verdict = outcome.state != SessionState::FAILED;
    report.score = session.score;
    report.threat_level = report.has_verdict ? detector_.Classify(session.score) : ThreatLevel::NONE;
    report.events = std::move(session.events);
    if (outcome.code) {
        report.error_code = ToString(*outcome.code);
    }
    report.diagnostic = outcome.diagnostic;

    auto& summary = report.session;
    summary.end_time = std::chrono::system_clock::now();
    summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        summary.end_time - summary.start_time);
    summary.exit_code = outcome.exit_code;
    summary.event_count = report.events.size();
    if (limiter != nullptr) {
        summary.peak_memory_bytes = limiter->PeakMemoryBytes();
        summary.peak_cpu_percent = limiter->PeakCpuPercent();
    }

    SetState(outcome.state);
    cancel_requested_ = false;

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("SESSION {} FINISHED: {}", summary.session_id, ToString(outcome.state));
    spdlog::info("═══════════════════════════════════════════════════════════════");
    if (!report.error_code.empty()) {
        spdlog::info("Cause: {} ({})", report.error_code, report.diagnostic);
    }
    if (report.has_verdict) {
        spdlog::info("Threat level: {} (score {:.2f})", ToString(report.threat_level),
                     report.score.aggregate);
    }
    spdlog::info("Events: {}, duration: {} ms", summary.event_count, summary.duration.count());

    return report;
}

void SandboxOrchestrator::SetState(SessionState state) {
    const auto previous = state_.exchange(state);
    if (previous != state) {
        spdlog::debug("Session state: {} → {}", ToString(previous), ToString(state));
    }
}

SandboxOrchestrator::Outcome SandboxOrchestrator::FromError(ErrorCode code,
                                                            const std::string& diagnostic) {
    Outcome outcome;
    outcome.code = code;
    outcome.diagnostic = diagnostic;
    switch (code) {
        case ErrorCode::TIMEOUT_EXCEEDED:
            outcome.state = SessionState::TIMED_OUT;
            break;
        case ErrorCode::BLACKLISTED_OPERATION_DETECTED:
        case ErrorCode::HARD_RESOURCE_BREACH:
        case ErrorCode::CANCELLED:
            outcome.state = SessionState::BLOCKED;
            break;
        default:
            outcome.state = SessionState::FAILED;
            break;
    }
    return outcome;
}

std::string SandboxOrchestrator::GenerateSessionId() {
    auto timestamp = std::time(nullptr);
    std::tm local{};
    localtime_r(&timestamp, &local);

    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::mutex gen_mutex;
    std::uniform_int_distribution<> dis(1000, 9999);

    std::ostringstream oss;
    {
        std::lock_guard<std::mutex> lock(gen_mutex);
        oss << "saferun_" << std::put_time(&local, "%Y%m%d_%H%M%S") << "_" << dis(gen);
    }
    return oss.str();
}

} // namespace core
} // namespace saferun
