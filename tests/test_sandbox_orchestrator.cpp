/**
 * @file test_sandbox_orchestrator.cpp
 * @brief Session lifecycle tests driven by a scripted backend
 *
 * @date 2025
 */

#include "saferun/core/sandbox_orchestrator.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>

using namespace saferun;
using core::EventCategory;
using core::SessionState;
using core::ThreatLevel;
using fakes::BackendCounters;
using fakes::BackendScript;
using fakes::MakeCollected;

namespace {

class SandboxOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = core::SandboxConfig::Defaults();
        config_.sampling_interval = std::chrono::milliseconds(10);
        config_.grace_window = std::chrono::milliseconds(20);
        counters_ = std::make_shared<BackendCounters>();
    }

    std::unique_ptr<core::SandboxOrchestrator> Make(
        const BackendScript& script,
        std::map<int, std::vector<monitors::CollectedEvent>> events = {},
        std::shared_ptr<const analyzers::SignatureSet> signatures = nullptr) {
        return std::make_unique<core::SandboxOrchestrator>(
            config_, signatures ? signatures : analyzers::SignatureSet::Defaults(),
            fakes::MakeFakeFactory(script, counters_),
            fakes::MakeScriptedCollectors(std::move(events)));
    }

    core::ExecutionRequest Request(std::chrono::seconds timeout = std::chrono::seconds(10)) const {
        core::ExecutionRequest request;
        request.target_path = "/nonexistent/sample.bin";
        request.security_level = core::SecurityLevel::HIGH;
        request.isolation_method = core::IsolationMethod::PROCESS;
        request.limits = config_.LimitsFor(core::SecurityLevel::HIGH);
        request.limits.execution_timeout = timeout;
        return request;
    }

    core::SandboxConfig config_;
    std::shared_ptr<BackendCounters> counters_;
};

} // anonymous namespace

// ============================================================================
// TERMINAL STATES
// ============================================================================

TEST_F(SandboxOrchestratorTest, NormalExitCompletes) {
    BackendScript script;
    script.exit_on_poll = 2;
    script.exit_code = 7;
    auto orchestrator = Make(script);

    auto report = orchestrator->Execute(Request());

    EXPECT_EQ(report.final_state, SessionState::COMPLETED);
    EXPECT_TRUE(report.has_verdict);
    EXPECT_EQ(report.threat_level, ThreatLevel::NONE);
    ASSERT_TRUE(report.session.exit_code.has_value());
    EXPECT_EQ(*report.session.exit_code, 7);
    EXPECT_TRUE(report.error_code.empty());
    EXPECT_EQ(report.session.backend, "fake");
    EXPECT_EQ(counters_->teardown, 1);
    EXPECT_EQ(counters_->kill, 1);
    EXPECT_EQ(orchestrator->GetState(), SessionState::COMPLETED);
}

TEST_F(SandboxOrchestratorTest, TimeoutProducesTimedOut) {
    BackendScript script;  // never exits
    auto orchestrator = Make(script);

    auto report = orchestrator->Execute(Request(std::chrono::seconds(1)));

    EXPECT_EQ(report.final_state, SessionState::TIMED_OUT);
    EXPECT_EQ(report.error_code, "timeout_exceeded");
    EXPECT_TRUE(report.has_verdict);
    EXPECT_TRUE(report.threat_level == ThreatLevel::NONE || report.threat_level == ThreatLevel::LOW);
    EXPECT_GE(report.session.duration, std::chrono::milliseconds(1000));
    EXPECT_EQ(counters_->teardown, 1);
}

TEST_F(SandboxOrchestratorTest, HardResourceBreachBlocks) {
    BackendScript script;
    script.memory_bytes = 1024ULL * 1024 * 1024;  // above the HIGH profile
    auto orchestrator = Make(script);

    auto report = orchestrator->Execute(Request());

    EXPECT_EQ(report.final_state, SessionState::BLOCKED);
    EXPECT_EQ(report.error_code, "hard_resource_breach");
    EXPECT_EQ(report.session.peak_memory_bytes, script.memory_bytes);
    EXPECT_EQ(counters_->teardown, 1);
}

TEST_F(SandboxOrchestratorTest, PrepareFailureFailsWithoutTeardown) {
    BackendScript script;
    script.prepare_error = core::ErrorCode::BACKEND_UNAVAILABLE;
    auto orchestrator = Make(script);

    auto report = orchestrator->Execute(Request());

    EXPECT_EQ(report.final_state, SessionState::FAILED);
    EXPECT_FALSE(report.has_verdict);
    EXPECT_EQ(report.error_code, "backend_unavailable");
    EXPECT_FALSE(report.diagnostic.empty());
    EXPECT_TRUE(report.events.empty());
    EXPECT_EQ(counters_->launch, 0);
    EXPECT_EQ(counters_->teardown, 0);
    EXPECT_EQ(counters_->kill, 0);
}

TEST_F(SandboxOrchestratorTest, LaunchFailureTearsDownOnce) {
    BackendScript script;
    script.launch_error = core::ErrorCode::LAUNCH_FAILED;
    auto orchestrator = Make(script);

    auto report = orchestrator->Execute(Request());

    EXPECT_EQ(report.final_state, SessionState::FAILED);
    EXPECT_EQ(report.error_code, "launch_failed");
    EXPECT_FALSE(report.has_verdict);
    EXPECT_EQ(counters_->teardown, 1);
}

TEST_F(SandboxOrchestratorTest, PollFailureKeepsObserving) {
    BackendScript script;
    script.poll_throws = true;
    script.exit_on_poll = 3;
    script.exit_code = 0;
    auto orchestrator = Make(script);

    auto report = orchestrator->Execute(Request());

    EXPECT_EQ(report.final_state, SessionState::COMPLETED);
    EXPECT_TRUE(report.has_verdict);
    EXPECT_GE(counters_->polls, 3);
    EXPECT_EQ(counters_->teardown, 1);
}

TEST_F(SandboxOrchestratorTest, MissingFactoryFailsAsUnavailable) {
    core::SandboxOrchestrator orchestrator(config_, nullptr, nullptr, nullptr);

    auto report = orchestrator.Execute(Request());

    EXPECT_EQ(report.final_state, SessionState::FAILED);
    EXPECT_EQ(report.error_code, "backend_unavailable");
}

// ============================================================================
// CANCELLATION
// ============================================================================

TEST_F(SandboxOrchestratorTest, CancelWhileMonitoringBlocks) {
    BackendScript script;
    auto orchestrator = Make(script);

    auto pending = std::async(std::launch::async, [&]() { return orchestrator->Execute(Request()); });
    while (orchestrator->GetState() != SessionState::MONITORING) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    orchestrator->Cancel();

    auto report = pending.get();
    EXPECT_EQ(report.final_state, SessionState::BLOCKED);
    EXPECT_EQ(report.error_code, "cancelled");
    EXPECT_EQ(counters_->teardown, 1);
    EXPECT_LT(report.session.duration, std::chrono::seconds(5));
}

TEST_F(SandboxOrchestratorTest, CancelWhileIdleAppliesToNextSession) {
    BackendScript script;
    script.exit_on_poll = 1;
    auto orchestrator = Make(script);

    orchestrator->Cancel();
    auto first = orchestrator->Execute(Request());
    EXPECT_EQ(first.final_state, SessionState::BLOCKED);
    EXPECT_EQ(first.error_code, "cancelled");
    EXPECT_EQ(counters_->prepare, 0);
    EXPECT_EQ(counters_->teardown, 0);

    auto second = orchestrator->Execute(Request());
    EXPECT_EQ(second.final_state, SessionState::COMPLETED);
    EXPECT_EQ(counters_->teardown, 1);
}

TEST_F(SandboxOrchestratorTest, CancelWhilePreparingTearsDownWithoutLaunch) {
    auto entered = std::make_shared<std::promise<void>>();
    auto release = std::make_shared<std::promise<void>>();
    std::shared_future<void> released = release->get_future().share();

    BackendScript script;
    script.exit_on_poll = 1;
    script.during_prepare = [entered, released]() {
        entered->set_value();
        released.wait();
    };
    auto orchestrator = Make(script);

    auto pending = std::async(std::launch::async, [&]() { return orchestrator->Execute(Request()); });
    entered->get_future().wait();
    EXPECT_EQ(orchestrator->GetState(), SessionState::PREPARING);
    orchestrator->Cancel();
    release->set_value();

    auto report = pending.get();
    EXPECT_EQ(report.final_state, SessionState::BLOCKED);
    EXPECT_EQ(report.error_code, "cancelled");
    EXPECT_EQ(counters_->prepare, 1);
    EXPECT_EQ(counters_->launch, 0);
    EXPECT_EQ(counters_->teardown, 1);
}

// ============================================================================
// BLOCKING AND TIE-BREAKS
// ============================================================================

TEST_F(SandboxOrchestratorTest, BlacklistedProcessBlocks) {
    BackendScript script;
    std::map<int, std::vector<monitors::CollectedEvent>> events;
    events[1] = {MakeCollected(EventCategory::PROCESS_OP,
                               {{"operation", "spawn"}, {"name", "nmap"},
                                {"cmdline", "nmap -sS 10.0.0.0/24"}})};
    auto orchestrator = Make(script, events);

    auto report = orchestrator->Execute(Request());

    EXPECT_EQ(report.final_state, SessionState::BLOCKED);
    EXPECT_EQ(report.error_code, "blacklisted_operation_detected");
    EXPECT_NE(report.diagnostic.find("nmap"), std::string::npos);
    EXPECT_EQ(report.score.behavior_flags.count(core::BehaviorKind::NETWORK_SCANNING), 1u);
    EXPECT_EQ(counters_->teardown, 1);
}

TEST_F(SandboxOrchestratorTest, BlockedWinsOverExitInSameWindow) {
    BackendScript script;
    script.exit_on_poll = 1;
    std::map<int, std::vector<monitors::CollectedEvent>> events;
    events[1] = {MakeCollected(EventCategory::PROCESS_OP, {{"operation", "spawn"}, {"name", "netcat"}})};
    auto orchestrator = Make(script, events);

    auto report = orchestrator->Execute(Request());

    EXPECT_EQ(report.final_state, SessionState::BLOCKED);
    ASSERT_TRUE(report.session.exit_code.has_value());
}

TEST_F(SandboxOrchestratorTest, TimeoutWinsOverExitInSameWindow) {
    BackendScript script;
    script.exit_on_poll = 1;
    script.first_poll_delay = std::chrono::milliseconds(1100);
    auto orchestrator = Make(script);

    auto report = orchestrator->Execute(Request(std::chrono::seconds(1)));

    EXPECT_EQ(report.final_state, SessionState::TIMED_OUT);
    ASSERT_TRUE(report.session.exit_code.has_value());
}

// ============================================================================
// SCORING
// ============================================================================

TEST_F(SandboxOrchestratorTest, ProcessInjectionScoresHigh) {
    BackendScript script;
    script.exit_on_poll = 3;
    std::map<int, std::vector<monitors::CollectedEvent>> events;
    events[1] = {MakeCollected(EventCategory::PROCESS_OP,
                               {{"operation", "ptrace_attach"}, {"pid", "10"}, {"target_pid", "11"}})};
    events[2] = {MakeCollected(EventCategory::PROCESS_OP,
                               {{"operation", "ptrace_attach"}, {"pid", "10"}, {"target_pid", "12"}})};
    auto orchestrator = Make(script, events);

    auto report = orchestrator->Execute(Request());

    EXPECT_EQ(report.final_state, SessionState::COMPLETED);
    EXPECT_DOUBLE_EQ(report.score.aggregate, 0.8);
    EXPECT_EQ(report.threat_level, ThreatLevel::HIGH);
}

TEST_F(SandboxOrchestratorTest, ConclusiveSignatureIsCritical) {
    analyzers::Signature signature;
    signature.id = "SIG-KILL";
    signature.name = "Known dropper";
    signature.pattern = "dropper\\.bin";
    signature.severity_weight = 0.1;
    signature.conclusive = true;
    auto signatures = std::make_shared<const analyzers::SignatureSet>(
        std::vector<analyzers::Signature>{signature});

    BackendScript script;
    script.exit_on_poll = 2;
    std::map<int, std::vector<monitors::CollectedEvent>> events;
    events[1] = {MakeCollected(EventCategory::FILE_OP,
                               {{"operation", "open"}, {"path", "/tmp/dropper.bin"}, {"access", "w"}})};
    auto orchestrator = Make(script, events, signatures);

    auto report = orchestrator->Execute(Request());

    EXPECT_EQ(report.final_state, SessionState::COMPLETED);
    EXPECT_EQ(report.score.matched_signatures.count("SIG-KILL"), 1u);
    EXPECT_EQ(report.threat_level, ThreatLevel::CRITICAL);
}

TEST_F(SandboxOrchestratorTest, EventsAreSequencedPerSession) {
    BackendScript script;
    script.exit_on_poll = 3;
    std::map<int, std::vector<monitors::CollectedEvent>> events;
    events[1] = {MakeCollected(EventCategory::FILE_OP, {{"path", "/tmp/a"}}),
                 MakeCollected(EventCategory::PROCESS_OP, {{"operation", "spawn"}, {"name", "sh"}})};
    events[2] = {MakeCollected(EventCategory::FILE_OP, {{"path", "/tmp/b"}})};
    auto orchestrator = Make(script, events);

    std::size_t callbacks = 0;
    orchestrator->SetEventCallback([&](const core::MonitoredEvent&, const core::ThreatScore&) {
        ++callbacks;
    });

    auto report = orchestrator->Execute(Request());

    ASSERT_EQ(report.events.size(), 3u);
    EXPECT_EQ(report.session.event_count, 3u);
    EXPECT_EQ(callbacks, 3u);
    EXPECT_EQ(report.events[0].category, EventCategory::PROCESS_OP);
    for (std::size_t i = 0; i < report.events.size(); ++i) {
        EXPECT_EQ(report.events[i].sequence, i);
        EXPECT_EQ(report.events[i].session_id, report.session.session_id);
    }
}

TEST_F(SandboxOrchestratorTest, AnalyzeUsesLevelProfile) {
    BackendScript script;
    script.exit_on_poll = 1;
    auto orchestrator = Make(script);

    auto report = orchestrator->Analyze("/nonexistent/sample.bin", core::SecurityLevel::LOW,
                                        core::IsolationMethod::CONTAINER);

    EXPECT_EQ(report.request.security_level, core::SecurityLevel::LOW);
    EXPECT_EQ(report.request.limits.memory_bytes, 1024ULL * 1024 * 1024);
    EXPECT_EQ(report.request.limits.execution_timeout, std::chrono::seconds(300));
    EXPECT_EQ(report.final_state, SessionState::COMPLETED);
}

// ============================================================================
// BLACKLIST MATCHING
// ============================================================================

TEST(BlacklistMatchTest, MatchesNameArgvAndWildcards) {
    const std::vector<std::string> patterns = {"nc", "net*", "wire?hark"};

    auto by_argv = fakes::MakeEvent(EventCategory::PROCESS_OP,
                                    {{"name", "busybox"}, {"cmdline", "/usr/bin/nc -l 4444"}});
    auto by_wildcard = fakes::MakeEvent(EventCategory::PROCESS_OP, {{"name", "NetCat"}});
    auto by_path = fakes::MakeEvent(EventCategory::PROCESS_OP,
                                    {{"name", "x"}, {"path", "/opt/wireshark"}});
    auto innocent = fakes::MakeEvent(EventCategory::PROCESS_OP,
                                     {{"name", "sync"}, {"cmdline", "sync -f"}});
    auto wrong_category = fakes::MakeEvent(EventCategory::FILE_OP, {{"name", "nc"}});

    EXPECT_EQ(core::SandboxOrchestrator::MatchBlacklist(by_argv, patterns).value_or(""), "nc");
    EXPECT_EQ(core::SandboxOrchestrator::MatchBlacklist(by_wildcard, patterns).value_or(""), "net*");
    EXPECT_TRUE(core::SandboxOrchestrator::MatchBlacklist(by_path, patterns).has_value());
    EXPECT_FALSE(core::SandboxOrchestrator::MatchBlacklist(innocent, patterns).has_value());
    EXPECT_FALSE(core::SandboxOrchestrator::MatchBlacklist(wrong_category, patterns).has_value());
}
