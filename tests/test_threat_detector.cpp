/**
 * @file test_threat_detector.cpp
 * @brief Scoring, behavior heuristics and classification boundaries
 *
 * @date 2025
 */

#include "saferun/analyzers/threat_detector.hpp"
#include "saferun/core/sandbox_config.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>

using namespace saferun;
using analyzers::ThreatDetector;
using core::BehaviorKind;
using core::EventCategory;
using core::ThreatLevel;
using core::ThreatScore;
using fakes::MakeEvent;

namespace {

ThreatDetector DefaultDetector() {
    return ThreatDetector(analyzers::SignatureSet::Defaults(), core::SandboxConfig::Defaults());
}

ThreatScore WithAggregate(double aggregate) {
    ThreatScore score;
    score.aggregate = aggregate;
    return score;
}

} // anonymous namespace

// ============================================================================
// SCORING
// ============================================================================

TEST(ThreatDetectorTest, SignatureCountsOncePerSession) {
    auto detector = DefaultDetector();
    auto event = MakeEvent(EventCategory::FILE_OP,
                           {{"operation", "open"}, {"path", "/etc/passwd"}, {"access", "r"}});

    auto first = detector.Observe(event, ThreatScore{});
    auto second = detector.Observe(event, first);

    EXPECT_EQ(first.matched_signatures.count("SIG-001"), 1u);
    EXPECT_DOUBLE_EQ(first.aggregate, 0.4);
    EXPECT_DOUBLE_EQ(second.aggregate, 0.4);
}

TEST(ThreatDetectorTest, SignatureCategoryFilterIsHonored) {
    auto detector = DefaultDetector();
    // SIG-003 only applies to network events
    auto file = MakeEvent(EventCategory::FILE_OP, {{"path", "/tmp/host:4444"}, {"access", "r"}});
    auto network = MakeEvent(EventCategory::NETWORK_OP,
                             {{"operation", "connect"}, {"remote_address", "10.0.0.5:4444"}});

    EXPECT_EQ(detector.Observe(file, ThreatScore{}).matched_signatures.count("SIG-003"), 0u);
    EXPECT_EQ(detector.Observe(network, ThreatScore{}).matched_signatures.count("SIG-003"), 1u);
}

TEST(ThreatDetectorTest, SuspiciousPortsIncludeAlternateHttp) {
    auto detector = DefaultDetector();
    auto alt_http = MakeEvent(EventCategory::NETWORK_OP,
                              {{"operation", "connect"}, {"remote_address", "10.0.0.5:8080"}});
    auto other = MakeEvent(EventCategory::NETWORK_OP,
                           {{"operation", "connect"}, {"remote_address", "10.0.0.5:80801"}});

    EXPECT_EQ(detector.Observe(alt_http, ThreatScore{}).matched_signatures.count("SIG-003"), 1u);
    EXPECT_EQ(detector.Observe(other, ThreatScore{}).matched_signatures.count("SIG-003"), 0u);
}

TEST(ThreatDetectorTest, ScoreIsMonotoneAndBounded) {
    auto detector = DefaultDetector();
    const std::vector<core::MonitoredEvent> events = {
        MakeEvent(EventCategory::PROCESS_OP, {{"operation", "ptrace_attach"}}),
        MakeEvent(EventCategory::FILE_OP, {{"path", "/home/u/doc.txt.locked"}, {"access", "w"}}),
        MakeEvent(EventCategory::REGISTRY_OP, {{"operation", "write"}, {"key", "/etc/cron.d/job"}}),
        MakeEvent(EventCategory::NETWORK_OP, {{"operation", "scan"}}),
        MakeEvent(EventCategory::FILE_OP, {{"path", "/etc/shadow"}, {"access", "r"}}),
    };

    ThreatScore score;
    double previous = 0.0;
    for (const auto& event : events) {
        score = detector.Observe(event, score);
        EXPECT_GE(score.aggregate, previous);
        EXPECT_LE(score.aggregate, 1.0);
        previous = score.aggregate;
    }
    EXPECT_DOUBLE_EQ(score.aggregate, 1.0);
    EXPECT_EQ(detector.Classify(score), ThreatLevel::CRITICAL);
}

TEST(ThreatDetectorTest, MalformedEventsContributeNothing) {
    auto detector = DefaultDetector();
    auto garbage = MakeEvent(EventCategory::RESOURCE_USAGE,
                             {{"cpu_percent", "lots"}, {"memory_bytes", ""}, {"memory_limit_bytes", "x"}});

    auto score = detector.Observe(garbage, ThreatScore{});
    EXPECT_DOUBLE_EQ(score.aggregate, 0.0);
    EXPECT_TRUE(score.behavior_flags.empty());
}

TEST(ThreatDetectorTest, DisabledBehaviorDoesNotScore) {
    auto config = core::SandboxConfig::Defaults();
    config.enabled_behaviors.erase(BehaviorKind::PROCESS_INJECTION);
    ThreatDetector detector(analyzers::SignatureSet::Defaults(), config);

    auto event = MakeEvent(EventCategory::PROCESS_OP, {{"operation", "ptrace_attach"}});
    auto score = detector.Observe(event, ThreatScore{});

    EXPECT_EQ(detector.DetectBehaviors(event).count(BehaviorKind::PROCESS_INJECTION), 1u);
    EXPECT_TRUE(score.behavior_flags.empty());
    EXPECT_DOUBLE_EQ(score.aggregate, 0.0);
}

TEST(ThreatDetectorTest, ObserveIsDeterministic) {
    auto detector = DefaultDetector();
    auto event = MakeEvent(EventCategory::REGISTRY_OP,
                           {{"operation", "write"}, {"key", "HKLM\\Software\\Microsoft\\Windows\\CurrentVersion\\Run\\x"}});

    auto a = detector.Observe(event, ThreatScore{});
    auto b = detector.Observe(event, ThreatScore{});
    EXPECT_DOUBLE_EQ(a.aggregate, b.aggregate);
    EXPECT_EQ(a.matched_signatures, b.matched_signatures);
    EXPECT_EQ(a.behavior_flags, b.behavior_flags);
}

// ============================================================================
// BEHAVIOR HEURISTICS
// ============================================================================

TEST(ThreatDetectorTest, DetectsEachBehaviorKind) {
    auto detector = DefaultDetector();

    auto registry = MakeEvent(EventCategory::REGISTRY_OP, {{"key", "/etc/hosts"}, {"access", "w"}});
    auto encryption = MakeEvent(EventCategory::FILE_OP, {{"path", "/data/HOW_TO_DECRYPT.txt"}});
    auto injection = MakeEvent(EventCategory::FILE_OP, {{"path", "/proc/1234/mem"}, {"access", "rw"}});
    auto persistence = MakeEvent(EventCategory::FILE_OP, {{"path", "/root/.bashrc"}, {"access", "w"}});
    auto scanning = MakeEvent(EventCategory::PROCESS_OP, {{"name", "sh"}, {"cmdline", "/usr/bin/masscan 10.0.0.0/8"}});
    auto resource = MakeEvent(EventCategory::RESOURCE_USAGE,
                              {{"cpu_percent", "12"}, {"memory_bytes", "950"}, {"memory_limit_bytes", "1000"}});

    EXPECT_EQ(detector.DetectBehaviors(registry).count(BehaviorKind::REGISTRY_MODIFICATION), 1u);
    EXPECT_EQ(detector.DetectBehaviors(encryption).count(BehaviorKind::FILE_ENCRYPTION), 1u);
    EXPECT_EQ(detector.DetectBehaviors(injection).count(BehaviorKind::PROCESS_INJECTION), 1u);
    EXPECT_EQ(detector.DetectBehaviors(persistence).count(BehaviorKind::PERSISTENCE_MECHANISM), 1u);
    EXPECT_EQ(detector.DetectBehaviors(scanning).count(BehaviorKind::NETWORK_SCANNING), 1u);
    EXPECT_EQ(detector.DetectBehaviors(resource).count(BehaviorKind::HIGH_RESOURCE_USAGE), 1u);
}

TEST(ThreatDetectorTest, ReadOnlyAccessIsNotPersistenceOrModification) {
    auto detector = DefaultDetector();
    auto read_profile = MakeEvent(EventCategory::FILE_OP, {{"path", "/root/.bashrc"}, {"access", "r"}});
    auto read_key = MakeEvent(EventCategory::REGISTRY_OP, {{"key", "/etc/cron.d/x"}, {"access", "r"}});

    EXPECT_TRUE(detector.DetectBehaviors(read_profile).empty());
    EXPECT_TRUE(detector.DetectBehaviors(read_key).empty());
}

// ============================================================================
// CLASSIFICATION
// ============================================================================

TEST(ThreatDetectorTest, BoundariesAreClosedBelow) {
    auto detector = DefaultDetector();

    EXPECT_EQ(detector.Classify(WithAggregate(0.0)), ThreatLevel::NONE);
    EXPECT_EQ(detector.Classify(WithAggregate(0.0999)), ThreatLevel::NONE);
    EXPECT_EQ(detector.Classify(WithAggregate(0.1)), ThreatLevel::LOW);
    EXPECT_EQ(detector.Classify(WithAggregate(0.2999)), ThreatLevel::LOW);
    EXPECT_EQ(detector.Classify(WithAggregate(0.3)), ThreatLevel::MEDIUM);
    EXPECT_EQ(detector.Classify(WithAggregate(0.6999)), ThreatLevel::MEDIUM);
    EXPECT_EQ(detector.Classify(WithAggregate(0.7)), ThreatLevel::HIGH);
    EXPECT_EQ(detector.Classify(WithAggregate(0.8999)), ThreatLevel::HIGH);
    EXPECT_EQ(detector.Classify(WithAggregate(0.9)), ThreatLevel::CRITICAL);
    EXPECT_EQ(detector.Classify(WithAggregate(1.0)), ThreatLevel::CRITICAL);
}

TEST(ThreatDetectorTest, BoundariesFollowConfiguredThresholds) {
    ThreatDetector::Config config;
    config.suspicious_threshold = 0.08;
    config.malicious_threshold = 0.95;
    ThreatDetector detector(analyzers::SignatureSet::Defaults(), config);

    EXPECT_DOUBLE_EQ(detector.MinorBoundary(), 0.04);
    EXPECT_DOUBLE_EQ(detector.CriticalBoundary(), 0.95);
    EXPECT_EQ(detector.Classify(WithAggregate(0.04)), ThreatLevel::LOW);
    EXPECT_EQ(detector.Classify(WithAggregate(0.9)), ThreatLevel::MEDIUM);
    EXPECT_EQ(detector.Classify(WithAggregate(0.95)), ThreatLevel::CRITICAL);
}

TEST(ThreatDetectorTest, ConclusiveSignatureForcesCritical) {
    analyzers::Signature signature;
    signature.id = "SIG-X";
    signature.name = "Conclusive";
    signature.pattern = "evil";
    signature.severity_weight = 0.1;
    signature.conclusive = true;
    auto set = std::make_shared<const analyzers::SignatureSet>(std::vector<analyzers::Signature>{signature});
    ThreatDetector detector(set, core::SandboxConfig::Defaults());

    auto score = detector.Observe(MakeEvent(EventCategory::PROCESS_OP, {{"name", "EVIL"}}), ThreatScore{});

    EXPECT_DOUBLE_EQ(score.aggregate, 0.1);
    EXPECT_EQ(detector.Classify(score), ThreatLevel::CRITICAL);
}
