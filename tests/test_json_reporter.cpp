/**
 * @file test_json_reporter.cpp
 * @brief JSON report layout and file output
 *
 * @date 2025
 */

#include "saferun/reporters/json_reporter.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <unistd.h>

using namespace saferun;
using reporters::JsonReporter;
using reporters::JsonReporterConfig;
using json = nlohmann::json;

namespace {

core::ExecutionReport BlockedReport() {
    core::ExecutionReport report;
    report.request.target_path = "/samples/dropper.bin";
    report.request.security_level = core::SecurityLevel::HIGH;
    report.request.isolation_method = core::IsolationMethod::PROCESS;
    report.request.limits.memory_bytes = 256ULL * 1024 * 1024;
    report.request.limits.execution_timeout = std::chrono::seconds(60);

    report.final_state = core::SessionState::BLOCKED;
    report.has_verdict = true;
    report.score.aggregate = 0.8;
    report.score.matched_signatures = {"SIG-001"};
    report.score.behavior_flags = {core::BehaviorKind::PROCESS_INJECTION};
    report.threat_level = core::ThreatLevel::HIGH;
    report.error_code = "blacklisted_operation_detected";
    report.diagnostic = "blacklisted application nmap";
    report.sample_sha256 = "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08";

    report.session.session_id = "saferun_20250101_120000_0001";
    report.session.backend = "process";
    report.session.start_time = std::chrono::system_clock::time_point(std::chrono::milliseconds(1735732800250LL));
    report.session.end_time = report.session.start_time + std::chrono::milliseconds(812);
    report.session.duration = std::chrono::milliseconds(812);
    report.session.exit_code = 137;
    report.session.event_count = 3;

    for (std::uint64_t i = 0; i < 3; ++i) {
        core::MonitoredEvent event;
        event.session_id = report.session.session_id;
        event.sequence = i;
        event.timestamp = report.session.start_time;
        event.category = core::EventCategory::PROCESS_OP;
        event.attributes = {{"operation", "spawn"}, {"pid", std::to_string(100 + i)}};
        report.events.push_back(event);
    }
    return report;
}

} // anonymous namespace

TEST(JsonReporterTest, SerializesVerdictSessionAndEvents) {
    JsonReporter reporter;
    auto j = reporter.ToJson(BlockedReport());

    EXPECT_EQ(j["schema_version"], "1.0");
    EXPECT_EQ(j["final_state"], "blocked");
    EXPECT_EQ(j["sample"]["path"], "/samples/dropper.bin");
    EXPECT_EQ(j["request"]["security_level"], "high");
    EXPECT_EQ(j["request"]["isolation_method"], "process");
    EXPECT_EQ(j["request"]["limits"]["execution_timeout_seconds"], 60);

    EXPECT_EQ(j["session"]["backend"], "process");
    EXPECT_EQ(j["session"]["exit_code"], 137);
    EXPECT_EQ(j["session"]["duration_ms"], 812);
    EXPECT_EQ(j["session"]["start_time"], "2025-01-01T12:00:00.250Z");

    EXPECT_EQ(j["verdict"]["threat_level"], "high");
    EXPECT_DOUBLE_EQ(j["verdict"]["aggregate"].get<double>(), 0.8);
    EXPECT_EQ(j["verdict"]["matched_signatures"], json::array({"SIG-001"}));
    EXPECT_EQ(j["verdict"]["behavior_flags"], json::array({"process_injection"}));

    EXPECT_EQ(j["diagnostic"]["error_code"], "blacklisted_operation_detected");

    ASSERT_EQ(j["events"].size(), 3u);
    EXPECT_EQ(j["events"][2]["sequence"], 2);
    EXPECT_EQ(j["events"][0]["category"], "process_op");
    EXPECT_EQ(j["events"][0]["attributes"]["pid"], "100");
    EXPECT_FALSE(j.contains("events_truncated"));
}

TEST(JsonReporterTest, FailedReportHasNoVerdict) {
    auto report = BlockedReport();
    report.final_state = core::SessionState::FAILED;
    report.has_verdict = false;
    report.sample_sha256.clear();
    report.session.backend.clear();
    report.session.exit_code.reset();

    auto j = JsonReporter().ToJson(report);
    EXPECT_TRUE(j["verdict"].is_null());
    EXPECT_TRUE(j["sample"]["sha256"].is_null());
    EXPECT_TRUE(j["session"]["backend"].is_null());
    EXPECT_TRUE(j["session"]["exit_code"].is_null());
}

TEST(JsonReporterTest, CompletedReportWithoutCauseHasNullDiagnostic) {
    auto report = BlockedReport();
    report.final_state = core::SessionState::COMPLETED;
    report.error_code.clear();
    report.diagnostic.clear();

    EXPECT_TRUE(JsonReporter().ToJson(report)["diagnostic"].is_null());
}

TEST(JsonReporterTest, EventCapMarksTruncation) {
    JsonReporterConfig config;
    config.max_events = 2;
    auto j = JsonReporter(config).ToJson(BlockedReport());
    EXPECT_EQ(j["events"].size(), 2u);
    EXPECT_EQ(j["events_truncated"], true);

    config.include_events = false;
    EXPECT_FALSE(JsonReporter(config).ToJson(BlockedReport()).contains("events"));
}

TEST(JsonReporterTest, FilenameUsesHashPrefixAndSession) {
    auto report = BlockedReport();
    JsonReporter reporter;
    EXPECT_EQ(reporter.GenerateFilename(report), "9f86d081884c7d65_saferun_20250101_120000_0001.json");

    report.sample_sha256.clear();
    EXPECT_EQ(reporter.GenerateFilename(report), "unknown_saferun_20250101_120000_0001.json");
}

TEST(JsonReporterTest, GenerateReportWritesParsableFile) {
    JsonReporterConfig config;
    config.output_directory = std::filesystem::temp_directory_path() /
                              ("saferun_reports_" + std::to_string(::getpid()));
    config.pretty_print = false;
    JsonReporter reporter(config);

    auto path = reporter.GenerateReport(BlockedReport());
    ASSERT_FALSE(path.empty());
    ASSERT_TRUE(std::filesystem::exists(path));

    std::ifstream file(path);
    json parsed = json::parse(file);
    EXPECT_EQ(parsed["session"]["id"], "saferun_20250101_120000_0001");

    std::filesystem::remove_all(config.output_directory);
}

TEST(JsonReporterTest, InvalidUtf8AttributesStillProduceReport) {
    auto report = BlockedReport();
    core::MonitoredEvent event;
    event.session_id = report.session.session_id;
    event.sequence = 3;
    event.timestamp = report.session.start_time;
    event.category = core::EventCategory::FILE_OP;
    event.attributes = {{"operation", "open"}, {"path", "/tmp/\xff\xfe.dat"}};
    report.events.push_back(event);

    JsonReporterConfig config;
    config.output_directory = std::filesystem::temp_directory_path() /
                              ("saferun_reports_utf8_" + std::to_string(::getpid()));
    JsonReporter reporter(config);

    auto path = reporter.GenerateReport(report);
    ASSERT_FALSE(path.empty());

    std::ifstream file(path);
    json parsed = json::parse(file);
    ASSERT_EQ(parsed["events"].size(), 4u);
    EXPECT_EQ(parsed["events"][3]["attributes"]["path"], "/tmp/\xEF\xBF\xBD\xEF\xBF\xBD.dat");

    std::filesystem::remove_all(config.output_directory);
}

TEST(JsonReporterTest, FormatTimestampPadsMilliseconds) {
    auto epoch = std::chrono::system_clock::time_point(std::chrono::milliseconds(7));
    EXPECT_EQ(JsonReporter::FormatTimestamp(epoch), "1970-01-01T00:00:00.007Z");
}
