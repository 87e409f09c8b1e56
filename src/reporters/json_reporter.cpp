/**
 * @file json_reporter.cpp
 * @brief Implementation of the JSON report writer
 *
 * @date 2025
 */

#include "saferun/reporters/json_reporter.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace saferun {
namespace reporters {

using json = nlohmann::json;
namespace fs = std::filesystem;

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
}

// ============================================================================
// FILE OUTPUT
// ============================================================================

fs::path JsonReporter::GenerateReport(const core::ExecutionReport& report) {
    try {
        std::error_code ec;
        fs::create_directories(config_.output_directory, ec);
        if (ec) {
            spdlog::error("Failed to create report directory {}: {}",
                          config_.output_directory.string(), ec.message());
            return {};
        }

        const fs::path output_path = config_.output_directory / GenerateFilename(report);
        spdlog::info("Generating report: {}", output_path.string());

        if (!SaveJson(GenerateJsonString(report), output_path)) {
            spdlog::error("Failed to save JSON report");
            return {};
        }

        spdlog::info("✓ JSON report written ({} bytes)", fs::file_size(output_path, ec));
        return output_path;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to generate JSON report: {}", e.what());
        return {};
    }
}

std::string JsonReporter::GenerateJsonString(const core::ExecutionReport& report) const {
    const json j = ToJson(report);
    // Attributes carry raw bytes from the target; invalid UTF-8 is replaced, never fatal
    const int indent = config_.pretty_print ? config_.indent_size : -1;
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string JsonReporter::GenerateFilename(const core::ExecutionReport& report) const {
    const std::string hash = report.sample_sha256.empty()
        ? std::string("unknown")
        : report.sample_sha256.substr(0, 16);
    return hash + "_" + report.session.session_id + ".json";
}

bool JsonReporter::SaveJson(const std::string& json_content, const fs::path& output_path) const {
    std::ofstream file(output_path);
    if (!file) {
        spdlog::error("Failed to open file for writing: {}", output_path.string());
        return false;
    }
    file << json_content;
    file.close();
    return static_cast<bool>(file);
}

// ============================================================================
// SERIALIZATION
// ============================================================================

json JsonReporter::ToJson(const core::ExecutionReport& report) const {
    json j;
    j["schema_version"] = "1.0";
    j["generator"] = "saferun";
    j["final_state"] = core::ToString(report.final_state);

    j["sample"] = {
        {"path", report.request.target_path.string()},
        {"sha256", report.sample_sha256.empty() ? json(nullptr) : json(report.sample_sha256)}
    };

    const auto& limits = report.request.limits;
    j["request"] = {
        {"security_level", core::ToString(report.request.security_level)},
        {"isolation_method", core::ToString(report.request.isolation_method)},
        {"limits", {
            {"memory_bytes", limits.memory_bytes},
            {"cpu_percent", limits.cpu_percent},
            {"execution_timeout_seconds", limits.execution_timeout.count()},
            {"network_access_allowed", limits.network_access_allowed},
            {"network", {
                {"outbound", limits.network.outbound},
                {"inbound", limits.network.inbound},
                {"restricted_domains", limits.network.restricted_domains}
            }}
        }}
    };

    const auto& session = report.session;
    j["session"] = {
        {"id", session.session_id},
        {"backend", session.backend.empty() ? json(nullptr) : json(session.backend)},
        {"start_time", FormatTimestamp(session.start_time)},
        {"end_time", FormatTimestamp(session.end_time)},
        {"duration_ms", session.duration.count()},
        {"exit_code", session.exit_code ? json(*session.exit_code) : json(nullptr)},
        {"peak_memory_bytes", session.peak_memory_bytes},
        {"peak_cpu_percent", session.peak_cpu_percent},
        {"event_count", session.event_count}
    };

    if (report.has_verdict) {
        json behaviors = json::array();
        for (const auto& kind : report.score.behavior_flags) {
            behaviors.push_back(core::ToString(kind));
        }
        j["verdict"] = {
            {"threat_level", core::ToString(report.threat_level)},
            {"aggregate", report.score.aggregate},
            {"matched_signatures", report.score.matched_signatures},
            {"behavior_flags", behaviors}
        };
    } else {
        j["verdict"] = nullptr;
    }

    if (!report.error_code.empty() || !report.diagnostic.empty()) {
        j["diagnostic"] = {
            {"error_code", report.error_code},
            {"message", report.diagnostic}
        };
    } else {
        j["diagnostic"] = nullptr;
    }

    if (config_.include_events) {
        json events = json::array();
        for (const auto& event : report.events) {
            if (config_.max_events > 0 && events.size() >= config_.max_events) {
                j["events_truncated"] = true;
                break;
            }
            events.push_back(EventToJson(event));
        }
        j["events"] = events;
    }

    return j;
}

json JsonReporter::EventToJson(const core::MonitoredEvent& event) const {
    return {
        {"sequence", event.sequence},
        {"timestamp", FormatTimestamp(event.timestamp)},
        {"category", core::ToString(event.category)},
        {"attributes", event.attributes}
    };
}

std::string JsonReporter::FormatTimestamp(const std::chrono::system_clock::time_point& time) {
    const auto t = std::chrono::system_clock::to_time_t(time);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << (millis < 0 ? millis + 1000 : millis) << 'Z';
    return oss.str();
}

} // namespace reporters
} // namespace saferun
