/**
 * @file json_reporter.hpp
 * @brief JSON serialization of execution reports
 *
 * Report layout:
 *
 * ```json
 * {
 *   "schema_version": "1.0",
 *   "generator": "saferun",
 *   "final_state": "blocked",
 *   "sample":   { "path": "...", "sha256": "..." },
 *   "request":  { "security_level": "high", "isolation_method": "process", "limits": {...} },
 *   "session":  { "id": "...", "backend": "process", "duration_ms": 812, ... },
 *   "verdict":  { "threat_level": "high", "aggregate": 0.8, "matched_signatures": [...],
 *                 "behavior_flags": [...] },
 *   "diagnostic": { "error_code": "hard_resource_breach", "message": "..." },
 *   "events":   [ { "sequence": 0, "timestamp": "...", "category": "process_op",
 *                   "attributes": {...} } ]
 * }
 * ```
 *
 * `verdict` is null for FAILED reports, `diagnostic` is null when the
 * session ended without a cause.
 *
 * @date 2025
 */

#pragma once

#include "saferun/core/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace saferun {
namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief JSON report output options
 */
struct JsonReporterConfig {
    std::filesystem::path output_directory{"./reports"};  ///< Output directory
    bool pretty_print{true};                              ///< Pretty print JSON
    int indent_size{2};                                   ///< Indentation spaces
    bool include_events{true};                            ///< Include the event list
    std::size_t max_events{0};                            ///< Event cap, 0 = unlimited
};

/**
 * @class JsonReporter
 * @brief Writes ExecutionReports as JSON documents
 *
 * Report files are named `<first 16 hex digits of sha256>_<session id>.json`
 * ("unknown" replaces the hash when the sample could not be hashed).
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig{});

    /**
     * @brief Serialize and save a report
     * @return Path of the written file, empty on failure
     */
    std::filesystem::path GenerateReport(const core::ExecutionReport& report);

    /// Report as a JSON value
    nlohmann::json ToJson(const core::ExecutionReport& report) const;

    /// Report as text, formatted per configuration
    std::string GenerateJsonString(const core::ExecutionReport& report) const;

    /// File name for a report
    std::string GenerateFilename(const core::ExecutionReport& report) const;

    const JsonReporterConfig& GetConfig() const { return config_; }

    /// ISO 8601 UTC with milliseconds ("2025-01-31T12:00:00.250Z")
    static std::string FormatTimestamp(const std::chrono::system_clock::time_point& time);

private:
    nlohmann::json EventToJson(const core::MonitoredEvent& event) const;
    bool SaveJson(const std::string& json_content, const std::filesystem::path& output_path) const;

    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace saferun
