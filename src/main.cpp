/**
 * @file main.cpp
 * @brief SafeRun - Command-line interface
 *
 * Runs one untrusted file inside the selected isolation backend, prints a
 * console summary and writes the JSON report. SIGINT/SIGTERM cancel the
 * running session.
 *
 * Exit codes: 0 completed, 2 timed out, 3 blocked, 4 failed, 1 usage or
 * configuration error.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "saferun/analyzers/signature_set.hpp"
#include "saferun/core/errors.hpp"
#include "saferun/core/sandbox_config.hpp"
#include "saferun/core/sandbox_orchestrator.hpp"
#include "saferun/isolation/backend_factory.hpp"
#include "saferun/monitors/proc_collectors.hpp"
#include "saferun/reporters/json_reporter.hpp"
#include "saferun/utils/string_utils.hpp"

#include <atomic>
#include <csignal>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>

#include <pthread.h>

using namespace saferun;

namespace {

constexpr int kExitCompleted = 0;
constexpr int kExitUsage = 1;
constexpr int kExitTimedOut = 2;
constexpr int kExitBlocked = 3;
constexpr int kExitFailed = 4;

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/

void PrintBanner() {
    std::cout << R"(
╔═══════════════════════════════════════════════════════════════╗
║                                                               ║
║                 SafeRun - Isolated Execution                  ║
║            Run untrusted files, watch what they do            ║
║                                                               ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

std::string FormatBytes(std::uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit_index];
    return oss.str();
}

void PrintLine(const std::string& label, const std::string& value) {
    std::string text = "  " + label + ": " + value;
    text = utils::StringUtils::Truncate(text, 61);
    std::cout << "║" << text << std::string(text.size() < 63 ? 63 - text.size() : 0, ' ') << "║\n";
}

void PrintConsoleSummary(const core::ExecutionReport& report) {
    const auto& session = report.session;

    std::cout << "\n";
    std::cout << "╔═══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║                     EXECUTION SUMMARY                         ║\n";
    std::cout << "╠═══════════════════════════════════════════════════════════════╣\n";
    PrintLine("Sample", report.request.target_path.filename().string());
    PrintLine("SHA-256", report.sample_sha256.empty() ? "n/a" : report.sample_sha256);
    PrintLine("Session", session.session_id);
    PrintLine("Backend", session.backend.empty() ? "n/a" : session.backend);
    PrintLine("Level", core::ToString(report.request.security_level));
    PrintLine("Result", "[" + utils::StringUtils::ToLower(core::ToString(report.final_state)) + "]");

    if (!report.error_code.empty()) {
        PrintLine("Cause", report.error_code);
        PrintLine("Detail", report.diagnostic);
    }

    if (report.has_verdict) {
        std::ostringstream score;
        score << std::fixed << std::setprecision(2) << report.score.aggregate;
        PrintLine("Threat", core::ToString(report.threat_level) + " (" + score.str() + ")");
        if (!report.score.matched_signatures.empty()) {
            std::vector<std::string> ids(report.score.matched_signatures.begin(),
                                         report.score.matched_signatures.end());
            PrintLine("Signatures", utils::StringUtils::Join(ids, ", "));
        }
        if (!report.score.behavior_flags.empty()) {
            std::vector<std::string> names;
            for (auto kind : report.score.behavior_flags) {
                names.push_back(core::ToString(kind));
            }
            PrintLine("Behaviors", utils::StringUtils::Join(names, ", "));
        }
    } else {
        PrintLine("Threat", "no verdict (sandbox not established)");
    }

    PrintLine("Exit code", session.exit_code ? std::to_string(*session.exit_code) : "n/a");
    PrintLine("Duration", std::to_string(session.duration.count()) + " ms");
    PrintLine("Events", std::to_string(session.event_count));
    PrintLine("Peak memory", FormatBytes(session.peak_memory_bytes));
    std::ostringstream cpu;
    cpu << std::fixed << std::setprecision(1) << session.peak_cpu_percent << " %";
    PrintLine("Peak CPU", cpu.str());
    std::cout << "╚═══════════════════════════════════════════════════════════════╝\n";
}

int ExitCodeFor(core::SessionState state) {
    switch (state) {
        case core::SessionState::COMPLETED: return kExitCompleted;
        case core::SessionState::TIMED_OUT: return kExitTimedOut;
        case core::SessionState::BLOCKED:   return kExitBlocked;
        default:                            return kExitFailed;
    }
}

void ConfigureLogging(bool verbose, const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!log_file.empty()) {
        // 10 MB per file, 5 files
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, 10 * 1024 * 1024, 5));
    }

    auto logger = std::make_shared<spdlog::logger>("saferun", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

/**
 * Waits for SIGINT/SIGTERM on a dedicated thread and cancels the session.
 * The signals must be blocked in every thread before this starts.
 */
class SignalCanceller {
public:
    explicit SignalCanceller(core::SandboxOrchestrator& orchestrator)
        : thread_([this, &orchestrator]() { Run(orchestrator); }) {}

    ~SignalCanceller() {
        done_ = true;
        thread_.join();
    }

    SignalCanceller(const SignalCanceller&) = delete;
    SignalCanceller& operator=(const SignalCanceller&) = delete;

private:
    void Run(core::SandboxOrchestrator& orchestrator) {
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);

        const timespec poll_interval{0, 200 * 1000 * 1000};
        while (!done_) {
            int signal = sigtimedwait(&signals, nullptr, &poll_interval);
            if (signal == SIGINT || signal == SIGTERM) {
                spdlog::warn("⚠ Received signal {}, cancelling", signal);
                orchestrator.Cancel();
            }
        }
    }

    std::atomic<bool> done_{false};
    std::thread thread_;
};

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"SafeRun - run untrusted files in an isolated sandbox"};

    std::string target;
    std::string level_name;
    std::string isolation_name;
    std::string config_path;
    std::string signatures_path;
    std::string output_dir = "./reports";
    std::string log_file;
    int timeout_seconds = 0;
    int memory_mb = 0;
    bool verbose = false;

    app.add_option("file", target, "File to execute inside the sandbox")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("--level", level_name, "Security level")
        ->check(CLI::IsMember({"low", "medium", "high"}, CLI::ignore_case));
    app.add_option("--isolation", isolation_name, "Isolation method")
        ->check(CLI::IsMember({"container", "process"}, CLI::ignore_case));
    app.add_option("--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("--signatures", signatures_path, "JSON signature file")
        ->check(CLI::ExistingFile);
    app.add_option("--timeout", timeout_seconds, "Execution timeout in seconds (overrides the level)")
        ->check(CLI::PositiveNumber);
    app.add_option("--memory-mb", memory_mb, "Memory limit in MB (overrides the level)")
        ->check(CLI::PositiveNumber);
    app.add_option("-o,--output", output_dir, "Output directory for reports")
        ->default_val("./reports");
    app.add_option("--log-file", log_file, "Also log to a rotating file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    PrintBanner();

    try {
        ConfigureLogging(verbose, log_file);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to set up logging: " << e.what() << std::endl;
        return kExitUsage;
    }

    core::SandboxConfig config;
    std::shared_ptr<const analyzers::SignatureSet> signatures;
    try {
        config = config_path.empty() ? core::SandboxConfig::Defaults()
                                     : core::SandboxConfig::LoadFromFile(config_path);
        if (!signatures_path.empty()) {
            config.signatures_file = signatures_path;
        }
        signatures = analyzers::SignatureSet::FromConfig(config);
        spdlog::info("✓ Configuration loaded ({} signatures)", signatures->Size());
    } catch (const core::ConfigError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return kExitUsage;
    }

    // Cancellation signals are handled by SignalCanceller only
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    try {
        core::SandboxOrchestrator orchestrator(config, signatures,
                                               isolation::MakeDefaultBackendFactory(config),
                                               monitors::MakeDefaultCollectorFactory());

        std::optional<core::SecurityLevel> level;
        if (!level_name.empty()) {
            level = core::ParseSecurityLevel(level_name);
        }
        std::optional<core::IsolationMethod> method;
        if (!isolation_name.empty()) {
            method = core::ParseIsolationMethod(isolation_name);
        }

        auto request = orchestrator.MakeRequest(target, level, method);
        if (timeout_seconds > 0) {
            request.limits.execution_timeout = std::chrono::seconds(timeout_seconds);
        }
        if (memory_mb > 0) {
            request.limits.memory_bytes = static_cast<std::uint64_t>(memory_mb) * 1024 * 1024;
        }

        core::ExecutionReport report;
        {
            SignalCanceller canceller(orchestrator);
            report = orchestrator.Execute(request);
        }

        reporters::JsonReporterConfig reporter_config;
        reporter_config.output_directory = output_dir;
        reporters::JsonReporter reporter(reporter_config);
        auto report_path = reporter.GenerateReport(report);
        if (report_path.empty()) {
            spdlog::warn("⚠ Failed to write JSON report");
        } else {
            spdlog::info("[REPORT] JSON report saved: {}", report_path.string());
        }

        PrintConsoleSummary(report);
        return ExitCodeFor(report.final_state);

    } catch (const core::ConfigError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return kExitUsage;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kExitFailed;
    }
}
