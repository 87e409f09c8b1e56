/**
 * @file test_fakes.hpp
 * @brief Scripted backend and collector doubles for orchestrator tests
 *
 * @date 2025
 */

#pragma once

#include "saferun/core/errors.hpp"
#include "saferun/isolation/isolation_backend.hpp"
#include "saferun/monitors/activity_monitor.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

namespace saferun {
namespace fakes {

/// Counts every call, including repeated kill/teardown calls
struct BackendCounters {
    std::atomic<int> prepare{0};
    std::atomic<int> launch{0};
    std::atomic<int> polls{0};
    std::atomic<int> kill{0};
    std::atomic<int> teardown{0};
};

/// What the fake backend does
struct BackendScript {
    std::optional<core::ErrorCode> prepare_error;
    std::optional<core::ErrorCode> launch_error;
    std::optional<int> exit_on_poll;                 ///< Poll number (1-based) that reports an exit
    int exit_code{0};
    std::uint64_t memory_bytes{16ULL * 1024 * 1024};
    double cpu_percent{1.0};
    std::chrono::milliseconds first_poll_delay{0};   ///< Sleep inside the first Poll
    std::function<void()> during_prepare;            ///< Runs inside Prepare before it returns
    bool poll_throws{false};                         ///< Poll raises instead of answering
};

class FakeBackend : public isolation::IsolationBackend {
public:
    FakeBackend(BackendScript script, std::shared_ptr<BackendCounters> counters)
        : script_(std::move(script)), counters_(std::move(counters)) {}

    isolation::BackendHandle Prepare(const core::ResourceLimits& limits) override {
        ++counters_->prepare;
        if (script_.during_prepare) {
            script_.during_prepare();
        }
        if (script_.prepare_error) {
            throw core::SandboxError(*script_.prepare_error, "scripted prepare failure");
        }
        isolation::BackendHandle handle;
        handle.id = "fake-1";
        handle.native_id = "fake-1";
        handle.scope.process_group = 4242;
        handle.limits = limits;
        return handle;
    }

    void Launch(isolation::BackendHandle&, const std::filesystem::path&) override {
        ++counters_->launch;
        if (script_.launch_error) {
            throw core::SandboxError(*script_.launch_error, "scripted launch failure");
        }
    }

    core::ResourceUsageSample CollectStats(const isolation::BackendHandle&) override {
        core::ResourceUsageSample sample;
        sample.taken_at = std::chrono::steady_clock::now();
        sample.memory_bytes = script_.memory_bytes;
        sample.cpu_percent = script_.cpu_percent;
        sample.process_count = 1;
        sample.valid = true;
        return sample;
    }

    std::optional<int> Poll(const isolation::BackendHandle&) override {
        const int poll = ++counters_->polls;
        if (script_.poll_throws && !(script_.exit_on_poll && poll >= *script_.exit_on_poll)) {
            throw std::runtime_error("scripted poll failure");
        }
        if (poll == 1 && script_.first_poll_delay.count() > 0) {
            std::this_thread::sleep_for(script_.first_poll_delay);
        }
        if (script_.exit_on_poll && poll >= *script_.exit_on_poll) {
            return script_.exit_code;
        }
        return std::nullopt;
    }

    void EnforceKill(const isolation::BackendHandle&) noexcept override { ++counters_->kill; }
    void Teardown(const isolation::BackendHandle&) noexcept override { ++counters_->teardown; }
    std::string Name() const override { return "fake"; }

private:
    BackendScript script_;
    std::shared_ptr<BackendCounters> counters_;
};

inline isolation::BackendFactory MakeFakeFactory(BackendScript script,
                                                 std::shared_ptr<BackendCounters> counters) {
    return [script, counters](const core::ExecutionRequest&) {
        return std::make_unique<FakeBackend>(script, counters);
    };
}

/// Emits prepared events on given poll numbers (1-based)
class ScriptedCollector : public monitors::EventCollector {
public:
    explicit ScriptedCollector(std::map<int, std::vector<monitors::CollectedEvent>> script)
        : script_(std::move(script)) {}

    std::vector<monitors::CollectedEvent> Poll(const monitors::ObservationContext& context) override {
        auto it = script_.find(++polls_);
        if (it == script_.end()) {
            return {};
        }
        auto events = it->second;
        for (auto& event : events) {
            if (event.timestamp == std::chrono::system_clock::time_point{}) {
                event.timestamp = context.now;
            }
        }
        return events;
    }

    std::string Name() const override { return "scripted"; }

private:
    std::map<int, std::vector<monitors::CollectedEvent>> script_;
    int polls_{0};
};

inline monitors::CollectedEvent MakeCollected(core::EventCategory category,
                                              core::EventAttributes attributes) {
    monitors::CollectedEvent event;
    event.category = category;
    event.attributes = std::move(attributes);
    return event;
}

inline monitors::CollectorFactory MakeScriptedCollectors(
    std::map<int, std::vector<monitors::CollectedEvent>> script) {
    return [script]() {
        std::vector<std::unique_ptr<monitors::EventCollector>> collectors;
        collectors.push_back(std::make_unique<ScriptedCollector>(script));
        return collectors;
    };
}

inline core::MonitoredEvent MakeEvent(core::EventCategory category, core::EventAttributes attributes) {
    core::MonitoredEvent event;
    event.session_id = "test-session";
    event.category = category;
    event.attributes = std::move(attributes);
    return event;
}

} // namespace fakes
} // namespace saferun
