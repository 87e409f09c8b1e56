/**
 * @file activity_monitor.hpp
 * @brief Ordered, append-only event stream of one sandbox session
 *
 * The monitor pulls raw observations from a set of polymorphic collectors
 * and delivers them one at a time as MonitoredEvents with session id and
 * sequence number assigned at delivery.
 *
 * @date 2025
 */

#pragma once

#include "saferun/core/types.hpp"
#include "saferun/isolation/isolation_backend.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace saferun {
namespace monitors {

/**
 * @struct ObservationContext
 * @brief What collectors may look at during one observation window
 */
struct ObservationContext {
    const isolation::BackendHandle* handle{nullptr};          ///< Scope and limits of the session
    std::optional<core::ResourceUsageSample> sample;          ///< Latest backend sample, if any
    std::chrono::system_clock::time_point now;                ///< Window timestamp
};

/**
 * @struct CollectedEvent
 * @brief Raw observation before sequencing
 */
struct CollectedEvent {
    std::chrono::system_clock::time_point timestamp;
    core::EventCategory category{core::EventCategory::PROCESS_OP};
    core::EventAttributes attributes;
};

/**
 * @class EventCollector
 * @brief One source of behavioral observations
 */
class EventCollector {
public:
    virtual ~EventCollector() = default;

    /// Observations made since the previous poll
    virtual std::vector<CollectedEvent> Poll(const ObservationContext& context) = 0;

    virtual std::string Name() const = 0;
};

/// Builds a fresh collector set for one session
using CollectorFactory = std::function<std::vector<std::unique_ptr<EventCollector>>()>;

/**
 * @class ActivityMonitor
 * @brief Merges collector output into one ordered, finite stream
 *
 * **Ordering**: events leave in non-decreasing timestamp order; ties are
 * broken by category (PROCESS_OP, FILE_OP, NETWORK_OP, REGISTRY_OP,
 * RESOURCE_USAGE), then collector order, then arrival order. An event that
 * arrives with a timestamp older than the last delivered one is delivered
 * with the last delivered timestamp.
 *
 * **Lifecycle**: Start → (Collect, NextEvent*)* → Finish → NextEvent* until
 * exhausted. A monitor cannot be restarted.
 *
 * **Thread Safety**: Methods are serialized by an internal mutex.
 */
class ActivityMonitor {
public:
    explicit ActivityMonitor(std::vector<std::unique_ptr<EventCollector>> collectors);
    ~ActivityMonitor() = default;

    ActivityMonitor(const ActivityMonitor&) = delete;
    ActivityMonitor& operator=(const ActivityMonitor&) = delete;

    /**
     * @brief Begin the stream for a session
     * @throws std::logic_error if the monitor was already started
     */
    void Start(const std::string& session_id);

    /**
     * @brief Poll every collector once and buffer the results
     *
     * A collector that throws is logged and skipped for this window.
     *
     * @return Number of events buffered
     * @throws std::logic_error if not started or already finished
     */
    std::size_t Collect(const ObservationContext& context);

    /// Next event in delivery order, std::nullopt when nothing is buffered
    std::optional<core::MonitoredEvent> NextEvent();

    /// Stop accepting observations; buffered events remain deliverable
    void Finish();

    /// Finished and fully drained
    bool IsExhausted() const;

    bool IsStarted() const;

    /// Number of events delivered so far
    std::uint64_t Delivered() const;

    std::size_t CollectorCount() const { return collectors_.size(); }

private:
    struct Pending {
        std::chrono::system_clock::time_point timestamp;
        core::EventCategory category;
        std::size_t collector_index;
        std::uint64_t arrival;
        core::EventAttributes attributes;

        bool operator<(const Pending& other) const {
            return std::tie(timestamp, category, collector_index, arrival) <
                   std::tie(other.timestamp, other.category, other.collector_index, other.arrival);
        }
    };

    std::vector<std::unique_ptr<EventCollector>> collectors_;

    mutable std::mutex mutex_;
    std::string session_id_;
    bool started_{false};
    bool finished_{false};

    std::multiset<Pending> pending_;
    std::uint64_t arrivals_{0};
    std::uint64_t next_sequence_{0};
    std::optional<std::chrono::system_clock::time_point> watermark_;
};

} // namespace monitors
} // namespace saferun
