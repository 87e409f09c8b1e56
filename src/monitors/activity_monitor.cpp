/**
 * @file activity_monitor.cpp
 * @brief Implementation of the ordered event stream
 *
 * @date 2025
 */

#include "saferun/monitors/activity_monitor.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace saferun {
namespace monitors {

ActivityMonitor::ActivityMonitor(std::vector<std::unique_ptr<EventCollector>> collectors)
    : collectors_(std::move(collectors)) {
}

void ActivityMonitor::Start(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) {
        throw std::logic_error("Activity monitor cannot be restarted");
    }
    started_ = true;
    session_id_ = session_id;

    spdlog::debug("Activity monitor started for {} with {} collectors",
                  session_id, collectors_.size());
}

std::size_t ActivityMonitor::Collect(const ObservationContext& context) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_ || finished_) {
        throw std::logic_error("Activity monitor is not collecting");
    }

    std::size_t buffered = 0;
    for (std::size_t index = 0; index < collectors_.size(); ++index) {
        std::vector<CollectedEvent> events;
        try {
            events = collectors_[index]->Poll(context);
        } catch (const std::exception& e) {
            spdlog::warn("⚠ Collector {} failed: {}", collectors_[index]->Name(), e.what());
            continue;
        }

        for (auto& event : events) {
            pending_.insert(Pending{event.timestamp, event.category, index, arrivals_++,
                                    std::move(event.attributes)});
            ++buffered;
        }
    }
    return buffered;
}

std::optional<core::MonitoredEvent> ActivityMonitor::NextEvent() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.empty()) {
        return std::nullopt;
    }

    auto node = pending_.extract(pending_.begin());
    Pending& next = node.value();

    // Late arrivals are delivered at the watermark
    auto timestamp = next.timestamp;
    if (watermark_ && timestamp < *watermark_) {
        timestamp = *watermark_;
    }
    watermark_ = timestamp;

    core::MonitoredEvent event;
    event.session_id = session_id_;
    event.sequence = next_sequence_++;
    event.timestamp = timestamp;
    event.category = next.category;
    event.attributes = std::move(next.attributes);
    return event;
}

void ActivityMonitor::Finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_ = true;
}

bool ActivityMonitor::IsExhausted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_ && pending_.empty();
}

bool ActivityMonitor::IsStarted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
}

std::uint64_t ActivityMonitor::Delivered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_sequence_;
}

} // namespace monitors
} // namespace saferun
