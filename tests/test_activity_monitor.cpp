/**
 * @file test_activity_monitor.cpp
 * @brief Ordering and lifecycle of the event stream
 *
 * @date 2025
 */

#include "saferun/monitors/activity_monitor.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace saferun;
using core::EventCategory;
using monitors::ActivityMonitor;
using monitors::CollectedEvent;

namespace {

using Clock = std::chrono::system_clock;

CollectedEvent At(Clock::time_point when, EventCategory category, const std::string& tag) {
    CollectedEvent event;
    event.timestamp = when;
    event.category = category;
    event.attributes["tag"] = tag;
    return event;
}

class ThrowingCollector : public monitors::EventCollector {
public:
    std::vector<CollectedEvent> Poll(const monitors::ObservationContext&) override {
        throw std::runtime_error("procfs vanished");
    }
    std::string Name() const override { return "throwing"; }
};

std::vector<std::string> DrainTags(ActivityMonitor& monitor) {
    std::vector<std::string> tags;
    while (auto event = monitor.NextEvent()) {
        tags.push_back(event->Attribute("tag"));
    }
    return tags;
}

} // anonymous namespace

TEST(ActivityMonitorTest, OrdersByTimestampThenCategoryThenCollector) {
    const auto base = Clock::now();
    std::map<int, std::vector<CollectedEvent>> first;
    first[1] = {At(base + std::chrono::milliseconds(5), EventCategory::FILE_OP, "late-file"),
                At(base, EventCategory::REGISTRY_OP, "registry"),
                At(base, EventCategory::FILE_OP, "file-a")};
    std::map<int, std::vector<CollectedEvent>> second;
    second[1] = {At(base, EventCategory::FILE_OP, "file-b"),
                 At(base, EventCategory::PROCESS_OP, "process")};

    std::vector<std::unique_ptr<monitors::EventCollector>> collectors;
    collectors.push_back(std::make_unique<fakes::ScriptedCollector>(first));
    collectors.push_back(std::make_unique<fakes::ScriptedCollector>(second));
    ActivityMonitor monitor(std::move(collectors));

    monitor.Start("session-1");
    monitors::ObservationContext context;
    context.now = base;
    EXPECT_EQ(monitor.Collect(context), 5u);

    EXPECT_EQ(DrainTags(monitor),
              (std::vector<std::string>{"process", "file-a", "file-b", "registry", "late-file"}));
}

TEST(ActivityMonitorTest, AssignsSessionAndConsecutiveSequence) {
    std::map<int, std::vector<CollectedEvent>> script;
    script[1] = {At(Clock::now(), EventCategory::FILE_OP, "a")};
    script[2] = {At(Clock::now(), EventCategory::FILE_OP, "b")};

    std::vector<std::unique_ptr<monitors::EventCollector>> collectors;
    collectors.push_back(std::make_unique<fakes::ScriptedCollector>(script));
    ActivityMonitor monitor(std::move(collectors));
    monitor.Start("session-42");

    monitors::ObservationContext context;
    context.now = Clock::now();
    monitor.Collect(context);
    auto first = monitor.NextEvent();
    monitor.Collect(context);
    auto second = monitor.NextEvent();

    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->session_id, "session-42");
    EXPECT_EQ(first->sequence, 0u);
    EXPECT_EQ(second->sequence, 1u);
    EXPECT_EQ(monitor.Delivered(), 2u);
}

TEST(ActivityMonitorTest, LateArrivalIsDeliveredAtWatermark) {
    const auto base = Clock::now();
    std::map<int, std::vector<CollectedEvent>> script;
    script[1] = {At(base + std::chrono::seconds(2), EventCategory::PROCESS_OP, "newer")};
    script[2] = {At(base, EventCategory::PROCESS_OP, "older")};

    std::vector<std::unique_ptr<monitors::EventCollector>> collectors;
    collectors.push_back(std::make_unique<fakes::ScriptedCollector>(script));
    ActivityMonitor monitor(std::move(collectors));
    monitor.Start("s");

    monitors::ObservationContext context;
    context.now = base;
    monitor.Collect(context);
    auto newer = monitor.NextEvent();
    monitor.Collect(context);
    auto older = monitor.NextEvent();

    ASSERT_TRUE(newer && older);
    EXPECT_EQ(older->Attribute("tag"), "older");
    EXPECT_EQ(older->timestamp, newer->timestamp);
}

TEST(ActivityMonitorTest, FailingCollectorIsSkipped) {
    std::map<int, std::vector<CollectedEvent>> script;
    script[1] = {At(Clock::now(), EventCategory::FILE_OP, "kept")};

    std::vector<std::unique_ptr<monitors::EventCollector>> collectors;
    collectors.push_back(std::make_unique<ThrowingCollector>());
    collectors.push_back(std::make_unique<fakes::ScriptedCollector>(script));
    ActivityMonitor monitor(std::move(collectors));
    monitor.Start("s");

    monitors::ObservationContext context;
    context.now = Clock::now();
    EXPECT_EQ(monitor.Collect(context), 1u);
    EXPECT_EQ(DrainTags(monitor), std::vector<std::string>{"kept"});
}

TEST(ActivityMonitorTest, FinishedStreamDrainsAndIsNotRestartable) {
    std::map<int, std::vector<CollectedEvent>> script;
    script[1] = {At(Clock::now(), EventCategory::FILE_OP, "a")};

    std::vector<std::unique_ptr<monitors::EventCollector>> collectors;
    collectors.push_back(std::make_unique<fakes::ScriptedCollector>(script));
    ActivityMonitor monitor(std::move(collectors));

    monitors::ObservationContext context;
    context.now = Clock::now();
    EXPECT_THROW(monitor.Collect(context), std::logic_error);

    monitor.Start("s");
    monitor.Collect(context);
    monitor.Finish();

    EXPECT_FALSE(monitor.IsExhausted());
    EXPECT_TRUE(monitor.NextEvent().has_value());
    EXPECT_TRUE(monitor.IsExhausted());
    EXPECT_FALSE(monitor.NextEvent().has_value());

    EXPECT_THROW(monitor.Collect(context), std::logic_error);
    EXPECT_THROW(monitor.Start("again"), std::logic_error);
}
