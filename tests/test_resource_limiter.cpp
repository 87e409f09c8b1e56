/**
 * @file test_resource_limiter.cpp
 * @brief Grace window, hard breaches and timeouts on a fake clock
 *
 * @date 2025
 */

#include "saferun/core/resource_limiter.hpp"

#include <gtest/gtest.h>

using namespace saferun::core;
using namespace std::chrono_literals;

namespace {

ResourceLimits SmallLimits() {
    ResourceLimits limits;
    limits.memory_bytes = 1000;
    limits.cpu_percent = 50.0;
    limits.execution_timeout = std::chrono::seconds(10);
    return limits;
}

ResourceUsageSample Sample(std::uint64_t memory, double cpu) {
    ResourceUsageSample sample;
    sample.memory_bytes = memory;
    sample.cpu_percent = cpu;
    sample.valid = true;
    return sample;
}

} // anonymous namespace

class ResourceLimiterTest : public ::testing::Test {
protected:
    void SetUp() override {
        t0 = ResourceLimiter::Clock::now();
        limiter.Start(t0);
    }

    ResourceLimiter limiter{SmallLimits(), 500ms};
    ResourceLimiter::Clock::time_point t0;
};

TEST_F(ResourceLimiterTest, OverrunWithinGraceIsTolerated) {
    EXPECT_FALSE(limiter.Evaluate(Sample(2000, 1.0), t0));
    EXPECT_FALSE(limiter.Evaluate(Sample(2000, 1.0), t0 + 500ms));
    EXPECT_EQ(limiter.PeakMemoryBytes(), 2000u);
}

TEST_F(ResourceLimiterTest, ContinuousOverrunBeyondGraceBreaches) {
    EXPECT_FALSE(limiter.Evaluate(Sample(2000, 1.0), t0));
    auto breach = limiter.Evaluate(Sample(2000, 1.0), t0 + 501ms);
    ASSERT_TRUE(breach);
    EXPECT_EQ(breach->code, ErrorCode::HARD_RESOURCE_BREACH);
}

TEST_F(ResourceLimiterTest, DipBelowLimitResetsGrace) {
    EXPECT_FALSE(limiter.Evaluate(Sample(1000, 80.0), t0));
    EXPECT_FALSE(limiter.Evaluate(Sample(1000, 10.0), t0 + 400ms));
    EXPECT_FALSE(limiter.Evaluate(Sample(1000, 80.0), t0 + 600ms));
    EXPECT_FALSE(limiter.Evaluate(Sample(1000, 80.0), t0 + 1000ms));
    EXPECT_TRUE(limiter.Evaluate(Sample(1000, 80.0), t0 + 1200ms));
    EXPECT_DOUBLE_EQ(limiter.PeakCpuPercent(), 80.0);
}

TEST_F(ResourceLimiterTest, InvalidSamplesOnlyAdvanceTheClock) {
    ResourceUsageSample invalid;
    invalid.memory_bytes = 1u << 30;
    EXPECT_FALSE(limiter.Evaluate(invalid, t0 + 5s));
    EXPECT_EQ(limiter.PeakMemoryBytes(), 0u);

    auto breach = limiter.Evaluate(invalid, t0 + 10s);
    ASSERT_TRUE(breach);
    EXPECT_EQ(breach->code, ErrorCode::TIMEOUT_EXCEEDED);
}

TEST_F(ResourceLimiterTest, HardBreachWinsOverTimeout) {
    EXPECT_FALSE(limiter.Evaluate(Sample(5000, 1.0), t0 + 9s));
    auto breach = limiter.Evaluate(Sample(5000, 1.0), t0 + 11s);
    ASSERT_TRUE(breach);
    EXPECT_EQ(breach->code, ErrorCode::HARD_RESOURCE_BREACH);
}

TEST_F(ResourceLimiterTest, DeadlineCountsFromStart) {
    EXPECT_EQ(limiter.Deadline(), t0 + 10s);
    EXPECT_FALSE(limiter.CheckTimeout(t0 + 9999ms));
    EXPECT_TRUE(limiter.CheckTimeout(t0 + 10s));
}

TEST(ResourceLimiterUnstartedTest, NeverTimesOutBeforeStart) {
    ResourceLimiter limiter(SmallLimits(), 0ms);
    EXPECT_FALSE(limiter.CheckTimeout(ResourceLimiter::Clock::now() + std::chrono::hours(1)));
}
