/**
 * @file resource_limiter.cpp
 * @brief Implementation of limit evaluation with a grace window
 *
 * @date 2025
 */

#include "saferun/core/resource_limiter.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace saferun {
namespace core {

namespace {

constexpr double kBytesPerMiB = 1024.0 * 1024.0;

// Tracks how long a metric has been over its limit; true once past the grace window
bool OverrunExceeded(bool over,
                     std::optional<ResourceLimiter::Clock::time_point>& over_since,
                     ResourceLimiter::Clock::time_point now,
                     std::chrono::milliseconds grace) {
    if (!over) {
        over_since.reset();
        return false;
    }
    if (!over_since) {
        over_since = now;
    }
    return now - *over_since > grace;
}

} // anonymous namespace

ResourceLimiter::ResourceLimiter(const ResourceLimits& limits, std::chrono::milliseconds grace_window)
    : limits_(limits), grace_window_(grace_window) {
}

void ResourceLimiter::Start(Clock::time_point now) {
    started_at_ = now;
    started_ = true;
    memory_over_since_.reset();
    cpu_over_since_.reset();

    spdlog::debug("Resource limiter armed: {:.0f} MB, {:.1f}% CPU, {}s timeout, grace {} ms",
                  limits_.memory_bytes / kBytesPerMiB, limits_.cpu_percent,
                  limits_.execution_timeout.count(), grace_window_.count());
}

std::optional<LimitBreach> ResourceLimiter::Evaluate(const ResourceUsageSample& sample,
                                                     Clock::time_point now) {
    if (sample.valid) {
        peak_memory_bytes_ = std::max(peak_memory_bytes_, sample.memory_bytes);
        peak_cpu_percent_ = std::max(peak_cpu_percent_, sample.cpu_percent);

        if (OverrunExceeded(sample.memory_bytes > limits_.memory_bytes,
                            memory_over_since_, now, grace_window_)) {
            auto detail = fmt::format("memory {:.1f} MB above limit {:.1f} MB for more than {} ms",
                                      sample.memory_bytes / kBytesPerMiB,
                                      limits_.memory_bytes / kBytesPerMiB,
                                      grace_window_.count());
            spdlog::warn("Hard resource breach: {}", detail);
            return LimitBreach{ErrorCode::HARD_RESOURCE_BREACH, detail};
        }

        if (OverrunExceeded(sample.cpu_percent > limits_.cpu_percent,
                            cpu_over_since_, now, grace_window_)) {
            auto detail = fmt::format("CPU {:.1f}% above limit {:.1f}% for more than {} ms",
                                      sample.cpu_percent, limits_.cpu_percent,
                                      grace_window_.count());
            spdlog::warn("Hard resource breach: {}", detail);
            return LimitBreach{ErrorCode::HARD_RESOURCE_BREACH, detail};
        }
    }

    return CheckTimeout(now);
}

std::optional<LimitBreach> ResourceLimiter::CheckTimeout(Clock::time_point now) const {
    if (started_ && now >= Deadline()) {
        return LimitBreach{
            ErrorCode::TIMEOUT_EXCEEDED,
            fmt::format("execution exceeded {}s timeout", limits_.execution_timeout.count())
        };
    }
    return std::nullopt;
}

} // namespace core
} // namespace saferun
