/**
 * @file resource_limiter.hpp
 * @brief Periodic enforcement of memory, CPU and wall-clock limits
 *
 * @date 2025
 */

#pragma once

#include "saferun/core/errors.hpp"
#include "saferun/core/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace saferun {
namespace core {

/**
 * @struct LimitBreach
 * @brief A limit violation that ends the session
 */
struct LimitBreach {
    ErrorCode code{ErrorCode::HARD_RESOURCE_BREACH};  ///< HARD_RESOURCE_BREACH or TIMEOUT_EXCEEDED
    std::string detail;                               ///< Human-readable cause
};

/**
 * @class ResourceLimiter
 * @brief Evaluates usage samples against ResourceLimits
 *
 * Memory or CPU above the limit is tolerated for a grace window; a
 * continuous overrun beyond it is a hard breach. Elapsed time at or beyond
 * the execution timeout is a timeout. When both happen in the same
 * evaluation the hard breach is reported.
 *
 * Time is passed in by the caller so the limiter can be driven by a fake
 * clock.
 *
 * **Thread Safety**: NOT thread-safe; owned by the observer loop.
 */
class ResourceLimiter {
public:
    using Clock = std::chrono::steady_clock;

    ResourceLimiter(const ResourceLimits& limits, std::chrono::milliseconds grace_window);

    /// Mark the launch instant; the timeout counts from here
    void Start(Clock::time_point now);

    /**
     * @brief Evaluate one sample
     * @param sample Latest usage; invalid samples only update the clock
     * @param now Evaluation time
     * @return The breach, if any
     */
    std::optional<LimitBreach> Evaluate(const ResourceUsageSample& sample, Clock::time_point now);

    /// Timeout check alone
    std::optional<LimitBreach> CheckTimeout(Clock::time_point now) const;

    std::uint64_t PeakMemoryBytes() const { return peak_memory_bytes_; }
    double PeakCpuPercent() const { return peak_cpu_percent_; }

    /// Launch instant plus the execution timeout
    Clock::time_point Deadline() const { return started_at_ + limits_.execution_timeout; }

    const ResourceLimits& Limits() const { return limits_; }

private:
    ResourceLimits limits_;
    std::chrono::milliseconds grace_window_;
    Clock::time_point started_at_;
    bool started_{false};

    std::optional<Clock::time_point> memory_over_since_;
    std::optional<Clock::time_point> cpu_over_since_;

    std::uint64_t peak_memory_bytes_{0};
    double peak_cpu_percent_{0.0};
};

} // namespace core
} // namespace saferun
