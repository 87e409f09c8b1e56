/**
 * @file threat_detector.hpp
 * @brief Scoring engine turning monitored events into a threat verdict
 *
 * The detector is stateless: `Observe` folds one event into a running
 * score and returns the new score, so the verdict is a pure function of
 * the event sequence, the signature set and the weight configuration.
 *
 * @date 2025
 */

#pragma once

#include "saferun/analyzers/signature_set.hpp"
#include "saferun/core/types.hpp"

#include <map>
#include <memory>
#include <set>

namespace saferun {

namespace core {
struct SandboxConfig;
}

namespace analyzers {

/**
 * @class ThreatDetector
 * @brief Signature and behavior heuristics with threshold classification
 *
 * Scoring rules:
 * - a signature adds its severity weight the first time any event matches it
 * - a behavior kind adds its configured weight the first time it is observed
 * - the aggregate is clamped to [0, 1] and never decreases
 *
 * **Thread Safety**: All methods are const; safe to share.
 *
 * **Usage Example**:
 * @code
 * ThreatDetector detector(SignatureSet::Defaults(), SandboxConfig::Defaults());
 * core::ThreatScore score;
 * for (const auto& event : events) {
 *     score = detector.Observe(event, score);
 * }
 * auto level = detector.Classify(score);
 * @endcode
 */
class ThreatDetector {
public:
    /**
     * @struct Config
     * @brief Detection tuning
     */
    struct Config {
        double suspicious_threshold{0.3};                   ///< MEDIUM from here
        double malicious_threshold{0.7};                    ///< HIGH from here
        std::map<core::BehaviorKind, double> weights;       ///< Enabled behaviors and weights
        double high_cpu_percent{90.0};                      ///< HIGH_RESOURCE_USAGE cpu trigger
        double high_memory_ratio{0.9};                      ///< HIGH_RESOURCE_USAGE memory trigger
    };

    ThreatDetector(std::shared_ptr<const SignatureSet> signatures, const Config& config);

    /// Thresholds and enabled behavior weights taken from the sandbox configuration
    ThreatDetector(std::shared_ptr<const SignatureSet> signatures,
                   const core::SandboxConfig& config);

    /**
     * @brief Fold one event into the running score
     *
     * Malformed attribute values contribute nothing; this never throws.
     */
    core::ThreatScore Observe(const core::MonitoredEvent& event,
                              const core::ThreatScore& running) const;

    /// Categorical verdict; boundaries are closed below
    core::ThreatLevel Classify(const core::ThreatScore& score) const;

    /// Behavior kinds the heuristics recognize in one event (enabled or not)
    std::set<core::BehaviorKind> DetectBehaviors(const core::MonitoredEvent& event) const;

    /// Lower bound of LOW: 0.1, or suspicious/2 when suspicious <= 0.1
    double MinorBoundary() const;

    /// Lower bound of CRITICAL by aggregate: max(0.9, malicious)
    double CriticalBoundary() const;

    const SignatureSet& Signatures() const { return *signatures_; }

private:
    static Config ConfigFrom(const core::SandboxConfig& config);

    bool IsFileEncryption(const core::MonitoredEvent& event) const;
    bool IsPersistence(const core::MonitoredEvent& event) const;
    bool IsProcessInjection(const core::MonitoredEvent& event) const;
    bool IsNetworkScanning(const core::MonitoredEvent& event) const;
    bool IsHighResourceUsage(const core::MonitoredEvent& event) const;

    std::shared_ptr<const SignatureSet> signatures_;
    Config config_;
};

} // namespace analyzers
} // namespace saferun
