/**
 * @file signature_set.hpp
 * @brief Threat signatures matched against monitored event attributes
 *
 * A signature is a case-insensitive regular expression with a severity
 * weight. Signature sets are loaded once per process and shared read-only
 * between sessions.
 *
 * Accepted JSON layout (either a bare array or `{"signatures": [...]}`):
 * @code{.json}
 * [
 *   { "id": "SIG-001", "name": "System File Access",
 *     "pattern": "/etc/passwd", "severity_weight": 0.4, "category": "file_op" },
 *   { "id": "SIG-100", "name": "Known Dropper", "indicators": ["dropper.bin"],
 *     "severity": "critical", "conclusive": true }
 * ]
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "saferun/core/types.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include <filesystem>

namespace saferun {

namespace core {
struct SandboxConfig;
}

namespace analyzers {

/**
 * @struct Signature
 * @brief One detection rule
 */
struct Signature {
    std::string id;                                 ///< Unique identifier ("SIG-001")
    std::string name;                               ///< Human-readable name
    std::string pattern;                            ///< Source regular expression
    double severity_weight{0.1};                    ///< Score contribution in (0, 1]
    bool conclusive{false};                         ///< A match alone makes the verdict CRITICAL
    std::optional<core::EventCategory> category;    ///< Only events of this category are matched
    std::regex compiled;                            ///< Case-insensitive compiled pattern
};

/**
 * @class SignatureSet
 * @brief Immutable, validated collection of signatures
 *
 * **Thread Safety**: Immutable after construction; safe to share.
 */
class SignatureSet {
public:
    /// Validates and compiles (@throws core::ConfigError)
    explicit SignatureSet(std::vector<Signature> signatures);

    /// SIG-001 system file access, SIG-002 autorun registry key, SIG-003 suspicious endpoint
    static std::shared_ptr<const SignatureSet> Defaults();

    /// Parse a JSON array or `{"signatures": [...]}` (@throws core::ConfigError)
    static std::shared_ptr<const SignatureSet> FromJson(const nlohmann::json& document);

    /// Read and parse a JSON file (@throws core::ConfigError)
    static std::shared_ptr<const SignatureSet> LoadFromFile(const std::filesystem::path& path);

    /**
     * @brief Signature set selected by a configuration
     *
     * Inline signatures and the signature file are combined when both are
     * present; the built-in defaults apply when neither is.
     */
    static std::shared_ptr<const SignatureSet> FromConfig(const core::SandboxConfig& config);

    /// True when any attribute value of the event matches the signature
    static bool Matches(const Signature& signature, const core::MonitoredEvent& event);

    const std::vector<Signature>& Signatures() const { return signatures_; }
    std::size_t Size() const { return signatures_.size(); }

    /// Lookup by id, nullptr if unknown
    const Signature* Find(const std::string& id) const;

private:
    std::vector<Signature> signatures_;
};

} // namespace analyzers
} // namespace saferun
