/**
 * @file signature_set.cpp
 * @brief Loading, validation and matching of threat signatures
 *
 * @date 2025
 */

#include "saferun/analyzers/signature_set.hpp"
#include "saferun/core/errors.hpp"
#include "saferun/core/sandbox_config.hpp"
#include "saferun/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <set>

using json = nlohmann::json;

namespace saferun {
namespace analyzers {

namespace {

using core::ConfigError;

// Escapes regex metacharacters so a literal indicator can join an alternation
std::string EscapeLiteral(const std::string& literal) {
    static const std::string kSpecial = R"(\^$.|?*+()[]{})";
    std::string escaped;
    for (char c : literal) {
        if (kSpecial.find(c) != std::string::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

// Named severities map to the classic SafeRun weights
std::optional<double> SeverityWeight(const std::string& severity) {
    const std::string lower = utils::StringUtils::ToLower(severity);
    if (lower == "critical") return 1.0;
    if (lower == "high") return 0.4;
    if (lower == "medium") return 0.2;
    if (lower == "low") return 0.1;
    return std::nullopt;
}

std::optional<core::EventCategory> ParseCategory(const std::string& name) {
    const std::string lower = utils::StringUtils::ToLower(name);
    for (auto category : {core::EventCategory::PROCESS_OP, core::EventCategory::FILE_OP,
                          core::EventCategory::NETWORK_OP, core::EventCategory::REGISTRY_OP,
                          core::EventCategory::RESOURCE_USAGE}) {
        if (core::ToString(category) == lower) {
            return category;
        }
    }
    return std::nullopt;
}

Signature ParseSignature(const json& entry) {
    if (!entry.is_object()) {
        throw ConfigError("Signature entry must be an object");
    }

    Signature signature;
    try {
        signature.id = entry.at("id").get<std::string>();
        signature.name = entry.value("name", signature.id);

        if (entry.contains("pattern")) {
            signature.pattern = entry["pattern"].get<std::string>();
        } else if (entry.contains("indicators")) {
            std::vector<std::string> alternatives;
            for (const auto& indicator : entry["indicators"].get<std::vector<std::string>>()) {
                alternatives.push_back(EscapeLiteral(indicator));
            }
            signature.pattern = utils::StringUtils::Join(alternatives, "|");
        } else {
            throw ConfigError("Signature " + signature.id + " has no pattern");
        }

        if (entry.contains("severity_weight")) {
            signature.severity_weight = entry["severity_weight"].get<double>();
        } else if (entry.contains("severity")) {
            auto weight = SeverityWeight(entry["severity"].get<std::string>());
            if (!weight) {
                throw ConfigError("Signature " + signature.id + " has unknown severity");
            }
            signature.severity_weight = *weight;
        }

        signature.conclusive = entry.value("conclusive", false);

        if (entry.contains("category") && !entry["category"].is_null()) {
            auto name = entry["category"].get<std::string>();
            signature.category = ParseCategory(name);
            if (!signature.category) {
                throw ConfigError("Signature " + signature.id + " has unknown category: " + name);
            }
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Malformed signature: ") + e.what());
    }

    return signature;
}

std::vector<Signature> ParseSignatures(const json& document) {
    const json* entries = &document;
    if (document.is_object() && document.contains("signatures")) {
        entries = &document["signatures"];
    }
    if (!entries->is_array()) {
        throw ConfigError("Signatures must be a JSON array");
    }

    std::vector<Signature> signatures;
    for (const auto& entry : *entries) {
        signatures.push_back(ParseSignature(entry));
    }
    return signatures;
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTION AND VALIDATION
// ============================================================================

SignatureSet::SignatureSet(std::vector<Signature> signatures)
    : signatures_(std::move(signatures)) {
    std::set<std::string> ids;

    for (auto& signature : signatures_) {
        if (signature.id.empty()) {
            throw ConfigError("Signature id must not be empty");
        }
        if (!ids.insert(signature.id).second) {
            throw ConfigError("Duplicate signature id: " + signature.id);
        }
        if (!(signature.severity_weight > 0.0 && signature.severity_weight <= 1.0)) {
            throw ConfigError("Signature " + signature.id + " weight must be in (0, 1]");
        }
        if (signature.pattern.empty()) {
            throw ConfigError("Signature " + signature.id + " has an empty pattern");
        }

        try {
            signature.compiled = std::regex(signature.pattern,
                                            std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            throw ConfigError("Signature " + signature.id + " has an invalid pattern: " + e.what());
        }
    }
}

std::shared_ptr<const SignatureSet> SignatureSet::Defaults() {
    std::vector<Signature> signatures;

    Signature system_files;
    system_files.id = "SIG-001";
    system_files.name = "System File Access";
    system_files.pattern = R"(/etc/passwd|/etc/shadow|C:\\Windows\\System32\\config)";
    system_files.severity_weight = 0.4;
    signatures.push_back(system_files);

    Signature autorun;
    autorun.id = "SIG-002";
    autorun.name = "Registry Modification";
    autorun.pattern = R"((HKEY_LOCAL_MACHINE|HKLM|HKEY_CURRENT_USER|HKCU)\\Software\\Microsoft\\Windows\\CurrentVersion\\Run)";
    autorun.severity_weight = 0.2;
    autorun.category = core::EventCategory::REGISTRY_OP;
    signatures.push_back(autorun);

    Signature endpoint;
    endpoint.id = "SIG-003";
    endpoint.name = "Suspicious Network Connection";
    endpoint.pattern = R"(:(4444|1337|31337|8080)\b|malicious\.example\.com)";
    endpoint.severity_weight = 0.4;
    endpoint.category = core::EventCategory::NETWORK_OP;
    signatures.push_back(endpoint);

    return std::make_shared<const SignatureSet>(std::move(signatures));
}

std::shared_ptr<const SignatureSet> SignatureSet::FromJson(const json& document) {
    return std::make_shared<const SignatureSet>(ParseSignatures(document));
}

std::shared_ptr<const SignatureSet> SignatureSet::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open signatures file: " + path.string());
    }

    json document;
    try {
        file >> document;
    } catch (const json::parse_error& e) {
        throw ConfigError("Malformed signatures file " + path.string() + ": " + e.what());
    }

    auto set = FromJson(document);
    spdlog::info("Loaded {} signatures from {}", set->Size(), path.string());
    return set;
}

std::shared_ptr<const SignatureSet> SignatureSet::FromConfig(const core::SandboxConfig& config) {
    const bool has_inline = config.inline_signatures.is_array();
    const bool has_file = !config.signatures_file.empty();

    if (!has_inline && !has_file) {
        return Defaults();
    }

    std::vector<Signature> signatures;
    if (has_inline) {
        signatures = ParseSignatures(config.inline_signatures);
    }
    if (has_file) {
        auto from_file = LoadFromFile(config.signatures_file);
        signatures.insert(signatures.end(),
                          from_file->Signatures().begin(), from_file->Signatures().end());
    }
    return std::make_shared<const SignatureSet>(std::move(signatures));
}

// ============================================================================
// MATCHING
// ============================================================================

bool SignatureSet::Matches(const Signature& signature, const core::MonitoredEvent& event) {
    if (signature.category && *signature.category != event.category) {
        return false;
    }
    for (const auto& [key, value] : event.attributes) {
        if (std::regex_search(value, signature.compiled)) {
            return true;
        }
    }
    return false;
}

const Signature* SignatureSet::Find(const std::string& id) const {
    for (const auto& signature : signatures_) {
        if (signature.id == id) {
            return &signature;
        }
    }
    return nullptr;
}

} // namespace analyzers
} // namespace saferun
