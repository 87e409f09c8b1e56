/**
 * @file errors.hpp
 * @brief Error taxonomy of the sandbox engine
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace saferun {
namespace core {

/**
 * @enum ErrorCode
 * @brief Why a session left the normal path
 *
 * The first three mean the sandbox itself could not be established
 * (terminal state FAILED). TIMEOUT_EXCEEDED maps to TIMED_OUT; the rest
 * map to BLOCKED.
 */
enum class ErrorCode {
    BACKEND_UNAVAILABLE,
    RESOURCE_ALLOCATION_FAILED,
    LAUNCH_FAILED,
    TIMEOUT_EXCEEDED,
    BLACKLISTED_OPERATION_DETECTED,
    HARD_RESOURCE_BREACH,
    CANCELLED,
    INTERNAL_ERROR
};

std::string ToString(ErrorCode code);

/**
 * @class SandboxError
 * @brief Exception raised by isolation backends and the orchestrator
 */
class SandboxError : public std::runtime_error {
public:
    SandboxError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/**
 * @class ConfigError
 * @brief Invalid configuration or signature data, raised at load time
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace core
} // namespace saferun
