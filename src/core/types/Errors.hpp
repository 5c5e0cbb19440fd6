/**
 * @file Errors.hpp
 * @brief Error kinds raised by the discovery engine and its stores.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace rackscan::core {

/**
 * @brief Category of a discovery failure.
 */
enum class ErrorCode : int {
    NotFound = 0,            ///< Referenced record does not exist
    AlreadyPromoted = 1,     ///< Discovered device was promoted before
    InvalidRequest = 2,      ///< Caller supplied invalid or incomplete input
    InvalidSubnet = 3,       ///< Network subnet cannot be parsed or enumerated
    NetworkNotFound = 4,     ///< Network referenced by a scan does not exist
    ConstraintViolation = 5, ///< Referential or uniqueness constraint failed
    Storage = 6              ///< Underlying persistence failure
};

/**
 * @brief Exception carrying a discovery ErrorCode.
 */
class DiscoveryError : public std::runtime_error {
public:
    DiscoveryError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/**
 * @brief Converts an ErrorCode to its stable string name.
 * @param code The error code.
 * @return Name such as "not_found" or "already_promoted".
 */
std::string errorCodeToString(ErrorCode code);

} // namespace rackscan::core
