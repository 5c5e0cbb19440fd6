/**
 * @file Promotion.hpp
 * @brief Requests and results for promoting discovered devices into inventory.
 */

#pragma once

#include "core/types/Errors.hpp"
#include "core/types/Inventory.hpp"

#include <string>
#include <vector>

namespace rackscan::core {

/**
 * @brief Operator-supplied details for a promotion.
 *
 * Only name is required. Empty fields fall back to discovered evidence
 * where there is any.
 */
struct PromoteDeviceRequest {
    std::string deviceId;     ///< Id for the new device (generated when empty)
    std::string name;         ///< Device name (required)
    std::string description;  ///< Description
    std::string makeModel;    ///< Hardware make and model
    std::string os;           ///< Operating system (defaults to the discovered OS guess)
    std::string datacenterId; ///< Datacenter (auto-assigned when exactly one exists)
    std::string username;     ///< Login user
    std::string location;     ///< Rack or room location
    std::vector<std::string> tags;    ///< Tags for the new device
    std::vector<std::string> domains; ///< DNS domains for the new device
};

/**
 * @brief Why one discovered device in a bulk promotion was not promoted.
 */
struct PromotionFailure {
    std::string discoveredId; ///< Discovered device that failed
    ErrorCode code{ErrorCode::Storage}; ///< Error category
    std::string message;      ///< Human-readable reason
};

/**
 * @brief Outcome of a bulk promotion.
 */
struct BulkPromotionResult {
    std::vector<Device> promoted;          ///< Devices created, in request order
    std::vector<PromotionFailure> failures; ///< One entry per failed id
};

} // namespace rackscan::core
