#pragma once

#include "core/types/Inventory.hpp"
#include "core/types/Promotion.hpp"
#include "infrastructure/database/DatacenterRepository.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/DeviceRepository.hpp"
#include "infrastructure/database/DiscoveredDeviceRepository.hpp"

#include <memory>
#include <string>
#include <vector>

namespace rackscan::infra {

/**
 * @brief Converts discovered devices into managed inventory devices.
 *
 * Each promotion creates the device (with one "discovered" address taken
 * from the discovered IP) and marks the discovered record as promoted in a
 * single transaction. Either both changes are visible or neither is.
 */
class DevicePromoter {
public:
    /**
     * @brief Constructs a DevicePromoter with the given database.
     * @param db Shared pointer to the Database instance.
     */
    explicit DevicePromoter(std::shared_ptr<Database> db);

    /**
     * @brief Promotes one discovered device.
     *
     * When the request names no datacenter and exactly one datacenter exists,
     * that datacenter is used. An empty request OS falls back to the
     * discovered OS guess.
     *
     * @param discoveredId Id of the discovered device.
     * @param request Operator-supplied device details.
     * @return The created device.
     * @throws core::DiscoveryError with InvalidRequest (empty name), NotFound,
     *         AlreadyPromoted, ConstraintViolation (unknown datacenter or
     *         network, duplicate id, tag or domain) or Storage.
     */
    core::Device promote(const std::string& discoveredId, const core::PromoteDeviceRequest& request);

    /**
     * @brief Promotes several discovered devices independently.
     *
     * A failure for one id is recorded and does not affect the others.
     * Ids without a matching request are promoted as "device-<id>".
     *
     * @param discoveredIds Ids to promote.
     * @param requests Requests matched to ids by position.
     * @return Created devices and per-id failures.
     */
    core::BulkPromotionResult bulkPromote(const std::vector<std::string>& discoveredIds,
                                          const std::vector<core::PromoteDeviceRequest>& requests);

private:
    std::string resolveDatacenter(const std::string& requested);

    std::shared_ptr<Database> db_;
    DatacenterRepository datacenters_;
    DeviceRepository devices_;
    DiscoveredDeviceRepository discoveredDevices_;
};

} // namespace rackscan::infra
