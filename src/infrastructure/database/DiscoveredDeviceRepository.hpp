#pragma once

#include "core/types/DiscoveredDevice.hpp"
#include "infrastructure/database/Database.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rackscan::infra {

/**
 * @brief Repository for discovered device records.
 *
 * Implements the insert-or-update-by-IP merge used by scans, plus listing,
 * promotion marking and retention cleanup. Every write runs in a transaction.
 */
class DiscoveredDeviceRepository {
public:
    /**
     * @brief Constructs a DiscoveredDeviceRepository with the given database.
     * @param db Shared pointer to the Database instance.
     */
    explicit DiscoveredDeviceRepository(std::shared_ptr<Database> db);

    /**
     * @brief Merges a probe result into the record for its IP.
     *
     * A new IP is inserted with first_seen set to now. For a known IP the
     * stored first_seen and id are kept, confidence becomes the maximum of old
     * and new, and an empty MAC address or hostname keeps the stored value.
     * Status, ports, services, OS fields, last_seen and last_scan_id are
     * always overwritten. network_id and promotion fields are never changed
     * by an update.
     *
     * @param device Probe result. lastSeen defaults to now when unset.
     * @return The stored record after the merge.
     */
    core::DiscoveredDevice createOrUpdate(const core::DiscoveredDevice& device);

    /**
     * @brief Finds a discovered device by id.
     * @param id Record id.
     * @return The record if found, nullopt otherwise.
     */
    std::optional<core::DiscoveredDevice> findById(const std::string& id);

    /**
     * @brief Finds a discovered device by IP address.
     * @param ip IP address.
     * @return The record if found, nullopt otherwise.
     */
    std::optional<core::DiscoveredDevice> findByIp(const std::string& ip);

    /**
     * @brief Lists discovered devices matching a filter, most recently seen first.
     * @param filter Filter criteria.
     * @return Matching records.
     */
    std::vector<core::DiscoveredDevice> list(const core::DiscoveredDeviceFilter& filter = {});

    /**
     * @brief Deletes a discovered device.
     * @param id Record id.
     * @throws core::DiscoveryError with NotFound if no such record exists.
     */
    void remove(const std::string& id);

    /**
     * @brief Records that a discovered device became an inventory device.
     *
     * Must run inside the promotion transaction.
     *
     * @param id Discovered device id.
     * @param deviceId Inventory device id.
     * @param promotedAt Promotion time.
     * @throws core::DiscoveryError with NotFound or AlreadyPromoted.
     */
    void markPromoted(const std::string& id, const std::string& deviceId,
                      std::chrono::system_clock::time_point promotedAt);

    /**
     * @brief Deletes records not seen for a number of days and never promoted.
     * @param days Age threshold in days.
     * @return Number of deleted records.
     */
    int cleanupOlderThan(int days);

private:
    std::shared_ptr<Database> db_;
};

} // namespace rackscan::infra
