#pragma once

#include "core/types/Inventory.hpp"
#include "infrastructure/database/Database.hpp"

#include <memory>
#include <optional>
#include <string>

namespace rackscan::infra {

/**
 * @brief Repository for managed inventory devices and their addresses, tags and domains.
 */
class DeviceRepository {
public:
    explicit DeviceRepository(std::shared_ptr<Database> db);

    /**
     * @brief Inserts a device with its nested records.
     *
     * Runs as one transaction, joining the caller's transaction if one is open.
     *
     * @param device Device to store. An id is generated when empty.
     * @return The stored device.
     * @throws DatabaseError on constraint violations (unknown datacenter or
     *         network, duplicate id, tag or domain).
     */
    core::Device insert(const core::Device& device);

    /**
     * @brief Finds a device by id, including addresses, tags and domains.
     * @param id Device id.
     * @return The device if found, nullopt otherwise.
     */
    std::optional<core::Device> findById(const std::string& id);

    /**
     * @brief Counts stored devices.
     * @return Number of devices.
     */
    int count();

private:
    std::shared_ptr<Database> db_;
};

} // namespace rackscan::infra
