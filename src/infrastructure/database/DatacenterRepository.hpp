#pragma once

#include "core/types/Inventory.hpp"
#include "infrastructure/database/Database.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rackscan::infra {

/**
 * @brief Repository for datacenter records.
 */
class DatacenterRepository {
public:
    explicit DatacenterRepository(std::shared_ptr<Database> db);

    /**
     * @brief Inserts a datacenter.
     * @param datacenter Datacenter to store. An id is generated when empty.
     * @return The stored datacenter.
     */
    core::Datacenter insert(const core::Datacenter& datacenter);

    /**
     * @brief Finds a datacenter by id.
     * @param id Datacenter id.
     * @return The datacenter if found, nullopt otherwise.
     */
    std::optional<core::Datacenter> findById(const std::string& id);

    /**
     * @brief Retrieves all datacenters ordered by name.
     * @return Vector of datacenters.
     */
    std::vector<core::Datacenter> findAll();

private:
    std::shared_ptr<Database> db_;
};

} // namespace rackscan::infra
