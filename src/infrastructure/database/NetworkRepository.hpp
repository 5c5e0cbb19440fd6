#pragma once

#include "core/types/Inventory.hpp"
#include "infrastructure/database/Database.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rackscan::infra {

/**
 * @brief Repository for network records.
 */
class NetworkRepository {
public:
    explicit NetworkRepository(std::shared_ptr<Database> db);

    /**
     * @brief Inserts a network.
     * @param network Network to store. An id is generated when empty.
     * @return The stored network.
     * @throws DatabaseError if the datacenter does not exist.
     */
    core::Network insert(const core::Network& network);

    /**
     * @brief Finds a network by id.
     * @param id Network id.
     * @return The network if found, nullopt otherwise.
     */
    std::optional<core::Network> findById(const std::string& id);

    /**
     * @brief Retrieves all networks ordered by name.
     * @return Vector of networks.
     */
    std::vector<core::Network> findAll();

private:
    std::shared_ptr<Database> db_;
};

} // namespace rackscan::infra
