#pragma once

#include "core/types/DiscoveryScan.hpp"
#include "infrastructure/database/Database.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rackscan::infra {

/**
 * @brief Repository for discovery scan records.
 */
class DiscoveryScanRepository {
public:
    /**
     * @brief Constructs a DiscoveryScanRepository with the given database.
     * @param db Shared pointer to the Database instance.
     */
    explicit DiscoveryScanRepository(std::shared_ptr<Database> db);

    /**
     * @brief Inserts a scan record.
     * @param scan Scan to store. An id is generated when empty.
     * @return The stored scan including id and timestamps.
     */
    core::DiscoveryScan insert(const core::DiscoveryScan& scan);

    /**
     * @brief Overwrites the status and counters of an existing scan.
     *
     * Status only moves forward and a completed or failed scan is final.
     *
     * @param scan Scan with updated values (id must be set).
     * @throws core::DiscoveryError with NotFound if the scan does not exist, or
     *         InvalidRequest for a backward status change, an update of a
     *         finished scan or a lower scanned host count.
     */
    void update(const core::DiscoveryScan& scan);

    /**
     * @brief Deletes a scan record.
     * @param id Scan id.
     * @throws core::DiscoveryError with NotFound if the scan does not exist.
     */
    void remove(const std::string& id);

    /**
     * @brief Finds a scan by id.
     * @param id Scan id.
     * @return The scan if found, nullopt otherwise.
     */
    std::optional<core::DiscoveryScan> findById(const std::string& id);

    /**
     * @brief Lists scans, newest first.
     * @param networkId Restrict to one network, or empty for all scans.
     * @return Matching scans.
     */
    std::vector<core::DiscoveryScan> list(const std::string& networkId = {});

private:
    std::shared_ptr<Database> db_;
};

} // namespace rackscan::infra
