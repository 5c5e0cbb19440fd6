/**
 * @file IDiscoveryStore.hpp
 * @brief Persistence boundary used by the discovery scanner.
 */

#pragma once

#include "core/types/DiscoveredDevice.hpp"
#include "core/types/DiscoveryScan.hpp"
#include "core/types/Inventory.hpp"

#include <optional>
#include <string>

namespace rackscan::core {

/**
 * @brief The store operations a scan needs.
 *
 * Implementations serialize conflicting writes themselves. All methods may be
 * called concurrently from scanner worker threads.
 */
class IDiscoveryStore {
public:
    virtual ~IDiscoveryStore() = default;

    /**
     * @brief Looks up a network by id.
     * @param id Network id.
     * @return The network, or nullopt if it does not exist.
     */
    virtual std::optional<Network> getNetwork(const std::string& id) = 0;

    /**
     * @brief Merges a probe result into the stored record for its IP.
     *
     * Inserts a new record on first sight. Otherwise first_seen is preserved,
     * confidence only increases and empty MAC/hostname keep the old values.
     *
     * @param device Probe result to merge.
     * @throws std::runtime_error on persistence failure.
     */
    virtual void createOrUpdateDiscoveredDevice(const DiscoveredDevice& device) = 0;

    /**
     * @brief Persists a scan progress snapshot.
     * @param scan Snapshot to store.
     * @throws DiscoveryError with NotFound if the scan record does not exist.
     */
    virtual void updateDiscoveryScan(const DiscoveryScan& scan) = 0;
};

} // namespace rackscan::core
