#include "infrastructure/database/SqliteDiscoveryStore.hpp"

namespace rackscan::infra {

SqliteDiscoveryStore::SqliteDiscoveryStore(std::shared_ptr<Database> db)
    : networks_(db), discoveredDevices_(db), scans_(std::move(db)) {}

std::optional<core::Network> SqliteDiscoveryStore::getNetwork(const std::string& id) {
    return networks_.findById(id);
}

void SqliteDiscoveryStore::createOrUpdateDiscoveredDevice(const core::DiscoveredDevice& device) {
    discoveredDevices_.createOrUpdate(device);
}

void SqliteDiscoveryStore::updateDiscoveryScan(const core::DiscoveryScan& scan) {
    scans_.update(scan);
}

} // namespace rackscan::infra
