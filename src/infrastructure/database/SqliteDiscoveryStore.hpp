#pragma once

#include "core/services/IDiscoveryStore.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/DiscoveredDeviceRepository.hpp"
#include "infrastructure/database/DiscoveryScanRepository.hpp"
#include "infrastructure/database/NetworkRepository.hpp"

#include <memory>

namespace rackscan::infra {

/**
 * @brief IDiscoveryStore backed by the SQLite repositories.
 */
class SqliteDiscoveryStore : public core::IDiscoveryStore {
public:
    explicit SqliteDiscoveryStore(std::shared_ptr<Database> db);

    std::optional<core::Network> getNetwork(const std::string& id) override;
    void createOrUpdateDiscoveredDevice(const core::DiscoveredDevice& device) override;
    void updateDiscoveryScan(const core::DiscoveryScan& scan) override;

private:
    NetworkRepository networks_;
    DiscoveredDeviceRepository discoveredDevices_;
    DiscoveryScanRepository scans_;
};

} // namespace rackscan::infra
