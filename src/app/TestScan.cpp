#include "app/TestScan.hpp"

#include "core/services/IDiscoveryStore.hpp"
#include "core/types/Errors.hpp"
#include "core/types/JsonSerialization.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/DiscoveryScanner.hpp"
#include "infrastructure/network/HostProber.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iostream>
#include <map>
#include <mutex>

namespace rackscan::app {

namespace {

constexpr const char* kTestNetworkId = "test-scan";

// Keeps probe results in memory, keyed by IP.
class InMemoryDiscoveryStore : public core::IDiscoveryStore {
public:
    explicit InMemoryDiscoveryStore(core::Network network) : network_(std::move(network)) {}

    std::optional<core::Network> getNetwork(const std::string& id) override {
        if (id != network_.id) {
            return std::nullopt;
        }
        return network_;
    }

    void createOrUpdateDiscoveredDevice(const core::DiscoveredDevice& device) override {
        std::lock_guard lock(mutex_);
        devices_[device.ip] = device;
    }

    void updateDiscoveryScan(const core::DiscoveryScan& /*scan*/) override {}

    std::vector<core::DiscoveredDevice> devices() const {
        std::lock_guard lock(mutex_);
        std::vector<core::DiscoveredDevice> result;
        for (const auto& [ip, device] : devices_) {
            result.push_back(device);
        }
        return result;
    }

private:
    core::Network network_;
    mutable std::mutex mutex_;
    std::map<std::string, core::DiscoveredDevice> devices_;
};

} // namespace

int runTestScan(const TestScanOptions& options) {
    core::Network network;
    network.id = kTestNetworkId;
    network.name = options.subnet;
    network.subnet = options.subnet;

    InMemoryDiscoveryStore store(network);

    infra::AsioContext context(4);
    context.start();

    infra::HostProberOptions proberOptions;
    proberOptions.reverseDns = options.reverseDns;
    infra::HostProber prober(context, proberOptions);

    infra::DiscoveryScanner scanner(store, prober);

    core::DiscoveryRule rule;
    rule.networkId = network.id;
    rule.timeoutSeconds = options.timeoutSeconds;
    rule.maxConcurrentScans = options.maxConcurrentHosts;
    rule.excludeIps = options.excludeIps;

    core::DiscoveryScan scan;
    try {
        scan = scanner.scanNetwork(
            network.id, rule,
            [](const core::DiscoveryScan& snapshot) {
                spdlog::info("[{}] {}/{} hosts scanned, {} online ({:.1f}%)",
                             snapshot.statusToString(), snapshot.scannedHosts, snapshot.totalHosts,
                             snapshot.foundHosts, snapshot.progressPercent());
            },
            std::stop_token{}, "");
    } catch (const core::DiscoveryError& e) {
        spdlog::error("Test scan failed: {}", e.what());
        context.stop();
        return 1;
    }

    context.stop();

    auto devices = store.devices();
    std::sort(devices.begin(), devices.end(),
              [](const core::DiscoveredDevice& a, const core::DiscoveredDevice& b) {
                  if (a.confidence != b.confidence) {
                      return a.confidence > b.confidence;
                  }
                  return a.ip < b.ip;
              });

    nlohmann::json output;
    output["scan"] = scan;
    output["devices"] = devices;
    std::cout << output.dump(2) << std::endl;

    return scan.status == core::ScanStatus::Completed ? 0 : 1;
}

} // namespace rackscan::app
