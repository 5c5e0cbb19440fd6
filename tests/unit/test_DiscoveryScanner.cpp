#include <catch2/catch_test_macros.hpp>

#include "core/services/IDiscoveryStore.hpp"
#include "core/services/IHostProber.hpp"
#include "core/types/Errors.hpp"
#include "core/util/Time.hpp"
#include "infrastructure/network/DiscoveryScanner.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

using namespace rackscan::core;
using namespace rackscan::infra;

namespace {

class FakeProber : public IHostProber {
public:
    DiscoveredDevice probeHost(const std::string& ip, std::chrono::milliseconds timeout,
                               std::stop_token stopToken) override {
        int current = ++inFlight_;
        int seen = maxInFlight_.load();
        while (current > seen && !maxInFlight_.compare_exchange_weak(seen, current)) {
        }

        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }

        DiscoveredDevice device;
        device.ip = ip;
        device.status = DeviceStatus::Offline;
        device.lastSeen = util::now();
        if (online.count(ip)) {
            device.status = DeviceStatus::Online;
            device.openPorts = {22};
        }

        {
            std::lock_guard lock(mutex_);
            probed_.push_back(ip);
            lastTimeout_ = timeout;
        }

        --inFlight_;
        if (onProbe) {
            onProbe(stopToken);
        }
        return device;
    }

    std::vector<std::string> probed() const {
        std::lock_guard lock(mutex_);
        return probed_;
    }

    std::chrono::milliseconds lastTimeout() const {
        std::lock_guard lock(mutex_);
        return lastTimeout_;
    }

    int maxInFlight() const { return maxInFlight_.load(); }

    std::set<std::string> online;
    std::chrono::milliseconds delay{0};
    std::function<void(std::stop_token)> onProbe;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> probed_;
    std::chrono::milliseconds lastTimeout_{0};
    std::atomic<int> inFlight_{0};
    std::atomic<int> maxInFlight_{0};
};

class FakeStore : public IDiscoveryStore {
public:
    std::optional<Network> getNetwork(const std::string& id) override {
        if (failNetworkLookup) {
            throw std::runtime_error("database is locked");
        }
        auto it = networks.find(id);
        if (it == networks.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void createOrUpdateDiscoveredDevice(const DiscoveredDevice& device) override {
        if (failingIps.count(device.ip)) {
            throw std::runtime_error("disk I/O error");
        }
        std::lock_guard lock(mutex_);
        devices[device.ip] = device;
    }

    void updateDiscoveryScan(const DiscoveryScan& /*scan*/) override {}

    void addNetwork(const std::string& id, const std::string& subnet) {
        Network network;
        network.id = id;
        network.name = id;
        network.subnet = subnet;
        networks[id] = network;
    }

    std::map<std::string, Network> networks;
    std::set<std::string> failingIps;
    bool failNetworkLookup{false};

    std::mutex mutex_;
    std::map<std::string, DiscoveredDevice> devices;
};

class ProgressRecorder {
public:
    IDiscoveryScanner::ProgressCallback callback() {
        return [this](const DiscoveryScan& snapshot) {
            std::lock_guard lock(mutex_);
            snapshots.push_back(snapshot);
        };
    }

    std::mutex mutex_;
    std::vector<DiscoveryScan> snapshots;
};

DiscoveryRule ruleFor(const std::string& networkId) {
    DiscoveryRule rule;
    rule.networkId = networkId;
    rule.maxConcurrentScans = 8;
    rule.timeoutSeconds = 1;
    return rule;
}

} // namespace

TEST_CASE("DiscoveryScanner sweeps a /24", "[DiscoveryScanner]") {
    FakeStore store;
    store.addNetwork("net", "10.0.0.0/24");
    FakeProber prober;
    prober.online = {"10.0.0.1", "10.0.0.50", "10.0.0.254"};
    DiscoveryScanner scanner(store, prober);
    ProgressRecorder progress;

    auto scan = scanner.scanNetwork("net", ruleFor("net"), progress.callback(), {}, "scan-1");

    SECTION("Final counters") {
        REQUIRE(scan.id == "scan-1");
        REQUIRE(scan.status == ScanStatus::Completed);
        REQUIRE(scan.totalHosts == 254);
        REQUIRE(scan.scannedHosts == 254);
        REQUIRE(scan.foundHosts == 3);
        REQUIRE(scan.scanDepth == 2);
        REQUIRE(scan.startedAt.has_value());
        REQUIRE(scan.completedAt.has_value());
        REQUIRE(scan.errorMessage.empty());
    }

    SECTION("Every host is probed exactly once") {
        auto probed = prober.probed();
        std::set<std::string> unique(probed.begin(), probed.end());
        REQUIRE(probed.size() == 254);
        REQUIRE(unique.size() == 254);
        REQUIRE_FALSE(unique.count("10.0.0.0"));
        REQUIRE_FALSE(unique.count("10.0.0.255"));
    }

    SECTION("Every probed host is stored and scored") {
        REQUIRE(store.devices.size() == 254);
        auto& online = store.devices.at("10.0.0.50");
        REQUIRE(online.networkId == "net");
        REQUIRE(online.lastScanId == "scan-1");
        REQUIRE(online.status == DeviceStatus::Online);
        REQUIRE(online.confidence == 60);

        auto& offline = store.devices.at("10.0.0.2");
        REQUIRE(offline.status == DeviceStatus::Offline);
        REQUIRE(offline.confidence == 30);
    }

    SECTION("Progress is throttled and ordered") {
        auto& snapshots = progress.snapshots;
        REQUIRE(snapshots.size() >= 2);
        REQUIRE(snapshots.size() <= 8);

        REQUIRE(snapshots.front().status == ScanStatus::Running);
        REQUIRE(snapshots.front().totalHosts == 254);
        REQUIRE(snapshots.front().scannedHosts == 0);

        REQUIRE(snapshots.back().status == ScanStatus::Completed);
        REQUIRE(snapshots.back().scannedHosts == 254);

        int terminal = 0;
        for (size_t i = 1; i < snapshots.size(); ++i) {
            REQUIRE(snapshots[i].scannedHosts >= snapshots[i - 1].scannedHosts);
        }
        for (const auto& snapshot : snapshots) {
            if (snapshot.isTerminal()) {
                ++terminal;
            } else {
                REQUIRE((snapshot.scannedHosts % 50 == 0 || snapshot.scannedHosts == 254));
            }
        }
        REQUIRE(terminal == 1);
    }
}

TEST_CASE("DiscoveryScanner applies exclusions before counting", "[DiscoveryScanner]") {
    FakeStore store;
    store.addNetwork("net", "10.0.0.0/24");
    FakeProber prober;
    DiscoveryScanner scanner(store, prober);

    auto rule = ruleFor("net");
    rule.excludeIps = {"10.0.0.1", "10.0.0.128/25"};

    auto scan = scanner.scanNetwork("net", rule, nullptr, {}, "");

    REQUIRE(scan.totalHosts == 126);
    REQUIRE(scan.scannedHosts == 126);
    auto probed = prober.probed();
    REQUIRE(std::find(probed.begin(), probed.end(), "10.0.0.1") == probed.end());
    REQUIRE(std::find(probed.begin(), probed.end(), "10.0.0.200") == probed.end());
    REQUIRE(std::find(probed.begin(), probed.end(), "10.0.0.127") != probed.end());
}

TEST_CASE("DiscoveryScanner configuration failures", "[DiscoveryScanner]") {
    FakeStore store;
    FakeProber prober;
    DiscoveryScanner scanner(store, prober);
    ProgressRecorder progress;

    SECTION("Unknown network") {
        try {
            scanner.scanNetwork("missing", ruleFor("missing"), progress.callback(), {}, "s");
            FAIL("expected NetworkNotFound");
        } catch (const DiscoveryError& e) {
            REQUIRE(e.code() == ErrorCode::NetworkNotFound);
        }

        REQUIRE(progress.snapshots.size() == 1);
        const auto& failed = progress.snapshots.front();
        REQUIRE(failed.status == ScanStatus::Failed);
        REQUIRE(failed.errorMessage.rfind("getting network:", 0) == 0);
        REQUIRE(failed.completedAt.has_value());
        REQUIRE(prober.probed().empty());
    }

    SECTION("Network lookup error") {
        store.failNetworkLookup = true;
        REQUIRE_THROWS_AS(scanner.scanNetwork("net", ruleFor("net"), progress.callback(), {}, ""),
                          DiscoveryError);
        REQUIRE(progress.snapshots.size() == 1);
        REQUIRE(progress.snapshots.front().errorMessage.find("database is locked") !=
                std::string::npos);
    }

    SECTION("Invalid subnet") {
        store.addNetwork("bad", "not-a-cidr");
        try {
            scanner.scanNetwork("bad", ruleFor("bad"), progress.callback(), {}, "s");
            FAIL("expected InvalidSubnet");
        } catch (const DiscoveryError& e) {
            REQUIRE(e.code() == ErrorCode::InvalidSubnet);
        }

        REQUIRE(progress.snapshots.size() == 1);
        REQUIRE(progress.snapshots.front().status == ScanStatus::Failed);
        REQUIRE(progress.snapshots.front().errorMessage.rfind("generating IP list:", 0) == 0);
        REQUIRE(prober.probed().empty());
    }
}

TEST_CASE("DiscoveryScanner prefix limit", "[DiscoveryScanner]") {
    FakeStore store;
    store.addNetwork("wide", "10.8.0.0/21");
    store.addNetwork("exact", "10.9.0.0/22");
    FakeProber prober;
    ProgressRecorder progress;

    DiscoveryScannerOptions options;
    options.minPrefixLength = 22;
    DiscoveryScanner scanner(store, prober, options);

    SECTION("Shorter prefix fails before probing") {
        try {
            scanner.scanNetwork("wide", ruleFor("wide"), progress.callback(), {}, "s");
            FAIL("expected InvalidSubnet");
        } catch (const DiscoveryError& e) {
            REQUIRE(e.code() == ErrorCode::InvalidSubnet);
        }
        REQUIRE(progress.snapshots.size() == 1);
        REQUIRE(progress.snapshots.front().errorMessage.find("too large") != std::string::npos);
        REQUIRE(prober.probed().empty());
    }

    SECTION("Prefix at the limit is swept") {
        auto scan = scanner.scanNetwork("exact", ruleFor("exact"), nullptr, {}, "");
        REQUIRE(scan.status == ScanStatus::Completed);
        REQUIRE(scan.totalHosts == 1022);
    }

    SECTION("Default limit accepts prefixes shorter than /16") {
        REQUIRE(DiscoveryScannerOptions{}.minPrefixLength == 8);
    }
}

TEST_CASE("DiscoveryScanner survives per-host failures", "[DiscoveryScanner]") {
    FakeStore store;
    store.addNetwork("net", "10.0.0.0/29");
    store.failingIps = {"10.0.0.3"};
    FakeProber prober;
    prober.online = {"10.0.0.3", "10.0.0.4"};
    DiscoveryScanner scanner(store, prober);

    SECTION("Persistence failure") {
        auto scan = scanner.scanNetwork("net", ruleFor("net"), nullptr, {}, "");

        REQUIRE(scan.status == ScanStatus::Completed);
        REQUIRE(scan.scannedHosts == 6);
        REQUIRE(scan.foundHosts == 2);
        REQUIRE(store.devices.size() == 5);
    }

    SECTION("Throwing progress callback") {
        auto scan = scanner.scanNetwork(
            "net", ruleFor("net"),
            [](const DiscoveryScan&) { throw std::runtime_error("listener gone"); }, {}, "");

        REQUIRE(scan.status == ScanStatus::Completed);
        REQUIRE(scan.scannedHosts == 6);
    }
}

TEST_CASE("DiscoveryScanner bounds parallelism", "[DiscoveryScanner]") {
    FakeStore store;
    store.addNetwork("net", "10.0.0.0/26");
    FakeProber prober;
    prober.delay = std::chrono::milliseconds(5);
    DiscoveryScanner scanner(store, prober);

    auto rule = ruleFor("net");
    rule.maxConcurrentScans = 4;
    scanner.scanNetwork("net", rule, nullptr, {}, "");

    REQUIRE(prober.maxInFlight() >= 1);
    REQUIRE(prober.maxInFlight() <= 4);
}

TEST_CASE("DiscoveryScanner timeout selection", "[DiscoveryScanner]") {
    FakeStore store;
    store.addNetwork("net", "10.0.0.0/30");
    FakeProber prober;

    DiscoveryScannerOptions options;
    options.defaultTimeout = std::chrono::milliseconds(1500);
    DiscoveryScanner scanner(store, prober, options);

    SECTION("Rule timeout") {
        auto rule = ruleFor("net");
        rule.timeoutSeconds = 3;
        scanner.scanNetwork("net", rule, nullptr, {}, "");
        REQUIRE(prober.lastTimeout() == std::chrono::milliseconds(3000));
    }

    SECTION("Engine default when the rule sets none") {
        auto rule = ruleFor("net");
        rule.timeoutSeconds = 0;
        rule.maxConcurrentScans = 0;
        auto scan = scanner.scanNetwork("net", rule, nullptr, {}, "");
        REQUIRE(prober.lastTimeout() == std::chrono::milliseconds(1500));
        REQUIRE(scan.status == ScanStatus::Completed);
    }
}

TEST_CASE("DiscoveryScanner cancellation", "[DiscoveryScanner]") {
    FakeStore store;
    store.addNetwork("net", "10.0.0.0/24");
    FakeProber prober;
    std::stop_source stopSource;
    std::atomic<int> probes{0};
    prober.onProbe = [&](std::stop_token) {
        if (++probes == 10) {
            stopSource.request_stop();
        }
    };
    DiscoveryScanner scanner(store, prober);
    ProgressRecorder progress;

    auto rule = ruleFor("net");
    rule.maxConcurrentScans = 2;
    auto scan = scanner.scanNetwork("net", rule, progress.callback(), stopSource.get_token(), "");

    REQUIRE(scan.status == ScanStatus::Failed);
    REQUIRE(scan.errorMessage == "scan cancelled");
    REQUIRE(scan.scannedHosts < scan.totalHosts);
    REQUIRE(prober.probed().size() < 254);
    REQUIRE(progress.snapshots.back().status == ScanStatus::Failed);
}

TEST_CASE("DiscoveryScanner generates a scan id when none is given", "[DiscoveryScanner]") {
    FakeStore store;
    store.addNetwork("net", "10.0.0.0/30");
    FakeProber prober;
    DiscoveryScanner scanner(store, prober);

    auto scan = scanner.scanNetwork("net", ruleFor("net"), nullptr, {}, "");

    REQUIRE(scan.id.size() == 36);
    REQUIRE(store.devices.at("10.0.0.1").lastScanId == scan.id);
}
