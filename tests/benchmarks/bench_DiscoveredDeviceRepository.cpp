#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>

#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/DiscoveredDeviceRepository.hpp"
#include "infrastructure/database/NetworkRepository.hpp"

#include <filesystem>
#include <memory>
#include <string>

using namespace rackscan::core;
using namespace rackscan::infra;

namespace {

class BenchmarkDatabase {
public:
    BenchmarkDatabase()
        : dbPath_(std::filesystem::temp_directory_path() / "rackscan_bench_discovered.db") {
        std::filesystem::remove(dbPath_);
        db_ = std::make_shared<Database>(dbPath_.string());
        db_->runMigrations();
    }

    ~BenchmarkDatabase() {
        db_.reset();
        std::filesystem::remove(dbPath_);
    }

    std::shared_ptr<Database> get() { return db_; }

private:
    std::filesystem::path dbPath_;
    std::shared_ptr<Database> db_;
};

DiscoveredDevice makeDevice(const std::string& networkId, int host) {
    DiscoveredDevice device;
    device.ip = "10.0." + std::to_string(host / 256) + "." + std::to_string(host % 256);
    device.networkId = networkId;
    device.status = DeviceStatus::Online;
    device.confidence = 60;
    device.openPorts = {22, 443};
    return device;
}

} // namespace

// =============================================================================
// Upsert Benchmarks
// =============================================================================

TEST_CASE("DiscoveredDeviceRepository benchmarks", "[benchmark][DiscoveredDeviceRepository]") {
    BenchmarkDatabase testDb;
    auto db = testDb.get();

    Network network;
    network.name = "bench";
    network.subnet = "10.0.0.0/16";
    network = NetworkRepository(db).insert(network);

    DiscoveredDeviceRepository repo(db);

    int next = 0;
    BENCHMARK("createOrUpdate new device") {
        return repo.createOrUpdate(makeDevice(network.id, next++)).id;
    };

    for (int i = 0; i < 254; ++i) {
        repo.createOrUpdate(makeDevice(network.id, 20000 + i));
    }
    int rescan = 0;

    BENCHMARK("createOrUpdate existing device") {
        return repo.createOrUpdate(makeDevice(network.id, 20000 + (rescan++ % 254))).id;
    };

    DiscoveredDeviceFilter filter;
    filter.networkId = network.id;
    filter.minConfidence = 50;

    BENCHMARK("list by network") {
        return repo.list(filter).size();
    };
}
