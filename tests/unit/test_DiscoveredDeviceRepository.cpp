#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "core/util/Time.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/DiscoveredDeviceRepository.hpp"
#include "infrastructure/database/NetworkRepository.hpp"

#include <atomic>
#include <filesystem>
#include <thread>

using namespace rackscan::core;
using namespace rackscan::infra;

namespace {

class TestDatabase {
public:
    TestDatabase()
        : dbPath_(std::filesystem::temp_directory_path() / "rackscan_discovered_test.db") {
        std::filesystem::remove(dbPath_);
        db_ = std::make_shared<Database>(dbPath_.string());
        db_->runMigrations();
    }

    ~TestDatabase() {
        db_.reset();
        std::filesystem::remove(dbPath_);
    }

    std::shared_ptr<Database> get() { return db_; }

private:
    std::filesystem::path dbPath_;
    std::shared_ptr<Database> db_;
};

Network seedNetwork(std::shared_ptr<Database> db, const std::string& subnet = "10.0.0.0/24") {
    Network network;
    network.name = "lab";
    network.subnet = subnet;
    return NetworkRepository(db).insert(network);
}

DiscoveredDevice makeDraft(const std::string& networkId, const std::string& ip, int confidence,
                           DeviceStatus status = DeviceStatus::Online) {
    DiscoveredDevice device;
    device.ip = ip;
    device.networkId = networkId;
    device.status = status;
    device.confidence = confidence;
    device.lastSeen = util::now();
    return device;
}

} // namespace

TEST_CASE("DiscoveredDeviceRepository insert and find", "[Database][DiscoveredDeviceRepository]") {
    TestDatabase testDb;
    auto network = seedNetwork(testDb.get());
    DiscoveredDeviceRepository repo(testDb.get());

    auto draft = makeDraft(network.id, "10.0.0.5", 60);
    draft.hostname = "web01";
    draft.openPorts = {22, 80};
    draft.services.push_back({80, "tcp", "http", "", "", ""});

    auto stored = repo.createOrUpdate(draft);

    REQUIRE_FALSE(stored.id.empty());
    REQUIRE(stored.firstSeen == stored.createdAt);

    SECTION("Find by IP returns all fields") {
        auto found = repo.findByIp("10.0.0.5");
        REQUIRE(found.has_value());
        REQUIRE(found->id == stored.id);
        REQUIRE(found->hostname == "web01");
        REQUIRE(found->status == DeviceStatus::Online);
        REQUIRE(found->confidence == 60);
        REQUIRE(found->openPorts == std::vector<int>{22, 80});
        REQUIRE(found->services.size() == 1);
        REQUIRE(found->services[0].service == "http");
        REQUIRE_FALSE(found->isPromoted());
    }

    SECTION("Find by id") {
        REQUIRE(repo.findById(stored.id).has_value());
        REQUIRE_FALSE(repo.findById("missing").has_value());
    }
}

TEST_CASE("DiscoveredDeviceRepository merge rules", "[Database][DiscoveredDeviceRepository]") {
    TestDatabase testDb;
    auto network = seedNetwork(testDb.get());
    DiscoveredDeviceRepository repo(testDb.get());

    auto first = makeDraft(network.id, "10.0.0.9", 80);
    first.hostname = "nas";
    first.macAddress = "aa:bb:cc:00:11:22";
    first.lastSeen = util::now() - std::chrono::hours(1);
    auto original = repo.createOrUpdate(first);

    SECTION("Confidence never decreases") {
        repo.createOrUpdate(makeDraft(network.id, "10.0.0.9", 30, DeviceStatus::Offline));
        auto merged = repo.findByIp("10.0.0.9");
        REQUIRE(merged->confidence == 80);
        REQUIRE(merged->status == DeviceStatus::Offline);
    }

    SECTION("Higher confidence replaces the stored value") {
        repo.createOrUpdate(makeDraft(network.id, "10.0.0.9", 90));
        REQUIRE(repo.findByIp("10.0.0.9")->confidence == 90);
    }

    SECTION("Identity and first sighting are preserved") {
        auto later = makeDraft(network.id, "10.0.0.9", 80);
        later.id = "other-id";
        auto merged = repo.createOrUpdate(later);

        REQUIRE(merged.id == original.id);
        REQUIRE(merged.firstSeen == original.firstSeen);
        REQUIRE(merged.lastSeen > original.lastSeen);
        REQUIRE(repo.list().size() == 1);
    }

    SECTION("Empty MAC and hostname keep the stored values") {
        repo.createOrUpdate(makeDraft(network.id, "10.0.0.9", 30));
        auto merged = repo.findByIp("10.0.0.9");
        REQUIRE(merged->hostname == "nas");
        REQUIRE(merged->macAddress == "aa:bb:cc:00:11:22");
    }

    SECTION("New hostname replaces the stored one") {
        auto renamed = makeDraft(network.id, "10.0.0.9", 30);
        renamed.hostname = "nas-02";
        repo.createOrUpdate(renamed);
        REQUIRE(repo.findByIp("10.0.0.9")->hostname == "nas-02");
    }

    SECTION("Repeating a merge is idempotent") {
        auto again = makeDraft(network.id, "10.0.0.9", 80);
        auto once = repo.createOrUpdate(again);
        auto twice = repo.createOrUpdate(again);
        REQUIRE(once.id == twice.id);
        REQUIRE(once.confidence == twice.confidence);
        REQUIRE(once.hostname == twice.hostname);
        REQUIRE(repo.list().size() == 1);
    }
}

TEST_CASE("DiscoveredDeviceRepository concurrent merges of one IP",
          "[Database][DiscoveredDeviceRepository]") {
    TestDatabase testDb;
    auto network = seedNetwork(testDb.get());
    DiscoveredDeviceRepository repo(testDb.get());

    auto first = makeDraft(network.id, "10.0.0.42", 10);
    first.lastSeen = util::now() - std::chrono::hours(2);
    auto original = repo.createOrUpdate(first);

    constexpr int kThreads = 8;
    constexpr int kMergesPerThread = 50;
    std::atomic<int> failures{0};
    std::vector<std::thread> workers;

    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < kMergesPerThread; ++i) {
                try {
                    repo.createOrUpdate(makeDraft(network.id, "10.0.0.42", (t * 7 + i) % 91));
                } catch (const std::exception&) {
                    ++failures;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    REQUIRE(failures == 0);

    auto rows = repo.list();
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0].id == original.id);
    REQUIRE(rows[0].firstSeen == original.firstSeen);
    REQUIRE(rows[0].confidence == 90);
}

TEST_CASE("DiscoveredDeviceRepository requires an existing network",
          "[Database][DiscoveredDeviceRepository]") {
    TestDatabase testDb;
    DiscoveredDeviceRepository repo(testDb.get());

    REQUIRE_THROWS_AS(repo.createOrUpdate(makeDraft("no-such-network", "10.0.0.1", 30)),
                      DatabaseError);
}

TEST_CASE("DiscoveredDeviceRepository list filters", "[Database][DiscoveredDeviceRepository]") {
    TestDatabase testDb;
    auto lab = seedNetwork(testDb.get());
    auto office = seedNetwork(testDb.get(), "192.168.0.0/24");
    DiscoveredDeviceRepository repo(testDb.get());

    repo.createOrUpdate(makeDraft(lab.id, "10.0.0.1", 90));
    repo.createOrUpdate(makeDraft(lab.id, "10.0.0.2", 30, DeviceStatus::Offline));
    repo.createOrUpdate(makeDraft(office.id, "192.168.0.1", 60));

    SECTION("No filter lists everything") {
        REQUIRE(repo.list().size() == 3);
    }

    SECTION("By network") {
        DiscoveredDeviceFilter filter;
        filter.networkId = lab.id;
        REQUIRE(repo.list(filter).size() == 2);
    }

    SECTION("By status") {
        DiscoveredDeviceFilter filter;
        filter.status = DeviceStatus::Offline;
        auto offline = repo.list(filter);
        REQUIRE(offline.size() == 1);
        REQUIRE(offline[0].ip == "10.0.0.2");
    }

    SECTION("By minimum confidence") {
        DiscoveredDeviceFilter filter;
        filter.minConfidence = 60;
        REQUIRE(repo.list(filter).size() == 2);
    }

    SECTION("By promotion state") {
        DiscoveredDeviceFilter filter;
        filter.promoted = true;
        REQUIRE(repo.list(filter).empty());
        filter.promoted = false;
        REQUIRE(repo.list(filter).size() == 3);
    }
}

TEST_CASE("DiscoveredDeviceRepository remove", "[Database][DiscoveredDeviceRepository]") {
    TestDatabase testDb;
    auto network = seedNetwork(testDb.get());
    DiscoveredDeviceRepository repo(testDb.get());

    auto stored = repo.createOrUpdate(makeDraft(network.id, "10.0.0.3", 30));

    repo.remove(stored.id);
    REQUIRE_FALSE(repo.findById(stored.id).has_value());

    try {
        repo.remove(stored.id);
        FAIL("expected NotFound");
    } catch (const DiscoveryError& e) {
        REQUIRE(e.code() == ErrorCode::NotFound);
    }
}

TEST_CASE("DiscoveredDeviceRepository cleanup", "[Database][DiscoveredDeviceRepository]") {
    TestDatabase testDb;
    auto network = seedNetwork(testDb.get());
    DiscoveredDeviceRepository repo(testDb.get());

    auto stale = makeDraft(network.id, "10.0.0.20", 30);
    stale.lastSeen = util::now() - std::chrono::hours(24 * 45);
    repo.createOrUpdate(stale);

    repo.createOrUpdate(makeDraft(network.id, "10.0.0.21", 30));

    SECTION("Removes records older than the threshold") {
        REQUIRE(repo.cleanupOlderThan(30) == 1);
        REQUIRE_FALSE(repo.findByIp("10.0.0.20").has_value());
        REQUIRE(repo.findByIp("10.0.0.21").has_value());
    }

    SECTION("Keeps everything when nothing is old enough") {
        REQUIRE(repo.cleanupOlderThan(60) == 0);
        REQUIRE(repo.list().size() == 2);
    }
}
