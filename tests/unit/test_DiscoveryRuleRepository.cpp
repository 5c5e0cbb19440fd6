#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "core/util/Time.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/DiscoveryRuleRepository.hpp"
#include "infrastructure/database/NetworkRepository.hpp"

#include <filesystem>

using namespace rackscan::core;
using namespace rackscan::infra;

namespace {

class TestDatabase {
public:
    TestDatabase() : dbPath_(std::filesystem::temp_directory_path() / "rackscan_rules_test.db") {
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

std::string seedNetwork(std::shared_ptr<Database> db, const std::string& name) {
    Network network;
    network.name = name;
    network.subnet = "10.0.0.0/24";
    return NetworkRepository(db).insert(network).id;
}

} // namespace

TEST_CASE("DiscoveryRuleRepository insert and find", "[Database][DiscoveryRuleRepository]") {
    TestDatabase testDb;
    auto networkId = seedNetwork(testDb.get(), "lab");
    DiscoveryRuleRepository repo(testDb.get());

    DiscoveryRule rule;
    rule.networkId = networkId;
    rule.scanIntervalHours = 6;
    rule.scanType = ScanType::Quick;
    rule.maxConcurrentScans = 20;
    rule.timeoutSeconds = 1;
    rule.portScanType = PortScanType::Custom;
    rule.customPorts = {8080, 8443};
    rule.excludeIps = {"10.0.0.1", "10.0.0.128/25"};
    rule.excludeHosts = {"printer"};

    auto stored = repo.insert(rule);
    REQUIRE_FALSE(stored.id.empty());

    SECTION("Find by id returns all fields") {
        auto found = repo.findById(stored.id);
        REQUIRE(found.has_value());
        REQUIRE(found->networkId == networkId);
        REQUIRE(found->enabled);
        REQUIRE(found->scanIntervalHours == 6);
        REQUIRE(found->scanType == ScanType::Quick);
        REQUIRE(found->maxConcurrentScans == 20);
        REQUIRE(found->timeoutSeconds == 1);
        REQUIRE(found->portScanType == PortScanType::Custom);
        REQUIRE(found->customPorts == std::vector<int>{8080, 8443});
        REQUIRE(found->excludeIps == rule.excludeIps);
        REQUIRE(found->excludeHosts == rule.excludeHosts);
        REQUIRE_FALSE(found->lastRunAt.has_value());
    }

    SECTION("Find by network") {
        auto found = repo.findByNetwork(networkId);
        REQUIRE(found.has_value());
        REQUIRE(found->id == stored.id);
        REQUIRE_FALSE(repo.findByNetwork("other").has_value());
    }

    SECTION("One rule per network") {
        REQUIRE_THROWS_AS(repo.insert(rule), DatabaseError);
    }
}

TEST_CASE("DiscoveryRuleRepository update and remove", "[Database][DiscoveryRuleRepository]") {
    TestDatabase testDb;
    auto networkId = seedNetwork(testDb.get(), "lab");
    DiscoveryRuleRepository repo(testDb.get());

    DiscoveryRule rule;
    rule.networkId = networkId;
    auto stored = repo.insert(rule);

    SECTION("Update changes policy") {
        stored.enabled = false;
        stored.excludeIps = {"10.0.0.254"};
        repo.update(stored);

        auto found = repo.findById(stored.id);
        REQUIRE_FALSE(found->enabled);
        REQUIRE(found->excludeIps == std::vector<std::string>{"10.0.0.254"});
    }

    SECTION("Update of unknown rule reports NotFound") {
        DiscoveryRule ghost = stored;
        ghost.id = "ghost";
        REQUIRE_THROWS_AS(repo.update(ghost), DiscoveryError);
    }

    SECTION("Remove") {
        repo.remove(stored.id);
        REQUIRE_FALSE(repo.findById(stored.id).has_value());
        REQUIRE_THROWS_AS(repo.remove(stored.id), DiscoveryError);
    }

    SECTION("Run times are recorded") {
        auto last = util::now();
        auto next = last + std::chrono::hours(24);
        repo.updateRunTimes(stored.id, last, next);

        auto found = repo.findById(stored.id);
        REQUIRE(found->lastRunAt == last);
        REQUIRE(found->nextRunAt == next);
    }
}

TEST_CASE("DiscoveryRuleRepository enabled rules", "[Database][DiscoveryRuleRepository]") {
    TestDatabase testDb;
    DiscoveryRuleRepository repo(testDb.get());

    DiscoveryRule enabled;
    enabled.networkId = seedNetwork(testDb.get(), "lab");
    repo.insert(enabled);

    DiscoveryRule disabled;
    disabled.networkId = seedNetwork(testDb.get(), "office");
    disabled.enabled = false;
    repo.insert(disabled);

    REQUIRE(repo.list().size() == 2);

    auto active = repo.findEnabled();
    REQUIRE(active.size() == 1);
    REQUIRE(active[0].networkId == enabled.networkId);
}
