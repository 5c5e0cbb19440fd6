#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "infrastructure/database/DatacenterRepository.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/DevicePromoter.hpp"
#include "infrastructure/database/DeviceRepository.hpp"
#include "infrastructure/database/DiscoveredDeviceRepository.hpp"
#include "infrastructure/database/NetworkRepository.hpp"

#include <filesystem>

using namespace rackscan::core;
using namespace rackscan::infra;

namespace {

class TestDatabase {
public:
    TestDatabase() : dbPath_(std::filesystem::temp_directory_path() / "rackscan_promote_test.db") {
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

// A network with a few discovered hosts, ready for promotion.
class PromotionFixture {
public:
    PromotionFixture() : discovered_(db_.get()), devices_(db_.get()), promoter_(db_.get()) {
        Network network;
        network.name = "lab";
        network.subnet = "10.0.0.0/24";
        network_ = NetworkRepository(db_.get()).insert(network);
    }

    std::string discover(const std::string& ip, const std::string& osGuess = "") {
        DiscoveredDevice device;
        device.ip = ip;
        device.networkId = network_.id;
        device.status = DeviceStatus::Online;
        device.confidence = 60;
        device.osGuess = osGuess;
        return discovered_.createOrUpdate(device).id;
    }

    Datacenter addDatacenter(const std::string& name) {
        Datacenter datacenter;
        datacenter.name = name;
        return DatacenterRepository(db_.get()).insert(datacenter);
    }

    static PromoteDeviceRequest request(const std::string& name) {
        PromoteDeviceRequest req;
        req.name = name;
        return req;
    }

    TestDatabase db_;
    Network network_;
    DiscoveredDeviceRepository discovered_;
    DeviceRepository devices_;
    DevicePromoter promoter_;
};

} // namespace

TEST_CASE("DevicePromoter promote", "[DevicePromoter]") {
    PromotionFixture f;
    auto id = f.discover("10.0.0.10", "Linux");

    SECTION("Creates a device with the discovered address") {
        auto req = PromotionFixture::request("app-server");
        req.tags = {"prod"};
        req.domains = {"example.com"};

        auto device = f.promoter_.promote(id, req);

        REQUIRE_FALSE(device.id.empty());
        REQUIRE(device.name == "app-server");
        REQUIRE(device.addresses.size() == 1);
        REQUIRE(device.addresses[0].ip == "10.0.0.10");
        REQUIRE(device.addresses[0].port == 0);
        REQUIRE(device.addresses[0].type == "ipv4");
        REQUIRE(device.addresses[0].label == "discovered");
        REQUIRE(device.addresses[0].networkId == f.network_.id);

        auto stored = f.devices_.findById(device.id);
        REQUIRE(stored.has_value());
        REQUIRE(stored->tags == std::vector<std::string>{"prod"});
        REQUIRE(stored->domains == std::vector<std::string>{"example.com"});
        REQUIRE(stored->addresses.size() == 1);

        auto discovered = f.discovered_.findById(id);
        REQUIRE(discovered->promotedToDeviceId == device.id);
        REQUIRE(discovered->promotedAt.has_value());
    }

    SECTION("Falls back to the OS guess") {
        auto device = f.promoter_.promote(id, PromotionFixture::request("box"));
        REQUIRE(device.os == "Linux");
    }

    SECTION("Explicit OS wins over the guess") {
        auto req = PromotionFixture::request("box");
        req.os = "FreeBSD";
        REQUIRE(f.promoter_.promote(id, req).os == "FreeBSD");
    }

    SECTION("Caller-supplied device id is kept") {
        auto req = PromotionFixture::request("box");
        req.deviceId = "dev-fixed";
        REQUIRE(f.promoter_.promote(id, req).id == "dev-fixed");
    }
}

TEST_CASE("DevicePromoter datacenter assignment", "[DevicePromoter]") {
    PromotionFixture f;
    auto id = f.discover("10.0.0.11");

    SECTION("No datacenter leaves it empty") {
        REQUIRE(f.promoter_.promote(id, PromotionFixture::request("a")).datacenterId.empty());
    }

    SECTION("A single datacenter is assigned automatically") {
        auto dc = f.addDatacenter("dc1");
        REQUIRE(f.promoter_.promote(id, PromotionFixture::request("a")).datacenterId == dc.id);
    }

    SECTION("Several datacenters are not guessed") {
        f.addDatacenter("dc1");
        f.addDatacenter("dc2");
        REQUIRE(f.promoter_.promote(id, PromotionFixture::request("a")).datacenterId.empty());
    }

    SECTION("Unknown datacenter is a constraint violation and nothing is written") {
        auto req = PromotionFixture::request("a");
        req.datacenterId = "no-such-dc";
        try {
            f.promoter_.promote(id, req);
            FAIL("expected ConstraintViolation");
        } catch (const DiscoveryError& e) {
            REQUIRE(e.code() == ErrorCode::ConstraintViolation);
        }
        REQUIRE(f.devices_.count() == 0);
        REQUIRE_FALSE(f.discovered_.findById(id)->isPromoted());
    }
}

TEST_CASE("DevicePromoter rejections", "[DevicePromoter]") {
    PromotionFixture f;
    auto id = f.discover("10.0.0.12");

    SECTION("Missing discovered device") {
        try {
            f.promoter_.promote("missing", PromotionFixture::request("a"));
            FAIL("expected NotFound");
        } catch (const DiscoveryError& e) {
            REQUIRE(e.code() == ErrorCode::NotFound);
        }
    }

    SECTION("Empty name") {
        try {
            f.promoter_.promote(id, PromotionFixture::request(""));
            FAIL("expected InvalidRequest");
        } catch (const DiscoveryError& e) {
            REQUIRE(e.code() == ErrorCode::InvalidRequest);
        }
    }

    SECTION("Second promotion of the same record") {
        f.promoter_.promote(id, PromotionFixture::request("first"));
        try {
            f.promoter_.promote(id, PromotionFixture::request("second"));
            FAIL("expected AlreadyPromoted");
        } catch (const DiscoveryError& e) {
            REQUIRE(e.code() == ErrorCode::AlreadyPromoted);
        }
        REQUIRE(f.devices_.count() == 1);
    }
}

TEST_CASE("DevicePromoter is atomic", "[DevicePromoter]") {
    PromotionFixture f;
    auto id = f.discover("10.0.0.13");

    // Duplicate tags violate the tag table key after the device row is written
    auto req = PromotionFixture::request("dup-tags");
    req.tags = {"a", "a"};

    REQUIRE_THROWS_AS(f.promoter_.promote(id, req), DiscoveryError);
    REQUIRE(f.devices_.count() == 0);
    REQUIRE_FALSE(f.discovered_.findById(id)->isPromoted());

    // The record can still be promoted afterwards
    REQUIRE_NOTHROW(f.promoter_.promote(id, PromotionFixture::request("fixed")));
}

TEST_CASE("DevicePromoter bulk promotion", "[DevicePromoter]") {
    PromotionFixture f;
    auto first = f.discover("10.0.0.21");
    auto second = f.discover("10.0.0.22");
    auto third = f.discover("10.0.0.23");

    SECTION("One failure does not stop the others") {
        auto result = f.promoter_.bulkPromote(
            {first, second, third},
            {PromotionFixture::request("one"), PromotionFixture::request(""),
             PromotionFixture::request("three")});

        REQUIRE(result.promoted.size() == 2);
        REQUIRE(result.promoted[0].name == "one");
        REQUIRE(result.promoted[1].name == "three");
        REQUIRE(result.failures.size() == 1);
        REQUIRE(result.failures[0].discoveredId == second);
        REQUIRE(result.failures[0].code == ErrorCode::InvalidRequest);
        REQUIRE_FALSE(f.discovered_.findById(second)->isPromoted());
    }

    SECTION("Missing requests get a generated name") {
        auto result =
            f.promoter_.bulkPromote({first, second}, {PromotionFixture::request("one")});

        REQUIRE(result.failures.empty());
        REQUIRE(result.promoted.size() == 2);
        REQUIRE(result.promoted[1].name == "device-" + second);
    }

    SECTION("Unknown ids are reported") {
        auto result = f.promoter_.bulkPromote({"nope", first}, {});

        REQUIRE(result.promoted.size() == 1);
        REQUIRE(result.failures.size() == 1);
        REQUIRE(result.failures[0].code == ErrorCode::NotFound);
    }
}

TEST_CASE("Promoted devices survive cleanup", "[DevicePromoter][DiscoveredDeviceRepository]") {
    PromotionFixture f;

    DiscoveredDevice stale;
    stale.ip = "10.0.0.40";
    stale.networkId = f.network_.id;
    stale.lastSeen = std::chrono::system_clock::now() - std::chrono::hours(24 * 90);
    auto id = f.discovered_.createOrUpdate(stale).id;

    f.promoter_.promote(id, PromotionFixture::request("keeper"));

    REQUIRE(f.discovered_.cleanupOlderThan(30) == 0);
    REQUIRE(f.discovered_.findById(id).has_value());
}
