#include "infrastructure/database/NetworkRepository.hpp"

#include "core/util/Time.hpp"
#include "core/util/Uuid.hpp"

#include <spdlog/spdlog.h>

namespace rackscan::infra {

namespace {

core::Network rowToNetwork(Statement& stmt) {
    core::Network network;
    network.id = stmt.columnText(0);
    network.name = stmt.columnText(1);
    network.subnet = stmt.columnText(2);
    network.datacenterId = stmt.columnText(3);
    network.description = stmt.columnText(4);
    network.vlan = stmt.columnInt(5);
    return network;
}

} // namespace

NetworkRepository::NetworkRepository(std::shared_ptr<Database> db) : db_(std::move(db)) {}

core::Network NetworkRepository::insert(const core::Network& network) {
    core::Network stored = network;
    if (stored.id.empty()) {
        stored.id = core::util::generateUuid();
    }
    auto now = core::util::formatTimestamp(core::util::now());

    auto stmt = db_->prepare(R"(
        INSERT INTO networks (id, datacenter_id, name, subnet, description, vlan,
                              created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )");

    stmt.bind(1, stored.id);
    stmt.bindTextOrNull(2, stored.datacenterId);
    stmt.bind(3, stored.name);
    stmt.bind(4, stored.subnet);
    stmt.bindTextOrNull(5, stored.description);
    stmt.bind(6, stored.vlan);
    stmt.bind(7, now);
    stmt.bind(8, now);

    stmt.step();
    spdlog::debug("Inserted network: {} {} (ID: {})", stored.name, stored.subnet, stored.id);
    return stored;
}

std::optional<core::Network> NetworkRepository::findById(const std::string& id) {
    auto stmt = db_->prepare(R"(
        SELECT id, name, subnet, datacenter_id, description, vlan
        FROM networks WHERE id = ?
    )");
    stmt.bind(1, id);

    if (stmt.step()) {
        return rowToNetwork(stmt);
    }
    return std::nullopt;
}

std::vector<core::Network> NetworkRepository::findAll() {
    std::vector<core::Network> results;
    auto stmt = db_->prepare(R"(
        SELECT id, name, subnet, datacenter_id, description, vlan
        FROM networks ORDER BY name
    )");

    while (stmt.step()) {
        results.push_back(rowToNetwork(stmt));
    }
    return results;
}

} // namespace rackscan::infra
