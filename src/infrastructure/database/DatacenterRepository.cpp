#include "infrastructure/database/DatacenterRepository.hpp"

#include "core/util/Time.hpp"
#include "core/util/Uuid.hpp"

#include <spdlog/spdlog.h>

namespace rackscan::infra {

namespace {

core::Datacenter rowToDatacenter(Statement& stmt) {
    core::Datacenter datacenter;
    datacenter.id = stmt.columnText(0);
    datacenter.name = stmt.columnText(1);
    datacenter.location = stmt.columnText(2);
    datacenter.description = stmt.columnText(3);
    datacenter.createdAt = core::util::parseTimestamp(stmt.columnText(4));
    datacenter.updatedAt = core::util::parseTimestamp(stmt.columnText(5));
    return datacenter;
}

} // namespace

DatacenterRepository::DatacenterRepository(std::shared_ptr<Database> db) : db_(std::move(db)) {}

core::Datacenter DatacenterRepository::insert(const core::Datacenter& datacenter) {
    core::Datacenter stored = datacenter;
    if (stored.id.empty()) {
        stored.id = core::util::generateUuid();
    }
    stored.createdAt = core::util::now();
    stored.updatedAt = stored.createdAt;

    auto stmt = db_->prepare(R"(
        INSERT INTO datacenters (id, name, location, description, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?)
    )");

    stmt.bind(1, stored.id);
    stmt.bind(2, stored.name);
    stmt.bindTextOrNull(3, stored.location);
    stmt.bindTextOrNull(4, stored.description);
    stmt.bind(5, core::util::formatTimestamp(stored.createdAt));
    stmt.bind(6, core::util::formatTimestamp(stored.updatedAt));

    stmt.step();
    spdlog::debug("Inserted datacenter: {} (ID: {})", stored.name, stored.id);
    return stored;
}

std::optional<core::Datacenter> DatacenterRepository::findById(const std::string& id) {
    auto stmt = db_->prepare(R"(
        SELECT id, name, location, description, created_at, updated_at
        FROM datacenters WHERE id = ?
    )");
    stmt.bind(1, id);

    if (stmt.step()) {
        return rowToDatacenter(stmt);
    }
    return std::nullopt;
}

std::vector<core::Datacenter> DatacenterRepository::findAll() {
    std::vector<core::Datacenter> results;
    auto stmt = db_->prepare(R"(
        SELECT id, name, location, description, created_at, updated_at
        FROM datacenters ORDER BY name
    )");

    while (stmt.step()) {
        results.push_back(rowToDatacenter(stmt));
    }
    return results;
}

} // namespace rackscan::infra
