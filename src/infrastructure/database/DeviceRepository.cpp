#include "infrastructure/database/DeviceRepository.hpp"

#include "core/util/Time.hpp"
#include "core/util/Uuid.hpp"

#include <spdlog/spdlog.h>

namespace rackscan::infra {

DeviceRepository::DeviceRepository(std::shared_ptr<Database> db) : db_(std::move(db)) {}

core::Device DeviceRepository::insert(const core::Device& device) {
    core::Device stored = device;
    if (stored.id.empty()) {
        stored.id = core::util::generateUuid();
    }
    stored.createdAt = core::util::now();
    stored.updatedAt = stored.createdAt;

    db_->transaction([&] {
        auto stmt = db_->prepare(R"(
            INSERT INTO devices (id, datacenter_id, name, description, make_model, os,
                                 username, location, created_at, updated_at)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        )");

        stmt.bind(1, stored.id);
        stmt.bindTextOrNull(2, stored.datacenterId);
        stmt.bind(3, stored.name);
        stmt.bindTextOrNull(4, stored.description);
        stmt.bindTextOrNull(5, stored.makeModel);
        stmt.bindTextOrNull(6, stored.os);
        stmt.bindTextOrNull(7, stored.username);
        stmt.bindTextOrNull(8, stored.location);
        stmt.bind(9, core::util::formatTimestamp(stored.createdAt));
        stmt.bind(10, core::util::formatTimestamp(stored.updatedAt));
        stmt.step();

        for (const auto& address : stored.addresses) {
            auto addrStmt = db_->prepare(R"(
                INSERT INTO addresses (device_id, ip, port, type, label, network_id, switch_port)
                VALUES (?, ?, ?, ?, ?, ?, ?)
            )");
            addrStmt.bind(1, stored.id);
            addrStmt.bind(2, address.ip);
            addrStmt.bind(3, address.port);
            addrStmt.bind(4, address.type);
            addrStmt.bind(5, address.label);
            addrStmt.bindTextOrNull(6, address.networkId);
            addrStmt.bindTextOrNull(7, address.switchPort);
            addrStmt.step();
        }

        for (const auto& tag : stored.tags) {
            auto tagStmt = db_->prepare("INSERT INTO tags (device_id, tag) VALUES (?, ?)");
            tagStmt.bind(1, stored.id);
            tagStmt.bind(2, tag);
            tagStmt.step();
        }

        for (const auto& domain : stored.domains) {
            auto domainStmt = db_->prepare("INSERT INTO domains (device_id, domain) VALUES (?, ?)");
            domainStmt.bind(1, stored.id);
            domainStmt.bind(2, domain);
            domainStmt.step();
        }
    });

    spdlog::debug("Inserted device: {} (ID: {})", stored.name, stored.id);
    return stored;
}

std::optional<core::Device> DeviceRepository::findById(const std::string& id) {
    auto stmt = db_->prepare(R"(
        SELECT id, datacenter_id, name, description, make_model, os, username, location,
               created_at, updated_at
        FROM devices WHERE id = ?
    )");
    stmt.bind(1, id);

    if (!stmt.step()) {
        return std::nullopt;
    }

    core::Device device;
    device.id = stmt.columnText(0);
    device.datacenterId = stmt.columnText(1);
    device.name = stmt.columnText(2);
    device.description = stmt.columnText(3);
    device.makeModel = stmt.columnText(4);
    device.os = stmt.columnText(5);
    device.username = stmt.columnText(6);
    device.location = stmt.columnText(7);
    device.createdAt = core::util::parseTimestamp(stmt.columnText(8));
    device.updatedAt = core::util::parseTimestamp(stmt.columnText(9));

    auto addrStmt = db_->prepare(R"(
        SELECT ip, port, type, label, network_id, switch_port
        FROM addresses WHERE device_id = ? ORDER BY rowid
    )");
    addrStmt.bind(1, id);
    while (addrStmt.step()) {
        core::Address address;
        address.ip = addrStmt.columnText(0);
        address.port = addrStmt.columnInt(1);
        address.type = addrStmt.columnText(2);
        address.label = addrStmt.columnText(3);
        address.networkId = addrStmt.columnText(4);
        address.switchPort = addrStmt.columnText(5);
        device.addresses.push_back(address);
    }

    auto tagStmt = db_->prepare("SELECT tag FROM tags WHERE device_id = ? ORDER BY tag");
    tagStmt.bind(1, id);
    while (tagStmt.step()) {
        device.tags.push_back(tagStmt.columnText(0));
    }

    auto domainStmt = db_->prepare("SELECT domain FROM domains WHERE device_id = ? ORDER BY domain");
    domainStmt.bind(1, id);
    while (domainStmt.step()) {
        device.domains.push_back(domainStmt.columnText(0));
    }

    return device;
}

int DeviceRepository::count() {
    auto stmt = db_->prepare("SELECT COUNT(*) FROM devices");
    return stmt.step() ? stmt.columnInt(0) : 0;
}

} // namespace rackscan::infra
