#include "infrastructure/database/DiscoveredDeviceRepository.hpp"

#include "core/types/Errors.hpp"
#include "core/types/JsonSerialization.hpp"
#include "core/util/Time.hpp"
#include "core/util/Uuid.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace rackscan::infra {

namespace {

constexpr const char* kSelectColumns = R"(
    SELECT id, ip, mac_address, hostname, network_id, status, confidence,
           os_guess, os_family, open_ports, services, first_seen, last_seen,
           last_scan_id, promoted_to_device_id, promoted_at, raw_scan_data,
           created_at, updated_at
    FROM discovered_devices
)";

std::vector<int> portsFromJson(const std::string& text) {
    std::vector<int> ports;
    if (text.empty()) {
        return ports;
    }
    try {
        ports = nlohmann::json::parse(text).get<std::vector<int>>();
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Failed to parse open_ports JSON: {}", e.what());
    }
    return ports;
}

std::vector<core::ServiceInfo> servicesFromJson(const std::string& text) {
    std::vector<core::ServiceInfo> services;
    if (text.empty()) {
        return services;
    }
    try {
        services = nlohmann::json::parse(text).get<std::vector<core::ServiceInfo>>();
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Failed to parse services JSON: {}", e.what());
    }
    return services;
}

core::DiscoveredDevice rowToDevice(Statement& stmt) {
    core::DiscoveredDevice device;
    device.id = stmt.columnText(0);
    device.ip = stmt.columnText(1);
    device.macAddress = stmt.columnText(2);
    device.hostname = stmt.columnText(3);
    device.networkId = stmt.columnText(4);
    device.status = core::DiscoveredDevice::statusFromString(stmt.columnText(5));
    device.confidence = stmt.columnInt(6);
    device.osGuess = stmt.columnText(7);
    device.osFamily = stmt.columnText(8);
    device.openPorts = portsFromJson(stmt.columnText(9));
    device.services = servicesFromJson(stmt.columnText(10));
    device.firstSeen = core::util::parseTimestamp(stmt.columnText(11));
    device.lastSeen = core::util::parseTimestamp(stmt.columnText(12));
    device.lastScanId = stmt.columnText(13);
    device.promotedToDeviceId = stmt.columnText(14);
    if (!stmt.columnIsNull(15)) {
        device.promotedAt = core::util::parseTimestamp(stmt.columnText(15));
    }
    device.rawScanData = stmt.columnText(16);
    device.createdAt = core::util::parseTimestamp(stmt.columnText(17));
    device.updatedAt = core::util::parseTimestamp(stmt.columnText(18));
    return device;
}

} // namespace

DiscoveredDeviceRepository::DiscoveredDeviceRepository(std::shared_ptr<Database> db)
    : db_(std::move(db)) {}

core::DiscoveredDevice DiscoveredDeviceRepository::createOrUpdate(const core::DiscoveredDevice& device) {
    core::DiscoveredDevice stored;

    db_->transaction([&] {
        auto now = core::util::now();
        auto existing = findByIp(device.ip);

        stored = device;
        stored.updatedAt = now;
        if (stored.lastSeen == std::chrono::system_clock::time_point{}) {
            stored.lastSeen = now;
        }

        if (existing) {
            stored.id = existing->id;
            stored.networkId = existing->networkId;
            stored.firstSeen = existing->firstSeen;
            stored.createdAt = existing->createdAt;
            stored.promotedToDeviceId = existing->promotedToDeviceId;
            stored.promotedAt = existing->promotedAt;
            stored.confidence = std::max(existing->confidence, device.confidence);
            if (stored.macAddress.empty()) {
                stored.macAddress = existing->macAddress;
            }
            if (stored.hostname.empty()) {
                stored.hostname = existing->hostname;
            }

            auto stmt = db_->prepare(R"(
                UPDATE discovered_devices SET
                    mac_address = ?, hostname = ?, status = ?, confidence = ?,
                    os_guess = ?, os_family = ?, open_ports = ?, services = ?,
                    last_seen = ?, last_scan_id = ?, raw_scan_data = ?, updated_at = ?
                WHERE id = ?
            )");

            stmt.bindTextOrNull(1, stored.macAddress);
            stmt.bindTextOrNull(2, stored.hostname);
            stmt.bind(3, stored.statusToString());
            stmt.bind(4, stored.confidence);
            stmt.bindTextOrNull(5, stored.osGuess);
            stmt.bindTextOrNull(6, stored.osFamily);
            stmt.bind(7, nlohmann::json(stored.openPorts).dump());
            stmt.bind(8, nlohmann::json(stored.services).dump());
            stmt.bind(9, core::util::formatTimestamp(stored.lastSeen));
            stmt.bindTextOrNull(10, stored.lastScanId);
            stmt.bindTextOrNull(11, stored.rawScanData);
            stmt.bind(12, core::util::formatTimestamp(stored.updatedAt));
            stmt.bind(13, stored.id);
            stmt.step();

            spdlog::debug("Updated discovered device {} (confidence {})", stored.ip,
                          stored.confidence);
            return;
        }

        if (stored.id.empty()) {
            stored.id = core::util::generateUuid();
        }
        stored.firstSeen = now;
        stored.createdAt = now;
        stored.promotedToDeviceId.clear();
        stored.promotedAt.reset();

        auto stmt = db_->prepare(R"(
            INSERT INTO discovered_devices
                (id, ip, mac_address, hostname, network_id, status, confidence,
                 os_guess, os_family, open_ports, services, first_seen, last_seen,
                 last_scan_id, raw_scan_data, created_at, updated_at)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        )");

        stmt.bind(1, stored.id);
        stmt.bind(2, stored.ip);
        stmt.bindTextOrNull(3, stored.macAddress);
        stmt.bindTextOrNull(4, stored.hostname);
        stmt.bind(5, stored.networkId);
        stmt.bind(6, stored.statusToString());
        stmt.bind(7, stored.confidence);
        stmt.bindTextOrNull(8, stored.osGuess);
        stmt.bindTextOrNull(9, stored.osFamily);
        stmt.bind(10, nlohmann::json(stored.openPorts).dump());
        stmt.bind(11, nlohmann::json(stored.services).dump());
        stmt.bind(12, core::util::formatTimestamp(stored.firstSeen));
        stmt.bind(13, core::util::formatTimestamp(stored.lastSeen));
        stmt.bindTextOrNull(14, stored.lastScanId);
        stmt.bindTextOrNull(15, stored.rawScanData);
        stmt.bind(16, core::util::formatTimestamp(stored.createdAt));
        stmt.bind(17, core::util::formatTimestamp(stored.updatedAt));
        stmt.step();

        spdlog::debug("Inserted discovered device {} (id: {})", stored.ip, stored.id);
    });

    return stored;
}

std::optional<core::DiscoveredDevice> DiscoveredDeviceRepository::findById(const std::string& id) {
    auto stmt = db_->prepare(std::string(kSelectColumns) + " WHERE id = ?");
    stmt.bind(1, id);

    if (stmt.step()) {
        return rowToDevice(stmt);
    }
    return std::nullopt;
}

std::optional<core::DiscoveredDevice> DiscoveredDeviceRepository::findByIp(const std::string& ip) {
    auto stmt = db_->prepare(std::string(kSelectColumns) + " WHERE ip = ?");
    stmt.bind(1, ip);

    if (stmt.step()) {
        return rowToDevice(stmt);
    }
    return std::nullopt;
}

std::vector<core::DiscoveredDevice> DiscoveredDeviceRepository::list(
    const core::DiscoveredDeviceFilter& filter) {
    std::string sql = std::string(kSelectColumns) + " WHERE 1=1";
    if (!filter.networkId.empty()) {
        sql += " AND network_id = ?";
    }
    if (filter.status) {
        sql += " AND status = ?";
    }
    if (filter.promoted) {
        sql += *filter.promoted ? " AND promoted_to_device_id IS NOT NULL"
                                : " AND promoted_to_device_id IS NULL";
    }
    if (filter.minConfidence > 0) {
        sql += " AND confidence >= ?";
    }
    sql += " ORDER BY last_seen DESC, ip";

    auto stmt = db_->prepare(sql);
    int index = 1;
    if (!filter.networkId.empty()) {
        stmt.bind(index++, filter.networkId);
    }
    if (filter.status) {
        stmt.bind(index++, core::DiscoveredDevice::deviceStatusToString(*filter.status));
    }
    if (filter.minConfidence > 0) {
        stmt.bind(index++, filter.minConfidence);
    }

    std::vector<core::DiscoveredDevice> results;
    while (stmt.step()) {
        results.push_back(rowToDevice(stmt));
    }
    return results;
}

void DiscoveredDeviceRepository::remove(const std::string& id) {
    db_->transaction([&] {
        auto stmt = db_->prepare("DELETE FROM discovered_devices WHERE id = ?");
        stmt.bind(1, id);
        stmt.step();

        if (db_->changes() == 0) {
            throw core::DiscoveryError(core::ErrorCode::NotFound,
                                       "discovered device not found: " + id);
        }
    });
    spdlog::debug("Removed discovered device: {}", id);
}

void DiscoveredDeviceRepository::markPromoted(const std::string& id, const std::string& deviceId,
                                              std::chrono::system_clock::time_point promotedAt) {
    db_->transaction([&] {
        auto stmt = db_->prepare(R"(
            UPDATE discovered_devices
            SET promoted_to_device_id = ?, promoted_at = ?, updated_at = ?
            WHERE id = ? AND promoted_to_device_id IS NULL
        )");

        stmt.bind(1, deviceId);
        stmt.bind(2, core::util::formatTimestamp(promotedAt));
        stmt.bind(3, core::util::formatTimestamp(core::util::now()));
        stmt.bind(4, id);
        stmt.step();

        if (db_->changes() == 0) {
            if (findById(id)) {
                throw core::DiscoveryError(core::ErrorCode::AlreadyPromoted,
                                           "discovered device already promoted: " + id);
            }
            throw core::DiscoveryError(core::ErrorCode::NotFound,
                                       "discovered device not found: " + id);
        }
    });
}

int DiscoveredDeviceRepository::cleanupOlderThan(int days) {
    auto cutoff = core::util::now() - std::chrono::hours(24 * days);
    int removed = 0;

    db_->transaction([&] {
        auto stmt = db_->prepare(R"(
            DELETE FROM discovered_devices
            WHERE last_seen < ? AND promoted_to_device_id IS NULL
        )");
        stmt.bind(1, core::util::formatTimestamp(cutoff));
        stmt.step();
        removed = db_->changes();
    });

    spdlog::info("Cleaned up {} discovered devices not seen for {} days", removed, days);
    return removed;
}

} // namespace rackscan::infra
