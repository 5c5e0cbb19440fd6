#include "infrastructure/database/DiscoveryScanRepository.hpp"

#include "core/types/Errors.hpp"
#include "core/util/Time.hpp"
#include "core/util/Uuid.hpp"

#include <spdlog/spdlog.h>

namespace rackscan::infra {

namespace {

constexpr const char* kSelectColumns = R"(
    SELECT id, network_id, status, scan_type, scan_depth, total_hosts, scanned_hosts,
           found_hosts, started_at, completed_at, duration_seconds, error_message,
           created_at, updated_at
    FROM discovery_scans
)";

void bindOptionalTime(Statement& stmt, int index,
                      const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (tp) {
        stmt.bind(index, core::util::formatTimestamp(*tp));
    } else {
        stmt.bindNull(index);
    }
}

core::DiscoveryScan rowToScan(Statement& stmt) {
    core::DiscoveryScan scan;
    scan.id = stmt.columnText(0);
    scan.networkId = stmt.columnText(1);
    scan.status = core::DiscoveryScan::statusFromString(stmt.columnText(2));
    scan.scanType = core::scanTypeFromString(stmt.columnText(3));
    scan.scanDepth = stmt.columnInt(4);
    scan.totalHosts = stmt.columnInt(5);
    scan.scannedHosts = stmt.columnInt(6);
    scan.foundHosts = stmt.columnInt(7);
    if (!stmt.columnIsNull(8)) {
        scan.startedAt = core::util::parseTimestamp(stmt.columnText(8));
    }
    if (!stmt.columnIsNull(9)) {
        scan.completedAt = core::util::parseTimestamp(stmt.columnText(9));
    }
    scan.durationSeconds = stmt.columnInt(10);
    scan.errorMessage = stmt.columnText(11);
    scan.createdAt = core::util::parseTimestamp(stmt.columnText(12));
    scan.updatedAt = core::util::parseTimestamp(stmt.columnText(13));
    return scan;
}

} // namespace

DiscoveryScanRepository::DiscoveryScanRepository(std::shared_ptr<Database> db) : db_(std::move(db)) {}

core::DiscoveryScan DiscoveryScanRepository::insert(const core::DiscoveryScan& scan) {
    core::DiscoveryScan stored = scan;
    if (stored.id.empty()) {
        stored.id = core::util::generateUuid();
    }
    stored.createdAt = core::util::now();
    stored.updatedAt = stored.createdAt;

    auto stmt = db_->prepare(R"(
        INSERT INTO discovery_scans (id, network_id, status, scan_type, scan_depth,
                                     total_hosts, scanned_hosts, found_hosts, progress_percent,
                                     started_at, completed_at, duration_seconds, error_message,
                                     created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");

    stmt.bind(1, stored.id);
    stmt.bind(2, stored.networkId);
    stmt.bind(3, stored.statusToString());
    stmt.bind(4, core::scanTypeToString(stored.scanType));
    stmt.bind(5, stored.scanDepth);
    stmt.bind(6, stored.totalHosts);
    stmt.bind(7, stored.scannedHosts);
    stmt.bind(8, stored.foundHosts);
    stmt.bind(9, stored.progressPercent());
    bindOptionalTime(stmt, 10, stored.startedAt);
    bindOptionalTime(stmt, 11, stored.completedAt);
    stmt.bind(12, stored.durationSeconds);
    stmt.bindTextOrNull(13, stored.errorMessage);
    stmt.bind(14, core::util::formatTimestamp(stored.createdAt));
    stmt.bind(15, core::util::formatTimestamp(stored.updatedAt));

    stmt.step();
    spdlog::debug("Inserted discovery scan {} for network {}", stored.id, stored.networkId);
    return stored;
}

void DiscoveryScanRepository::update(const core::DiscoveryScan& scan) {
    db_->transaction([&] {
        core::DiscoveryScan stored;
        {
            auto current = db_->prepare(
                "SELECT status, scanned_hosts FROM discovery_scans WHERE id = ?");
            current.bind(1, scan.id);
            if (!current.step()) {
                throw core::DiscoveryError(core::ErrorCode::NotFound,
                                           "discovery scan not found: " + scan.id);
            }
            stored.status = core::DiscoveryScan::statusFromString(current.columnText(0));
            stored.scannedHosts = current.columnInt(1);
        }

        if (stored.isTerminal()) {
            throw core::DiscoveryError(core::ErrorCode::InvalidRequest,
                                       "discovery scan " + scan.id + " already " +
                                           stored.statusToString());
        }
        stored.advanceTo(scan.status);
        if (scan.scannedHosts < stored.scannedHosts) {
            throw core::DiscoveryError(
                core::ErrorCode::InvalidRequest,
                "scanned hosts of discovery scan " + scan.id + " cannot go from " +
                    std::to_string(stored.scannedHosts) + " to " +
                    std::to_string(scan.scannedHosts));
        }

        auto stmt = db_->prepare(R"(
            UPDATE discovery_scans SET
                status = ?, scan_type = ?, scan_depth = ?, total_hosts = ?, scanned_hosts = ?,
                found_hosts = ?, progress_percent = ?, started_at = ?, completed_at = ?,
                duration_seconds = ?, error_message = ?, updated_at = ?
            WHERE id = ?
        )");

        stmt.bind(1, scan.statusToString());
        stmt.bind(2, core::scanTypeToString(scan.scanType));
        stmt.bind(3, scan.scanDepth);
        stmt.bind(4, scan.totalHosts);
        stmt.bind(5, scan.scannedHosts);
        stmt.bind(6, scan.foundHosts);
        stmt.bind(7, scan.progressPercent());
        bindOptionalTime(stmt, 8, scan.startedAt);
        bindOptionalTime(stmt, 9, scan.completedAt);
        stmt.bind(10, scan.durationSeconds);
        stmt.bindTextOrNull(11, scan.errorMessage);
        stmt.bind(12, core::util::formatTimestamp(core::util::now()));
        stmt.bind(13, scan.id);
        stmt.step();
    });
    spdlog::debug("Updated discovery scan {}: {} {}/{}", scan.id, scan.statusToString(),
                  scan.scannedHosts, scan.totalHosts);
}

void DiscoveryScanRepository::remove(const std::string& id) {
    db_->transaction([&] {
        auto stmt = db_->prepare("DELETE FROM discovery_scans WHERE id = ?");
        stmt.bind(1, id);
        stmt.step();

        if (db_->changes() == 0) {
            throw core::DiscoveryError(core::ErrorCode::NotFound, "discovery scan not found: " + id);
        }
    });
    spdlog::debug("Removed discovery scan: {}", id);
}

std::optional<core::DiscoveryScan> DiscoveryScanRepository::findById(const std::string& id) {
    auto stmt = db_->prepare(std::string(kSelectColumns) + " WHERE id = ?");
    stmt.bind(1, id);

    if (stmt.step()) {
        return rowToScan(stmt);
    }
    return std::nullopt;
}

std::vector<core::DiscoveryScan> DiscoveryScanRepository::list(const std::string& networkId) {
    std::string sql = kSelectColumns;
    if (!networkId.empty()) {
        sql += " WHERE network_id = ?";
    }
    sql += " ORDER BY created_at DESC, rowid DESC";

    auto stmt = db_->prepare(sql);
    if (!networkId.empty()) {
        stmt.bind(1, networkId);
    }

    std::vector<core::DiscoveryScan> results;
    while (stmt.step()) {
        results.push_back(rowToScan(stmt));
    }
    return results;
}

} // namespace rackscan::infra
