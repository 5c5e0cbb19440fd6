#include "infrastructure/database/DiscoveryRuleRepository.hpp"

#include "core/types/Errors.hpp"
#include "core/util/Time.hpp"
#include "core/util/Uuid.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace rackscan::infra {

namespace {

template <typename T>
std::vector<T> listFromJson(const std::string& text, const char* column) {
    std::vector<T> values;
    if (text.empty()) {
        return values;
    }
    try {
        values = nlohmann::json::parse(text).get<std::vector<T>>();
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Failed to parse {} JSON: {}", column, e.what());
    }
    return values;
}

void bindOptionalTime(Statement& stmt, int index,
                      const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (tp) {
        stmt.bind(index, core::util::formatTimestamp(*tp));
    } else {
        stmt.bindNull(index);
    }
}

// Binds the 15 mutable rule columns starting at index 1
void bindRuleColumns(Statement& stmt, const core::DiscoveryRule& rule) {
    stmt.bind(1, rule.networkId);
    stmt.bind(2, rule.enabled ? 1 : 0);
    stmt.bind(3, rule.scanIntervalHours);
    stmt.bind(4, core::scanTypeToString(rule.scanType));
    stmt.bind(5, rule.maxConcurrentScans);
    stmt.bind(6, rule.timeoutSeconds);
    stmt.bind(7, rule.scanPorts ? 1 : 0);
    stmt.bind(8, core::DiscoveryRule::portScanTypeToString(rule.portScanType));
    stmt.bind(9, nlohmann::json(rule.customPorts).dump());
    stmt.bind(10, rule.serviceDetection ? 1 : 0);
    stmt.bind(11, rule.osDetection ? 1 : 0);
    stmt.bind(12, nlohmann::json(rule.excludeIps).dump());
    stmt.bind(13, nlohmann::json(rule.excludeHosts).dump());
    bindOptionalTime(stmt, 14, rule.lastRunAt);
    bindOptionalTime(stmt, 15, rule.nextRunAt);
}

core::DiscoveryRule rowToRule(Statement& stmt) {
    core::DiscoveryRule rule;
    rule.id = stmt.columnText(0);
    rule.networkId = stmt.columnText(1);
    rule.enabled = stmt.columnInt(2) != 0;
    rule.scanIntervalHours = stmt.columnInt(3);
    rule.scanType = core::scanTypeFromString(stmt.columnText(4));
    rule.maxConcurrentScans = stmt.columnInt(5);
    rule.timeoutSeconds = stmt.columnInt(6);
    rule.scanPorts = stmt.columnInt(7) != 0;
    rule.portScanType = core::DiscoveryRule::portScanTypeFromString(stmt.columnText(8));
    rule.customPorts = listFromJson<int>(stmt.columnText(9), "custom_ports");
    rule.serviceDetection = stmt.columnInt(10) != 0;
    rule.osDetection = stmt.columnInt(11) != 0;
    rule.excludeIps = listFromJson<std::string>(stmt.columnText(12), "exclude_ips");
    rule.excludeHosts = listFromJson<std::string>(stmt.columnText(13), "exclude_hosts");
    if (!stmt.columnIsNull(14)) {
        rule.lastRunAt = core::util::parseTimestamp(stmt.columnText(14));
    }
    if (!stmt.columnIsNull(15)) {
        rule.nextRunAt = core::util::parseTimestamp(stmt.columnText(15));
    }
    rule.createdAt = core::util::parseTimestamp(stmt.columnText(16));
    rule.updatedAt = core::util::parseTimestamp(stmt.columnText(17));
    return rule;
}

} // namespace

DiscoveryRuleRepository::DiscoveryRuleRepository(std::shared_ptr<Database> db) : db_(std::move(db)) {}

core::DiscoveryRule DiscoveryRuleRepository::insert(const core::DiscoveryRule& rule) {
    core::DiscoveryRule stored = rule;
    if (stored.id.empty()) {
        stored.id = core::util::generateUuid();
    }
    stored.createdAt = core::util::now();
    stored.updatedAt = stored.createdAt;

    auto stmt = db_->prepare(R"(
        INSERT INTO discovery_rules (network_id, enabled, scan_interval_hours, scan_type,
                                     max_concurrent_scans, timeout_seconds, scan_ports,
                                     port_scan_type, custom_ports, service_detection,
                                     os_detection, exclude_ips, exclude_hosts, last_run_at,
                                     next_run_at, id, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");

    bindRuleColumns(stmt, stored);
    stmt.bind(16, stored.id);
    stmt.bind(17, core::util::formatTimestamp(stored.createdAt));
    stmt.bind(18, core::util::formatTimestamp(stored.updatedAt));

    stmt.step();
    spdlog::debug("Inserted discovery rule {} for network {}", stored.id, stored.networkId);
    return stored;
}

void DiscoveryRuleRepository::update(const core::DiscoveryRule& rule) {
    db_->transaction([&] {
        auto stmt = db_->prepare(R"(
            UPDATE discovery_rules SET
                network_id = ?, enabled = ?, scan_interval_hours = ?, scan_type = ?,
                max_concurrent_scans = ?, timeout_seconds = ?, scan_ports = ?,
                port_scan_type = ?, custom_ports = ?, service_detection = ?, os_detection = ?,
                exclude_ips = ?, exclude_hosts = ?, last_run_at = ?, next_run_at = ?,
                updated_at = ?
            WHERE id = ?
        )");

        bindRuleColumns(stmt, rule);
        stmt.bind(16, core::util::formatTimestamp(core::util::now()));
        stmt.bind(17, rule.id);
        stmt.step();

        if (db_->changes() == 0) {
            throw core::DiscoveryError(core::ErrorCode::NotFound,
                                       "discovery rule not found: " + rule.id);
        }
    });
    spdlog::debug("Updated discovery rule: {}", rule.id);
}

void DiscoveryRuleRepository::remove(const std::string& id) {
    db_->transaction([&] {
        auto stmt = db_->prepare("DELETE FROM discovery_rules WHERE id = ?");
        stmt.bind(1, id);
        stmt.step();

        if (db_->changes() == 0) {
            throw core::DiscoveryError(core::ErrorCode::NotFound, "discovery rule not found: " + id);
        }
    });
    spdlog::debug("Removed discovery rule: {}", id);
}

std::optional<core::DiscoveryRule> DiscoveryRuleRepository::findById(const std::string& id) {
    auto rules = select("WHERE id = ?", id);
    if (rules.empty()) {
        return std::nullopt;
    }
    return rules.front();
}

std::optional<core::DiscoveryRule> DiscoveryRuleRepository::findByNetwork(const std::string& networkId) {
    auto rules = select("WHERE network_id = ?", networkId);
    if (rules.empty()) {
        return std::nullopt;
    }
    return rules.front();
}

std::vector<core::DiscoveryRule> DiscoveryRuleRepository::list(const std::string& networkId) {
    if (networkId.empty()) {
        return select("", "");
    }
    return select("WHERE network_id = ?", networkId);
}

std::vector<core::DiscoveryRule> DiscoveryRuleRepository::findEnabled() {
    return select("WHERE enabled = 1", "");
}

void DiscoveryRuleRepository::updateRunTimes(const std::string& id,
                                             std::chrono::system_clock::time_point lastRun,
                                             std::chrono::system_clock::time_point nextRun) {
    auto stmt = db_->prepare(
        "UPDATE discovery_rules SET last_run_at = ?, next_run_at = ?, updated_at = ? WHERE id = ?");
    stmt.bind(1, core::util::formatTimestamp(lastRun));
    stmt.bind(2, core::util::formatTimestamp(nextRun));
    stmt.bind(3, core::util::formatTimestamp(core::util::now()));
    stmt.bind(4, id);
    stmt.step();
}

std::vector<core::DiscoveryRule> DiscoveryRuleRepository::select(const std::string& where,
                                                                 const std::string& param) {
    auto stmt = db_->prepare(R"(
        SELECT id, network_id, enabled, scan_interval_hours, scan_type, max_concurrent_scans,
               timeout_seconds, scan_ports, port_scan_type, custom_ports, service_detection,
               os_detection, exclude_ips, exclude_hosts, last_run_at, next_run_at,
               created_at, updated_at
        FROM discovery_rules )" + where + " ORDER BY network_id");

    if (!param.empty()) {
        stmt.bind(1, param);
    }

    std::vector<core::DiscoveryRule> results;
    while (stmt.step()) {
        results.push_back(rowToRule(stmt));
    }
    return results;
}

} // namespace rackscan::infra
