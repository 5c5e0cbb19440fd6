#include "core/types/JsonSerialization.hpp"

#include "core/util/Time.hpp"

namespace rackscan::core {

void to_json(nlohmann::json& j, const ServiceInfo& service) {
    j = nlohmann::json{{"port", service.port},         {"protocol", service.protocol},
                       {"service", service.service},   {"version", service.version},
                       {"product", service.product},   {"banner", service.banner}};
}

void from_json(const nlohmann::json& j, ServiceInfo& service) {
    service.port = j.value("port", 0);
    service.protocol = j.value("protocol", "");
    service.service = j.value("service", "");
    service.version = j.value("version", "");
    service.product = j.value("product", "");
    service.banner = j.value("banner", "");
}

void to_json(nlohmann::json& j, const Address& address) {
    j = nlohmann::json{{"ip", address.ip},
                       {"port", address.port},
                       {"type", address.type},
                       {"label", address.label},
                       {"network_id", address.networkId},
                       {"switch_port", address.switchPort}};
}

void to_json(nlohmann::json& j, const Device& device) {
    j = nlohmann::json{{"id", device.id},
                       {"name", device.name},
                       {"description", device.description},
                       {"make_model", device.makeModel},
                       {"os", device.os},
                       {"datacenter_id", device.datacenterId},
                       {"username", device.username},
                       {"location", device.location},
                       {"tags", device.tags},
                       {"addresses", device.addresses},
                       {"domains", device.domains}};
}

void to_json(nlohmann::json& j, const DiscoveredDevice& device) {
    j = nlohmann::json{{"id", device.id},
                       {"ip", device.ip},
                       {"mac_address", device.macAddress},
                       {"hostname", device.hostname},
                       {"network_id", device.networkId},
                       {"status", device.statusToString()},
                       {"confidence", device.confidence},
                       {"os_guess", device.osGuess},
                       {"os_family", device.osFamily},
                       {"open_ports", device.openPorts},
                       {"services", device.services},
                       {"first_seen", util::formatTimestamp(device.firstSeen)},
                       {"last_seen", util::formatTimestamp(device.lastSeen)},
                       {"last_scan_id", device.lastScanId}};
    if (device.isPromoted()) {
        j["promoted_to_device_id"] = device.promotedToDeviceId;
    }
    if (device.promotedAt) {
        j["promoted_at"] = util::formatTimestamp(*device.promotedAt);
    }
}

void to_json(nlohmann::json& j, const DiscoveryScan& scan) {
    j = nlohmann::json{{"id", scan.id},
                       {"network_id", scan.networkId},
                       {"status", scan.statusToString()},
                       {"scan_type", scanTypeToString(scan.scanType)},
                       {"scan_depth", scan.scanDepth},
                       {"total_hosts", scan.totalHosts},
                       {"scanned_hosts", scan.scannedHosts},
                       {"found_hosts", scan.foundHosts},
                       {"progress_percent", scan.progressPercent()},
                       {"duration_seconds", scan.durationSeconds}};
    if (scan.startedAt) {
        j["started_at"] = util::formatTimestamp(*scan.startedAt);
    }
    if (scan.completedAt) {
        j["completed_at"] = util::formatTimestamp(*scan.completedAt);
    }
    if (!scan.errorMessage.empty()) {
        j["error_message"] = scan.errorMessage;
    }
}

} // namespace rackscan::core
