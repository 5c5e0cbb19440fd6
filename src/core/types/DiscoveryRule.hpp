/**
 * @file DiscoveryRule.hpp
 * @brief Per-network discovery configuration.
 */

#pragma once

#include "core/types/DiscoveryScan.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace rackscan::core {

/**
 * @brief Port selection policy for rule-driven scans.
 */
enum class PortScanType : int {
    Common = 0, ///< Well-known liveness ports
    Full = 1,   ///< Every TCP port
    Custom = 2  ///< The rule's customPorts list
};

/**
 * @brief Scan configuration for one network.
 *
 * At most one rule exists per network. The TCP discovery engine reads the
 * timeout, concurrency and exclusion fields; port selection, service and OS
 * detection flags are carried for richer scanners.
 */
struct DiscoveryRule {
    std::string id;                     ///< Unique identifier
    std::string networkId;              ///< Network the rule applies to (unique)
    bool enabled{true};                 ///< Whether the scheduler runs this rule
    int scanIntervalHours{24};          ///< Hours between scheduled runs
    ScanType scanType{ScanType::Full};  ///< Depth label given to scans
    int maxConcurrentScans{10};         ///< Hosts probed in parallel
    int timeoutSeconds{5};              ///< Per-port connect deadline
    bool scanPorts{true};               ///< Whether to probe ports
    PortScanType portScanType{PortScanType::Common}; ///< Port selection policy
    std::vector<int> customPorts;       ///< Ports for PortScanType::Custom
    bool serviceDetection{true};        ///< Detect services on open ports
    bool osDetection{true};             ///< Guess operating systems
    std::vector<std::string> excludeIps;   ///< Literal IPs or CIDRs skipped during enumeration
    std::vector<std::string> excludeHosts; ///< Hostnames to skip
    std::optional<std::chrono::system_clock::time_point> lastRunAt; ///< Last scheduled run
    std::optional<std::chrono::system_clock::time_point> nextRunAt; ///< Next scheduled run
    std::chrono::system_clock::time_point createdAt; ///< Record creation time
    std::chrono::system_clock::time_point updatedAt; ///< Record update time

    /**
     * @brief Converts a PortScanType to its lowercase name.
     * @param type The port scan type.
     * @return "common", "full" or "custom".
     */
    static std::string portScanTypeToString(PortScanType type);

    /**
     * @brief Parses a port scan type name.
     * @param str The name to parse.
     * @return The matching PortScanType, Common if not recognized.
     */
    static PortScanType portScanTypeFromString(const std::string& str);
};

} // namespace rackscan::core
