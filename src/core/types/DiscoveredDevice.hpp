/**
 * @file DiscoveredDevice.hpp
 * @brief Provisional records of hosts observed by network discovery.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace rackscan::core {

/**
 * @brief Liveness of a discovered host as seen by its latest probe.
 */
enum class DeviceStatus : int {
    Unknown = 0, ///< Never probed or state could not be determined
    Online = 1,  ///< At least one probe succeeded
    Offline = 2  ///< No probe succeeded
};

/**
 * @brief Service detected on an open port.
 */
struct ServiceInfo {
    int port{0};          ///< Port number
    std::string protocol; ///< Transport protocol ("tcp")
    std::string service;  ///< Service name, e.g. "ssh"
    std::string version;  ///< Detected version string
    std::string product;  ///< Detected product name
    std::string banner;   ///< Raw banner text

    bool operator==(const ServiceInfo& other) const = default;
};

/**
 * @brief A host observed on a network, keyed uniquely by IP.
 *
 * The same structure is used for the unpersisted draft produced by a probe
 * and for the stored record. first_seen is set once and the stored
 * confidence never decreases.
 */
struct DiscoveredDevice {
    std::string id;          ///< Unique identifier
    std::string ip;          ///< IP address (unique within the store)
    std::string macAddress;  ///< MAC address if known
    std::string hostname;    ///< Reverse DNS name if resolved
    std::string networkId;   ///< Network the host was found on
    DeviceStatus status{DeviceStatus::Unknown}; ///< Latest liveness
    int confidence{0};       ///< Evidence score, 0-100
    std::string osGuess;     ///< Operating system guess
    std::string osFamily;    ///< Operating system family
    std::vector<int> openPorts;         ///< Ports that accepted a connection
    std::vector<ServiceInfo> services;  ///< Services detected on open ports
    std::chrono::system_clock::time_point firstSeen; ///< First observation
    std::chrono::system_clock::time_point lastSeen;  ///< Latest observation
    std::string lastScanId;              ///< Scan that produced the latest observation
    std::string promotedToDeviceId;      ///< Inventory device id once promoted
    std::optional<std::chrono::system_clock::time_point> promotedAt; ///< Promotion time
    std::string rawScanData;             ///< Opaque scanner output
    std::chrono::system_clock::time_point createdAt; ///< Row creation time
    std::chrono::system_clock::time_point updatedAt; ///< Row update time

    /**
     * @brief Checks whether this host has been promoted into inventory.
     * @return True if promotedToDeviceId is set.
     */
    [[nodiscard]] bool isPromoted() const { return !promotedToDeviceId.empty(); }

    /**
     * @brief Converts this device's status to a string.
     * @return "online", "offline" or "unknown".
     */
    [[nodiscard]] std::string statusToString() const;

    /**
     * @brief Converts a DeviceStatus enum to a string.
     * @param status The status to convert.
     * @return String representation of the status.
     */
    static std::string deviceStatusToString(DeviceStatus status);

    /**
     * @brief Parses a string to get the corresponding DeviceStatus.
     * @param str The string to parse.
     * @return The matching status, Unknown if not recognized.
     */
    static DeviceStatus statusFromString(const std::string& str);
};

/**
 * @brief Filter for listing discovered devices. Unset fields match everything.
 */
struct DiscoveredDeviceFilter {
    std::string networkId;                ///< Restrict to one network
    std::optional<DeviceStatus> status;   ///< Restrict to one status
    std::optional<bool> promoted;         ///< Promoted (true) or not yet promoted (false)
    int minConfidence{0};                 ///< Minimum confidence score
};

} // namespace rackscan::core
