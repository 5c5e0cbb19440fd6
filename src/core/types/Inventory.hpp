/**
 * @file Inventory.hpp
 * @brief Managed inventory records: datacenters, networks, devices and addresses.
 *
 * These records are owned by the inventory side of the system. The discovery
 * engine reads networks and datacenters and creates devices on promotion.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace rackscan::core {

/**
 * @brief A physical site hosting networks and devices.
 */
struct Datacenter {
    std::string id;          ///< Unique identifier
    std::string name;        ///< Display name (unique)
    std::string location;    ///< Free-form site location
    std::string description; ///< Optional description
    std::chrono::system_clock::time_point createdAt; ///< When the record was created
    std::chrono::system_clock::time_point updatedAt; ///< When the record was last changed

    bool operator==(const Datacenter& other) const = default;
};

/**
 * @brief An IP network in CIDR notation, optionally bound to a datacenter.
 */
struct Network {
    std::string id;           ///< Unique identifier
    std::string name;         ///< Display name
    std::string subnet;       ///< CIDR subnet, e.g. "10.0.0.0/24"
    std::string datacenterId; ///< Owning datacenter (empty if none)
    std::string description;  ///< Optional description
    int vlan{0};              ///< VLAN id (0 if untagged)

    bool operator==(const Network& other) const = default;
};

/**
 * @brief A network address attached to a device.
 */
struct Address {
    std::string ip;         ///< IP address
    int port{0};            ///< Service port (0 for the bare address)
    std::string type;       ///< Address family, e.g. "ipv4"
    std::string label;      ///< Free-form label, e.g. "discovered"
    std::string networkId;  ///< Network the address belongs to (empty if none)
    std::string switchPort; ///< Switch port the interface is patched into

    bool operator==(const Address& other) const = default;
};

/**
 * @brief A managed inventory device.
 */
struct Device {
    std::string id;           ///< Unique identifier
    std::string name;         ///< Display name
    std::string description;  ///< Optional description
    std::string makeModel;    ///< Hardware make and model
    std::string os;           ///< Operating system
    std::string datacenterId; ///< Datacenter hosting the device (empty if none)
    std::string username;     ///< Login user
    std::string location;     ///< Rack or room location
    std::vector<std::string> tags;    ///< Free-form tags
    std::vector<Address> addresses;   ///< Network addresses
    std::vector<std::string> domains; ///< DNS domains
    std::chrono::system_clock::time_point createdAt; ///< When the device was created
    std::chrono::system_clock::time_point updatedAt; ///< When the device was last changed
};

} // namespace rackscan::core
