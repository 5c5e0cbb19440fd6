/**
 * @file Subnet.hpp
 * @brief IPv4 subnet parsing, host enumeration and exclusion matching.
 */

#pragma once

#include <asio/ip/address_v4.hpp>
#include <asio/ip/network_v4.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace rackscan::infra {

/**
 * @brief An IPv4 network in CIDR form.
 */
class Ipv4Subnet {
public:
    /**
     * @brief Parses CIDR text such as "10.0.0.0/24".
     *
     * Host bits set in the address are ignored, as with "10.0.0.7/24".
     *
     * @param cidr Subnet in CIDR notation.
     * @return The parsed subnet.
     * @throws core::DiscoveryError with InvalidSubnet for malformed or IPv6
     *         input.
     */
    static Ipv4Subnet parse(const std::string& cidr);

    /**
     * @brief Lists candidate host addresses in ascending order.
     *
     * For prefixes up to /30 the network and broadcast addresses are left
     * out. A /31 yields both addresses and a /32 its single address.
     *
     * @return Dotted-quad addresses.
     */
    std::vector<std::string> hosts() const;

    /**
     * @brief Number of addresses hosts() would return.
     */
    uint64_t hostCount() const;

    /**
     * @brief Checks whether an address lies inside the subnet.
     * @param address Address to test.
     * @return True if the address is covered by the prefix.
     */
    bool contains(const asio::ip::address_v4& address) const;

    unsigned short prefixLength() const { return network_.prefix_length(); }

    std::string toString() const { return network_.to_string(); }

private:
    explicit Ipv4Subnet(asio::ip::network_v4 network) : network_(network) {}

    asio::ip::network_v4 network_;
};

/**
 * @brief Checks an address against an exclusion list.
 *
 * Entries are either literal addresses or CIDR subnets. Malformed entries
 * only match by literal comparison.
 *
 * @param ip Address to test.
 * @param excludeList Exclusion entries.
 * @return True if any entry matches.
 */
bool isExcluded(const std::string& ip, const std::vector<std::string>& excludeList);

} // namespace rackscan::infra
