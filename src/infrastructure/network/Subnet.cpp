#include "infrastructure/network/Subnet.hpp"

#include "core/types/Errors.hpp"

#include <cstdint>

namespace rackscan::infra {

namespace {

uint32_t prefixMask(unsigned short prefixLength) {
    return prefixLength == 0 ? 0u : ~uint32_t{0} << (32 - prefixLength);
}

} // namespace

Ipv4Subnet Ipv4Subnet::parse(const std::string& cidr) {
    if (cidr.find('/') == std::string::npos) {
        throw core::DiscoveryError(core::ErrorCode::InvalidSubnet,
                                   "invalid CIDR address: " + cidr);
    }

    asio::error_code ec;
    auto network = asio::ip::make_network_v4(cidr, ec);
    if (ec) {
        throw core::DiscoveryError(core::ErrorCode::InvalidSubnet,
                                   "invalid CIDR address: " + cidr);
    }
    return Ipv4Subnet(network.canonical());
}

uint64_t Ipv4Subnet::hostCount() const {
    const auto prefix = network_.prefix_length();
    const uint64_t size = uint64_t{1} << (32 - prefix);
    return prefix <= 30 ? size - 2 : size;
}

std::vector<std::string> Ipv4Subnet::hosts() const {
    const auto prefix = network_.prefix_length();
    const uint64_t size = uint64_t{1} << (32 - prefix);
    uint64_t first = network_.network().to_uint();
    uint64_t last = first + size - 1;

    if (prefix <= 30) {
        ++first;
        --last;
    }

    std::vector<std::string> result;
    result.reserve(static_cast<size_t>(last - first + 1));
    for (uint64_t value = first; value <= last; ++value) {
        result.push_back(asio::ip::address_v4(static_cast<uint32_t>(value)).to_string());
    }
    return result;
}

bool Ipv4Subnet::contains(const asio::ip::address_v4& address) const {
    auto mask = prefixMask(network_.prefix_length());
    return (address.to_uint() & mask) == network_.network().to_uint();
}

bool isExcluded(const std::string& ip, const std::vector<std::string>& excludeList) {
    asio::error_code ec;
    auto address = asio::ip::make_address_v4(ip, ec);
    const bool validAddress = !ec;

    for (const auto& entry : excludeList) {
        if (entry == ip) {
            return true;
        }
        if (!validAddress || entry.find('/') == std::string::npos) {
            continue;
        }

        asio::error_code netEc;
        auto network = asio::ip::make_network_v4(entry, netEc);
        if (netEc) {
            continue;
        }
        auto mask = prefixMask(network.prefix_length());
        if ((address.to_uint() & mask) == (network.address().to_uint() & mask)) {
            return true;
        }
    }
    return false;
}

} // namespace rackscan::infra
