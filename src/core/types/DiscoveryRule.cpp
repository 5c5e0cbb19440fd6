#include "core/types/DiscoveryRule.hpp"

namespace rackscan::core {

std::string DiscoveryRule::portScanTypeToString(PortScanType type) {
    switch (type) {
    case PortScanType::Common:
        return "common";
    case PortScanType::Full:
        return "full";
    case PortScanType::Custom:
        return "custom";
    }
    return "common";
}

PortScanType DiscoveryRule::portScanTypeFromString(const std::string& str) {
    if (str == "full")
        return PortScanType::Full;
    if (str == "custom")
        return PortScanType::Custom;
    return PortScanType::Common;
}

} // namespace rackscan::core
