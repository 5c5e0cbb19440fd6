#include "core/types/DiscoveredDevice.hpp"

namespace rackscan::core {

std::string DiscoveredDevice::statusToString() const {
    return deviceStatusToString(status);
}

std::string DiscoveredDevice::deviceStatusToString(DeviceStatus status) {
    switch (status) {
    case DeviceStatus::Online:
        return "online";
    case DeviceStatus::Offline:
        return "offline";
    case DeviceStatus::Unknown:
        return "unknown";
    }
    return "unknown";
}

DeviceStatus DiscoveredDevice::statusFromString(const std::string& str) {
    if (str == "online")
        return DeviceStatus::Online;
    if (str == "offline")
        return DeviceStatus::Offline;
    return DeviceStatus::Unknown;
}

} // namespace rackscan::core
