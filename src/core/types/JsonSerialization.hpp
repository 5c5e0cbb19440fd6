/**
 * @file JsonSerialization.hpp
 * @brief nlohmann::json conversions for discovery types.
 *
 * Used for list-valued database columns and for command line output.
 */

#pragma once

#include "core/types/DiscoveredDevice.hpp"
#include "core/types/DiscoveryScan.hpp"
#include "core/types/Inventory.hpp"

#include <nlohmann/json.hpp>

namespace rackscan::core {

void to_json(nlohmann::json& j, const ServiceInfo& service);
void from_json(const nlohmann::json& j, ServiceInfo& service);

void to_json(nlohmann::json& j, const Address& address);
void to_json(nlohmann::json& j, const Device& device);
void to_json(nlohmann::json& j, const DiscoveredDevice& device);
void to_json(nlohmann::json& j, const DiscoveryScan& scan);

} // namespace rackscan::core
