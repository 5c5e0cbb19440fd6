#include "infrastructure/database/DevicePromoter.hpp"

#include "core/types/Errors.hpp"
#include "core/util/Time.hpp"

#include <spdlog/spdlog.h>

namespace rackscan::infra {

DevicePromoter::DevicePromoter(std::shared_ptr<Database> db)
    : db_(db), datacenters_(db), devices_(db), discoveredDevices_(db) {}

std::string DevicePromoter::resolveDatacenter(const std::string& requested) {
    if (!requested.empty()) {
        return requested;
    }

    auto all = datacenters_.findAll();
    if (all.size() == 1) {
        spdlog::debug("Auto-assigning datacenter {}", all.front().id);
        return all.front().id;
    }
    return {};
}

core::Device DevicePromoter::promote(const std::string& discoveredId,
                                     const core::PromoteDeviceRequest& request) {
    if (request.name.empty()) {
        throw core::DiscoveryError(core::ErrorCode::InvalidRequest,
                                   "device name is required to promote " + discoveredId);
    }

    core::Device created;
    try {
        db_->transaction([&] {
            auto discovered = discoveredDevices_.findById(discoveredId);
            if (!discovered) {
                throw core::DiscoveryError(core::ErrorCode::NotFound,
                                           "discovered device not found: " + discoveredId);
            }
            if (discovered->isPromoted()) {
                throw core::DiscoveryError(core::ErrorCode::AlreadyPromoted,
                                           "discovered device " + discoveredId +
                                               " already promoted to " +
                                               discovered->promotedToDeviceId);
            }

            core::Device device;
            device.id = request.deviceId;
            device.name = request.name;
            device.description = request.description;
            device.makeModel = request.makeModel;
            device.os = request.os.empty() ? discovered->osGuess : request.os;
            device.datacenterId = resolveDatacenter(request.datacenterId);
            device.username = request.username;
            device.location = request.location;
            device.tags = request.tags;
            device.domains = request.domains;

            core::Address address;
            address.ip = discovered->ip;
            address.port = 0;
            address.type = "ipv4";
            address.label = "discovered";
            address.networkId = discovered->networkId;
            device.addresses.push_back(address);

            created = devices_.insert(device);
            discoveredDevices_.markPromoted(discoveredId, created.id, core::util::now());
        });
    } catch (const DatabaseError& e) {
        auto code = e.isConstraintViolation() ? core::ErrorCode::ConstraintViolation
                                              : core::ErrorCode::Storage;
        spdlog::warn("Promotion of {} failed: {}", discoveredId, e.what());
        throw core::DiscoveryError(code, e.what());
    }

    spdlog::info("Promoted discovered device {} to device {} ({})", discoveredId, created.id,
                 created.name);
    return created;
}

core::BulkPromotionResult DevicePromoter::bulkPromote(
    const std::vector<std::string>& discoveredIds,
    const std::vector<core::PromoteDeviceRequest>& requests) {
    core::BulkPromotionResult result;

    for (size_t i = 0; i < discoveredIds.size(); ++i) {
        const auto& id = discoveredIds[i];

        core::PromoteDeviceRequest request;
        if (i < requests.size()) {
            request = requests[i];
        } else {
            request.name = "device-" + id;
        }

        try {
            result.promoted.push_back(promote(id, request));
        } catch (const core::DiscoveryError& e) {
            spdlog::warn("Bulk promotion of {} failed: {}", id, e.what());
            result.failures.push_back({id, e.code(), e.what()});
        } catch (const std::exception& e) {
            spdlog::error("Bulk promotion of {} failed: {}", id, e.what());
            result.failures.push_back({id, core::ErrorCode::Storage, e.what()});
        }
    }

    spdlog::info("Bulk promotion finished: {} promoted, {} failed", result.promoted.size(),
                 result.failures.size());
    return result;
}

} // namespace rackscan::infra
