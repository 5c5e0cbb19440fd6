#include "app/DiscoveryService.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

namespace rackscan::app {

DiscoveryService::DiscoveryService(std::shared_ptr<infra::Database> db,
                                   core::IDiscoveryScanner& scanner)
    : db_(db), scanner_(scanner), networks_(db), scans_(db), rules_(db), promoter_(db) {}

DiscoveryService::~DiscoveryService() {
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, task] : tasks_) {
            if (!task.finished) {
                task.thread.request_stop();
            }
        }
    }
    waitForIdle();
}

core::DiscoveryRule DiscoveryService::defaultRule(const std::string& networkId,
                                                  core::ScanType scanType) {
    core::DiscoveryRule rule;
    rule.networkId = networkId;
    rule.scanType = scanType;
    rule.timeoutSeconds = 5;
    rule.maxConcurrentScans = 0;
    return rule;
}

core::DiscoveryScan DiscoveryService::startScan(const std::string& networkId,
                                                core::ScanType scanType) {
    auto rule = rules_.findByNetwork(networkId).value_or(defaultRule(networkId, scanType));
    rule.scanType = scanType;
    return startRuleScan(rule);
}

core::DiscoveryScan DiscoveryService::startRuleScan(const core::DiscoveryRule& rule) {
    if (!networks_.findById(rule.networkId)) {
        throw core::DiscoveryError(core::ErrorCode::NetworkNotFound,
                                   "network not found: " + rule.networkId);
    }

    std::lock_guard lock(mutex_);
    reapFinished();

    for (const auto& [id, task] : tasks_) {
        if (task.networkId == rule.networkId && !task.finished) {
            throw core::DiscoveryError(core::ErrorCode::InvalidRequest,
                                       "scan already running for network " + rule.networkId);
        }
    }

    core::DiscoveryScan pending;
    pending.networkId = rule.networkId;
    pending.scanType = rule.scanType;
    pending = scans_.insert(pending);

    auto& task = tasks_[pending.id];
    task.networkId = rule.networkId;
    task.thread = std::jthread([this, scanId = pending.id, rule](std::stop_token stopToken) {
        runScan(scanId, rule, stopToken);
    });

    spdlog::info("Queued {} discovery scan {} for network {}", core::scanTypeToString(rule.scanType),
                 pending.id, rule.networkId);
    return pending;
}

core::DiscoveryScan DiscoveryService::runRuleScan(const core::DiscoveryRule& rule) {
    auto scanId = startRuleScan(rule).id;

    {
        std::unique_lock lock(mutex_);
        finished_.wait(lock, [this, &scanId] {
            auto it = tasks_.find(scanId);
            return it == tasks_.end() || it->second.finished;
        });
    }

    auto stored = scans_.findById(scanId);
    if (!stored) {
        throw core::DiscoveryError(core::ErrorCode::NotFound, "scan not found: " + scanId);
    }
    return *stored;
}

void DiscoveryService::cancelScan(const std::string& scanId) {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(scanId);
    if (it == tasks_.end() || it->second.finished) {
        throw core::DiscoveryError(core::ErrorCode::NotFound, "no running scan " + scanId);
    }

    it->second.thread.request_stop();
    spdlog::info("Cancellation requested for scan {}", scanId);
}

bool DiscoveryService::isScanRunning(const std::string& networkId) const {
    std::lock_guard lock(mutex_);
    for (const auto& [id, task] : tasks_) {
        if (task.networkId == networkId && !task.finished) {
            return true;
        }
    }
    return false;
}

void DiscoveryService::waitForIdle() {
    std::unique_lock lock(mutex_);
    finished_.wait(lock, [this] {
        for (const auto& [id, task] : tasks_) {
            if (!task.finished) {
                return false;
            }
        }
        return true;
    });
    reapFinished();
}

core::Device DiscoveryService::promote(const std::string& discoveredId,
                                       const core::PromoteDeviceRequest& request) {
    return promoter_.promote(discoveredId, request);
}

core::BulkPromotionResult DiscoveryService::bulkPromote(
    const std::vector<std::string>& discoveredIds,
    const std::vector<core::PromoteDeviceRequest>& requests) {
    return promoter_.bulkPromote(discoveredIds, requests);
}

void DiscoveryService::runScan(const std::string& scanId, const core::DiscoveryRule& rule,
                               std::stop_token stopToken) {
    try {
        scanner_.scanNetwork(
            rule.networkId, rule,
            [this](const core::DiscoveryScan& snapshot) { persistProgress(snapshot); }, stopToken,
            scanId);
    } catch (const core::DiscoveryError& e) {
        spdlog::error("Discovery scan {} failed ({}): {}", scanId, core::errorCodeToString(e.code()),
                      e.what());
    } catch (const std::exception& e) {
        spdlog::error("Discovery scan {} failed: {}", scanId, e.what());
    }

    std::lock_guard lock(mutex_);
    auto it = tasks_.find(scanId);
    if (it != tasks_.end()) {
        it->second.finished = true;
    }
    finished_.notify_all();
}

void DiscoveryService::persistProgress(const core::DiscoveryScan& snapshot) {
    try {
        scans_.update(snapshot);
    } catch (const std::exception& e) {
        spdlog::error("Failed to persist progress of scan {}: {}", snapshot.id, e.what());
    }
}

void DiscoveryService::reapFinished() {
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->second.finished) {
            // The thread has left runScan and only needs to exit
            it->second.thread.join();
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace rackscan::app
