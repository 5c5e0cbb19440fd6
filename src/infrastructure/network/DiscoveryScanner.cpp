#include "infrastructure/network/DiscoveryScanner.hpp"

#include "core/discovery/ConfidenceScorer.hpp"
#include "core/types/Errors.hpp"
#include "core/util/Time.hpp"
#include "core/util/Uuid.hpp"
#include "infrastructure/network/Subnet.hpp"

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <optional>

namespace rackscan::infra {

namespace {

// Serializes progress callbacks and drops snapshots that arrive out of order.
class ProgressReporter {
public:
    explicit ProgressReporter(core::IDiscoveryScanner::ProgressCallback callback)
        : callback_(std::move(callback)) {}

    void report(const core::DiscoveryScan& snapshot) {
        if (!callback_) {
            return;
        }
        std::lock_guard lock(mutex_);
        if (!snapshot.isTerminal() && snapshot.scannedHosts < lastScanned_) {
            return;
        }
        lastScanned_ = snapshot.scannedHosts;
        try {
            callback_(snapshot);
        } catch (const std::exception& e) {
            spdlog::error("Progress callback for scan {} failed: {}", snapshot.id, e.what());
        }
    }

private:
    core::IDiscoveryScanner::ProgressCallback callback_;
    std::mutex mutex_;
    int lastScanned_{0};
};

void finishScan(core::DiscoveryScan& scan, core::ScanStatus status) {
    scan.advanceTo(status);
    scan.completedAt = core::util::now();
    if (scan.startedAt) {
        scan.durationSeconds = static_cast<int>(
            std::chrono::duration_cast<std::chrono::seconds>(*scan.completedAt - *scan.startedAt)
                .count());
    }
}

} // namespace

DiscoveryScanner::DiscoveryScanner(core::IDiscoveryStore& store, core::IHostProber& prober,
                                   DiscoveryScannerOptions options)
    : store_(store), prober_(prober), options_(options) {
    if (options_.defaultMaxConcurrentHosts <= 0) {
        options_.defaultMaxConcurrentHosts = 1;
    }
    if (options_.progressInterval <= 0) {
        options_.progressInterval = 1;
    }
}

core::DiscoveryScan DiscoveryScanner::scanNetwork(const std::string& networkId,
                                                  const core::DiscoveryRule& rule,
                                                  ProgressCallback onProgress,
                                                  std::stop_token stopToken,
                                                  const std::string& scanId) {
    ProgressReporter reporter(std::move(onProgress));

    core::DiscoveryScan scan;
    scan.id = scanId.empty() ? core::util::generateUuid() : scanId;
    scan.networkId = networkId;
    scan.scanType = rule.scanType;
    scan.scanDepth = 2;
    scan.advanceTo(core::ScanStatus::Running);
    scan.startedAt = core::util::now();

    auto fail = [&](core::ErrorCode code, const std::string& message) {
        finishScan(scan, core::ScanStatus::Failed);
        scan.errorMessage = message;
        reporter.report(scan);
        spdlog::warn("Discovery scan {} of network {} failed: {}", scan.id, networkId, message);
        throw core::DiscoveryError(code, message);
    };

    std::optional<core::Network> network;
    try {
        network = store_.getNetwork(networkId);
    } catch (const std::exception& e) {
        fail(core::ErrorCode::Storage, std::string("getting network: ") + e.what());
    }
    if (!network) {
        fail(core::ErrorCode::NetworkNotFound, "getting network: network not found: " + networkId);
    }

    std::vector<std::string> candidates;
    try {
        auto subnet = Ipv4Subnet::parse(network->subnet);
        if (subnet.prefixLength() < options_.minPrefixLength) {
            throw core::DiscoveryError(core::ErrorCode::InvalidSubnet,
                                       "subnet too large to enumerate: " + subnet.toString() +
                                           " (" + std::to_string(subnet.hostCount()) +
                                           " hosts, shortest allowed prefix /" +
                                           std::to_string(options_.minPrefixLength) + ")");
        }
        for (auto& ip : subnet.hosts()) {
            if (!isExcluded(ip, rule.excludeIps)) {
                candidates.push_back(std::move(ip));
            }
        }
    } catch (const core::DiscoveryError& e) {
        fail(core::ErrorCode::InvalidSubnet, std::string("generating IP list: ") + e.what());
    }

    scan.totalHosts = static_cast<int>(candidates.size());
    reporter.report(scan);

    const int concurrency =
        rule.maxConcurrentScans > 0 ? rule.maxConcurrentScans : options_.defaultMaxConcurrentHosts;
    const auto timeout = rule.timeoutSeconds > 0
                             ? std::chrono::milliseconds(rule.timeoutSeconds * 1000)
                             : options_.defaultTimeout;

    spdlog::info("Starting discovery of network {} ({}): {} hosts, {} in parallel", network->name,
                 network->subnet, scan.totalHosts, concurrency);

    std::mutex stateMutex;
    const int total = scan.totalHosts;

    {
        asio::thread_pool pool(static_cast<size_t>(concurrency));

        for (const auto& ip : candidates) {
            asio::post(pool, [&, ip]() {
                try {
                    if (stopToken.stop_requested()) {
                        return;
                    }
                    auto device = prober_.probeHost(ip, timeout, stopToken);
                    if (stopToken.stop_requested()) {
                        return;
                    }

                    device.networkId = networkId;
                    device.lastScanId = scan.id;
                    device.confidence = core::ConfidenceScorer::score(device);

                    try {
                        store_.createOrUpdateDiscoveredDevice(device);
                    } catch (const std::exception& e) {
                        spdlog::error("Failed to save discovered device {}: {}", ip, e.what());
                    }

                    std::optional<core::DiscoveryScan> snapshot;
                    {
                        std::lock_guard lock(stateMutex);
                        ++scan.scannedHosts;
                        if (device.status == core::DeviceStatus::Online) {
                            ++scan.foundHosts;
                        }
                        const bool intervalReached =
                            scan.scannedHosts % options_.progressInterval == 0;
                        if (intervalReached) {
                            spdlog::info("Discovery progress for scan {}: {}/{} hosts", scan.id,
                                         scan.scannedHosts, total);
                        }
                        if (intervalReached || scan.scannedHosts == total) {
                            snapshot = scan;
                        }
                    }
                    if (snapshot) {
                        reporter.report(*snapshot);
                    }
                } catch (const std::exception& e) {
                    spdlog::error("Probe task for {} failed: {}", ip, e.what());
                }
            });
        }

        pool.join();
    }

    if (stopToken.stop_requested()) {
        finishScan(scan, core::ScanStatus::Failed);
        scan.errorMessage = "scan cancelled";
        spdlog::info("Discovery scan {} cancelled after {}/{} hosts", scan.id, scan.scannedHosts,
                     total);
    } else {
        finishScan(scan, core::ScanStatus::Completed);
        spdlog::info("Discovery of network {} completed: {} of {} hosts online in {}s",
                     network->name, scan.foundHosts, total, scan.durationSeconds);
    }

    reporter.report(scan);
    return scan;
}

} // namespace rackscan::infra
