#pragma once

#include "core/services/IDiscoveryScanner.hpp"
#include "core/types/Promotion.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/DevicePromoter.hpp"
#include "infrastructure/database/DiscoveryRuleRepository.hpp"
#include "infrastructure/database/DiscoveryScanRepository.hpp"
#include "infrastructure/database/NetworkRepository.hpp"

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace rackscan::app {

/**
 * @brief Entry point for starting scans and promoting discovered devices.
 *
 * Scans run on background threads, one per scan, and their progress
 * snapshots are persisted as they arrive. At most one scan per network runs
 * at a time.
 */
class DiscoveryService {
public:
    DiscoveryService(std::shared_ptr<infra::Database> db, core::IDiscoveryScanner& scanner);

    /**
     * @brief Cancels running scans and waits for them to finish.
     */
    ~DiscoveryService();

    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    /**
     * @brief Starts an on-demand scan of a network.
     *
     * Uses the network's stored rule if it has one, otherwise defaultRule().
     *
     * @param networkId Network to scan.
     * @param scanType Depth label recorded on the scan.
     * @return The pending scan record.
     * @throws core::DiscoveryError with NetworkNotFound, or InvalidRequest when
     *         the network is already being scanned.
     */
    core::DiscoveryScan startScan(const std::string& networkId, core::ScanType scanType);

    /**
     * @brief Starts a background scan using a rule's policy.
     * @return The pending scan record.
     * @throws core::DiscoveryError as startScan().
     */
    core::DiscoveryScan startRuleScan(const core::DiscoveryRule& rule);

    /**
     * @brief Runs a scan for a rule and waits for it to end.
     * @return The stored terminal scan record.
     * @throws core::DiscoveryError as startScan().
     */
    core::DiscoveryScan runRuleScan(const core::DiscoveryRule& rule);

    /**
     * @brief Requests cancellation of a running scan.
     *
     * The scan ends as failed with "scan cancelled" once in-flight probes return.
     *
     * @throws core::DiscoveryError with NotFound if the scan is not running.
     */
    void cancelScan(const std::string& scanId);

    bool isScanRunning(const std::string& networkId) const;

    /**
     * @brief Blocks until no scan is running.
     */
    void waitForIdle();

    core::Device promote(const std::string& discoveredId, const core::PromoteDeviceRequest& request);

    core::BulkPromotionResult bulkPromote(const std::vector<std::string>& discoveredIds,
                                          const std::vector<core::PromoteDeviceRequest>& requests);

    /**
     * @brief One-off rule used when a network has no stored rule.
     *
     * 5 second timeout, engine default concurrency, no exclusions.
     */
    static core::DiscoveryRule defaultRule(const std::string& networkId, core::ScanType scanType);

private:
    struct ScanTask {
        std::string networkId;
        std::jthread thread;
        bool finished{false};
    };

    void runScan(const std::string& scanId, const core::DiscoveryRule& rule,
                 std::stop_token stopToken);
    void persistProgress(const core::DiscoveryScan& snapshot);
    void reapFinished();

    std::shared_ptr<infra::Database> db_;
    core::IDiscoveryScanner& scanner_;
    infra::NetworkRepository networks_;
    infra::DiscoveryScanRepository scans_;
    infra::DiscoveryRuleRepository rules_;
    infra::DevicePromoter promoter_;

    mutable std::mutex mutex_;
    std::condition_variable finished_;
    std::map<std::string, ScanTask> tasks_;
};

} // namespace rackscan::app
