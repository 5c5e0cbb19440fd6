#pragma once

#include "core/types/DiscoveryRule.hpp"
#include "infrastructure/database/DiscoveredDeviceRepository.hpp"
#include "infrastructure/database/DiscoveryRuleRepository.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rackscan::infra {

/**
 * @brief Timing and retention policy for DiscoveryScheduler.
 */
struct DiscoverySchedulerOptions {
    std::chrono::seconds tickInterval{10};        ///< How often due rules are checked
    bool autoCleanup{true};                       ///< Run the retention task
    int retentionDays{30};                        ///< Age after which unpromoted records go
    std::chrono::hours cleanupInterval{24};       ///< Period of the retention task
};

/**
 * @brief Runs enabled discovery rules every scan_interval_hours.
 *
 * A steady timer on the shared AsioContext ticks every tickInterval and
 * starts each rule whose next run is due. Scans are started through a
 * launcher callback that must not block; it returns false when the rule's
 * network is already being scanned, in which case the run is skipped.
 *
 * After each run the rule's last_run_at and next_run_at are written back.
 * A rule without a stored next_run_at first runs one interval after it is
 * loaded.
 */
class DiscoveryScheduler {
public:
    /**
     * @brief Starts a scan for a rule.
     * @return True if a scan was started, false if one is already running.
     */
    using ScanLauncher = std::function<bool(const core::DiscoveryRule&)>;

    DiscoveryScheduler(AsioContext& context, std::shared_ptr<Database> db, ScanLauncher launcher,
                       DiscoverySchedulerOptions options = {});
    ~DiscoveryScheduler();

    DiscoveryScheduler(const DiscoveryScheduler&) = delete;
    DiscoveryScheduler& operator=(const DiscoveryScheduler&) = delete;

    /**
     * @brief Loads the rules and arms the tick and retention timers.
     */
    void start();

    /**
     * @brief Cancels all timers. Scans already started keep running.
     *
     * Blocks until a tick or retention handler that is already executing has
     * returned. Once stop() returns the launcher is no longer called from
     * the timers, so its targets may be destroyed.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Re-reads enabled rules from the database.
     *
     * Rules whose interval is unchanged keep their next run time.
     */
    void reload();

    /**
     * @brief Runs a rule immediately, outside its schedule.
     * @param ruleId Rule to run.
     * @return True if a scan was started.
     * @throws core::DiscoveryError with NotFound if the rule does not exist.
     */
    bool runNow(const std::string& ruleId);

    /**
     * @brief Returns the scheduled rules with their next run time.
     */
    std::vector<core::DiscoveryRule> getSchedules() const;

    /**
     * @brief Runs the retention task once.
     * @return Number of discovered devices removed.
     */
    int runCleanup();

private:
    struct ScheduledItem {
        core::DiscoveryRule rule;
        std::chrono::system_clock::time_point nextRun;
    };

    /// Shared with queued handlers. A handler runs only while the gate is
    /// open and holds its mutex for the whole run.
    struct HandlerGate {
        std::mutex mutex;
        bool open{true};
    };
    using GatePtr = std::shared_ptr<HandlerGate>;

    void closeGate();
    void scheduleTick(const GatePtr& gate);
    void scheduleCleanup(const GatePtr& gate);
    void runDueRules();
    bool executeRule(const core::DiscoveryRule& rule);

    AsioContext& context_;
    DiscoveryRuleRepository rules_;
    DiscoveredDeviceRepository discoveredDevices_;
    ScanLauncher launcher_;
    DiscoverySchedulerOptions options_;

    asio::steady_timer tickTimer_;
    asio::steady_timer cleanupTimer_;

    mutable std::mutex mutex_;
    std::map<std::string, ScheduledItem> schedules_;
    std::atomic<bool> running_{false};
    GatePtr gate_;
};

} // namespace rackscan::infra
