#include "infrastructure/network/DiscoveryScheduler.hpp"

#include "core/types/Errors.hpp"
#include "core/util/Time.hpp"

#include <spdlog/spdlog.h>

namespace rackscan::infra {

namespace {

std::chrono::hours intervalOf(const core::DiscoveryRule& rule) {
    return std::chrono::hours(rule.scanIntervalHours > 0 ? rule.scanIntervalHours : 24);
}

} // namespace

DiscoveryScheduler::DiscoveryScheduler(AsioContext& context, std::shared_ptr<Database> db,
                                       ScanLauncher launcher, DiscoverySchedulerOptions options)
    : context_(context), rules_(db), discoveredDevices_(db), launcher_(std::move(launcher)),
      options_(options), tickTimer_(context.getContext()), cleanupTimer_(context.getContext()) {
    spdlog::debug("DiscoveryScheduler initialized");
}

DiscoveryScheduler::~DiscoveryScheduler() {
    stop();
}

void DiscoveryScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }

    reload();
    gate_ = std::make_shared<HandlerGate>();
    scheduleTick(gate_);

    if (options_.autoCleanup) {
        asio::post(context_.getContext(), [this, gate = gate_]() {
            std::lock_guard guard(gate->mutex);
            if (gate->open) {
                runCleanup();
            }
        });
        scheduleCleanup(gate_);
    }

    std::lock_guard lock(mutex_);
    spdlog::info("DiscoveryScheduler started with {} rules", schedules_.size());
}

void DiscoveryScheduler::stop() {
    closeGate();
    if (!running_.exchange(false)) {
        return;
    }

    tickTimer_.cancel();
    cleanupTimer_.cancel();

    spdlog::info("DiscoveryScheduler stopped");
}

void DiscoveryScheduler::closeGate() {
    if (!gate_) {
        return;
    }
    // Waits for the handler currently holding the gate, if any
    std::lock_guard guard(gate_->mutex);
    gate_->open = false;
}

void DiscoveryScheduler::reload() {
    auto enabled = rules_.findEnabled();
    auto now = core::util::now();

    std::lock_guard lock(mutex_);
    std::map<std::string, ScheduledItem> updated;
    for (auto& rule : enabled) {
        ScheduledItem item;
        auto existing = schedules_.find(rule.id);
        if (existing != schedules_.end() &&
            existing->second.rule.scanIntervalHours == rule.scanIntervalHours) {
            item.nextRun = existing->second.nextRun;
        } else if (rule.nextRunAt) {
            item.nextRun = *rule.nextRunAt;
        } else {
            item.nextRun = now + intervalOf(rule);
        }
        item.rule = std::move(rule);
        updated.emplace(item.rule.id, std::move(item));
    }

    schedules_ = std::move(updated);
    spdlog::debug("Loaded {} enabled discovery rules", schedules_.size());
}

bool DiscoveryScheduler::runNow(const std::string& ruleId) {
    auto rule = rules_.findById(ruleId);
    if (!rule) {
        throw core::DiscoveryError(core::ErrorCode::NotFound,
                                   "discovery rule not found: " + ruleId);
    }

    spdlog::info("Running discovery rule {} for network {} immediately", ruleId, rule->networkId);
    return executeRule(*rule);
}

std::vector<core::DiscoveryRule> DiscoveryScheduler::getSchedules() const {
    std::lock_guard lock(mutex_);

    std::vector<core::DiscoveryRule> result;
    result.reserve(schedules_.size());
    for (const auto& [id, item] : schedules_) {
        auto rule = item.rule;
        rule.nextRunAt = item.nextRun;
        result.push_back(std::move(rule));
    }
    return result;
}

int DiscoveryScheduler::runCleanup() {
    try {
        return discoveredDevices_.cleanupOlderThan(options_.retentionDays);
    } catch (const std::exception& e) {
        spdlog::error("Discovered device cleanup failed: {}", e.what());
        return 0;
    }
}

void DiscoveryScheduler::scheduleTick(const GatePtr& gate) {
    tickTimer_.expires_after(options_.tickInterval);
    tickTimer_.async_wait([this, gate](const asio::error_code& ec) {
        if (ec) {
            return;
        }
        std::lock_guard guard(gate->mutex);
        if (!gate->open) {
            return;
        }

        try {
            reload();
        } catch (const std::exception& e) {
            spdlog::error("Failed to reload discovery rules: {}", e.what());
        }
        runDueRules();
        scheduleTick(gate);
    });
}

void DiscoveryScheduler::scheduleCleanup(const GatePtr& gate) {
    cleanupTimer_.expires_after(options_.cleanupInterval);
    cleanupTimer_.async_wait([this, gate](const asio::error_code& ec) {
        if (ec) {
            return;
        }
        std::lock_guard guard(gate->mutex);
        if (!gate->open) {
            return;
        }

        runCleanup();
        scheduleCleanup(gate);
    });
}

void DiscoveryScheduler::runDueRules() {
    std::vector<core::DiscoveryRule> due;
    auto now = core::util::now();
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, item] : schedules_) {
            if (item.nextRun <= now) {
                item.nextRun = now + intervalOf(item.rule);
                due.push_back(item.rule);
            }
        }
    }

    for (const auto& rule : due) {
        executeRule(rule);
    }
}

bool DiscoveryScheduler::executeRule(const core::DiscoveryRule& rule) {
    try {
        if (!launcher_(rule)) {
            spdlog::info("Skipping discovery of network {}: scan still running", rule.networkId);
            return false;
        }
    } catch (const core::DiscoveryError& e) {
        spdlog::warn("Discovery rule {} not started: {}", rule.id, e.what());
        return false;
    } catch (const std::exception& e) {
        spdlog::error("Failed to start discovery rule {}: {}", rule.id, e.what());
        return false;
    }

    auto now = core::util::now();
    auto next = now + intervalOf(rule);
    {
        std::lock_guard lock(mutex_);
        auto it = schedules_.find(rule.id);
        if (it != schedules_.end()) {
            it->second.nextRun = next;
        }
    }

    try {
        rules_.updateRunTimes(rule.id, now, next);
    } catch (const std::exception& e) {
        spdlog::error("Failed to record run of discovery rule {}: {}", rule.id, e.what());
    }
    return true;
}

} // namespace rackscan::infra
