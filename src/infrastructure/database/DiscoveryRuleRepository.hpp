#pragma once

#include "core/types/DiscoveryRule.hpp"
#include "infrastructure/database/Database.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rackscan::infra {

/**
 * @brief Repository for per-network discovery rules.
 */
class DiscoveryRuleRepository {
public:
    /**
     * @brief Constructs a DiscoveryRuleRepository with the given database.
     * @param db Shared pointer to the Database instance.
     */
    explicit DiscoveryRuleRepository(std::shared_ptr<Database> db);

    /**
     * @brief Inserts a rule.
     * @param rule Rule to store. An id is generated when empty.
     * @return The stored rule including id and timestamps.
     * @throws DatabaseError if the network already has a rule.
     */
    core::DiscoveryRule insert(const core::DiscoveryRule& rule);

    /**
     * @brief Updates an existing rule.
     * @param rule Rule with updated values (id must be set).
     * @throws core::DiscoveryError with NotFound if the rule does not exist.
     */
    void update(const core::DiscoveryRule& rule);

    /**
     * @brief Deletes a rule.
     * @param id Rule id.
     * @throws core::DiscoveryError with NotFound if the rule does not exist.
     */
    void remove(const std::string& id);

    /**
     * @brief Finds a rule by id.
     * @param id Rule id.
     * @return The rule if found, nullopt otherwise.
     */
    std::optional<core::DiscoveryRule> findById(const std::string& id);

    /**
     * @brief Finds the rule of a network.
     * @param networkId Network id.
     * @return The rule if the network has one, nullopt otherwise.
     */
    std::optional<core::DiscoveryRule> findByNetwork(const std::string& networkId);

    /**
     * @brief Lists rules ordered by network.
     * @param networkId Restrict to one network, or empty for all rules.
     * @return Matching rules.
     */
    std::vector<core::DiscoveryRule> list(const std::string& networkId = {});

    /**
     * @brief Lists rules the scheduler should run.
     * @return Enabled rules.
     */
    std::vector<core::DiscoveryRule> findEnabled();

    /**
     * @brief Records a scheduled run.
     * @param id Rule id.
     * @param lastRun When the run started.
     * @param nextRun When the next run is due.
     */
    void updateRunTimes(const std::string& id, std::chrono::system_clock::time_point lastRun,
                        std::chrono::system_clock::time_point nextRun);

private:
    std::vector<core::DiscoveryRule> select(const std::string& where, const std::string& param);

    std::shared_ptr<Database> db_;
};

} // namespace rackscan::infra
