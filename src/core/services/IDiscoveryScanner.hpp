/**
 * @file IDiscoveryScanner.hpp
 * @brief Interface for sweeping a network for hosts.
 */

#pragma once

#include "core/types/DiscoveryRule.hpp"
#include "core/types/DiscoveryScan.hpp"

#include <functional>
#include <stop_token>
#include <string>

namespace rackscan::core {

/**
 * @brief Sweeps the subnet of one network and records every host it probes.
 */
class IDiscoveryScanner {
public:
    /**
     * @brief Callback receiving a consistent snapshot of scan progress.
     *
     * Invoked at most once per progress interval of completed hosts, on the
     * final host and once for the terminal state. Invocations are serialized.
     */
    using ProgressCallback = std::function<void(const DiscoveryScan&)>;

    virtual ~IDiscoveryScanner() = default;

    /**
     * @brief Scans a network and blocks until every host task has finished.
     *
     * @param networkId Network whose subnet is scanned.
     * @param rule Timeout, concurrency and exclusion policy.
     * @param onProgress Progress callback (may be empty).
     * @param stopToken Cancellation signal. A cancelled scan ends as failed.
     * @param scanId Id for the scan record (generated when empty).
     * @return The terminal scan snapshot.
     * @throws DiscoveryError with NetworkNotFound or InvalidSubnet before any
     *         host is probed. The failed snapshot is reported first.
     */
    virtual DiscoveryScan scanNetwork(const std::string& networkId, const DiscoveryRule& rule,
                                      ProgressCallback onProgress, std::stop_token stopToken,
                                      const std::string& scanId) = 0;
};

} // namespace rackscan::core
