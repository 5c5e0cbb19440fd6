/**
 * @file IHostProber.hpp
 * @brief Interface for probing a single host for liveness evidence.
 */

#pragma once

#include "core/types/DiscoveredDevice.hpp"

#include <chrono>
#include <stop_token>
#include <string>

namespace rackscan::core {

/**
 * @brief Probes one IP address and reports what it found.
 *
 * Probe failures are never errors: an unreachable host simply comes back
 * offline with no open ports.
 */
class IHostProber {
public:
    virtual ~IHostProber() = default;

    /**
     * @brief Probes a host.
     *
     * The returned draft has ip, hostname, status and openPorts filled in. It
     * is not scored and not persisted.
     *
     * @param ip IPv4 address to probe.
     * @param timeout Deadline for each DNS lookup and each connect attempt.
     * @param stopToken Checked before each new connect attempt.
     * @return Draft record for the host.
     */
    virtual DiscoveredDevice probeHost(const std::string& ip, std::chrono::milliseconds timeout,
                                       std::stop_token stopToken) = 0;
};

} // namespace rackscan::core
