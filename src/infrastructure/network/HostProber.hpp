#pragma once

#include "core/services/IHostProber.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <vector>

namespace rackscan::infra {

/**
 * @brief Probe policy for HostProber.
 */
struct HostProberOptions {
    /// TCP ports whose reachability marks a host online.
    std::vector<uint16_t> ports{80, 443, 22, 3389, 23, 21, 25, 53, 110, 143, 993, 995};
    bool reverseDns{true};        ///< Resolve a hostname via PTR lookup
    int maxConcurrentPorts{10};   ///< Connect attempts in flight per host
};

/**
 * @brief Unprivileged host prober using TCP connect attempts and reverse DNS.
 *
 * Connects run on the shared AsioContext. probeHost() blocks the calling
 * thread until every port attempt has completed or timed out, so it must
 * not be called from one of the context's worker threads.
 */
class HostProber : public core::IHostProber {
public:
    /// Per-attempt timeout used when the caller passes zero or less.
    static constexpr std::chrono::milliseconds kDefaultTimeout{2000};

    explicit HostProber(AsioContext& context, HostProberOptions options = {});
    ~HostProber() override = default;

    HostProber(const HostProber&) = delete;
    HostProber& operator=(const HostProber&) = delete;

    core::DiscoveredDevice probeHost(const std::string& ip, std::chrono::milliseconds timeout,
                                     std::stop_token stopToken) override;

    const HostProberOptions& options() const { return options_; }

private:
    /**
     * @brief Reverse-resolves an address, giving up after the timeout.
     * @return The hostname, or an empty string when none is known.
     */
    std::string lookupHostname(const asio::ip::address_v4& address,
                               std::chrono::milliseconds timeout);

    /**
     * @brief Attempts a TCP connect to every configured port.
     * @return Open ports in the configured order.
     */
    std::vector<int> probePorts(const asio::ip::address_v4& address,
                                std::chrono::milliseconds timeout, std::stop_token stopToken);

    AsioContext& context_;
    HostProberOptions options_;
};

} // namespace rackscan::infra
