#pragma once

#include "core/services/IDiscoveryScanner.hpp"
#include "core/services/IDiscoveryStore.hpp"
#include "core/services/IHostProber.hpp"

#include <chrono>
#include <mutex>

namespace rackscan::infra {

/**
 * @brief Engine defaults applied when a rule leaves a value unset.
 */
struct DiscoveryScannerOptions {
    int defaultMaxConcurrentHosts{5};                  ///< Hosts probed in parallel
    std::chrono::milliseconds defaultTimeout{2000};    ///< Per-attempt probe timeout
    int progressInterval{50};                          ///< Hosts between progress reports
    int minPrefixLength{8};                            ///< Shortest prefix swept (0 for no limit)
};

/**
 * @brief Sweeps a network's subnet with bounded parallelism.
 *
 * Every candidate host is probed, scored and merged into the store. One
 * host failing to persist is logged and does not abort the scan.
 */
class DiscoveryScanner : public core::IDiscoveryScanner {
public:
    DiscoveryScanner(core::IDiscoveryStore& store, core::IHostProber& prober,
                     DiscoveryScannerOptions options = {});
    ~DiscoveryScanner() override = default;

    DiscoveryScanner(const DiscoveryScanner&) = delete;
    DiscoveryScanner& operator=(const DiscoveryScanner&) = delete;

    core::DiscoveryScan scanNetwork(const std::string& networkId, const core::DiscoveryRule& rule,
                                    ProgressCallback onProgress, std::stop_token stopToken,
                                    const std::string& scanId) override;

    const DiscoveryScannerOptions& options() const { return options_; }

private:
    core::IDiscoveryStore& store_;
    core::IHostProber& prober_;
    DiscoveryScannerOptions options_;
};

} // namespace rackscan::infra
