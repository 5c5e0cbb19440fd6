#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace rackscan::app {

/**
 * @brief Parameters of a one-off scan run from the command line.
 */
struct TestScanOptions {
    std::string subnet;                      ///< CIDR to sweep
    int timeoutSeconds{2};                   ///< Per-attempt probe timeout
    int maxConcurrentHosts{5};               ///< Hosts probed in parallel
    std::vector<std::string> excludeIps;     ///< Addresses or CIDRs to skip
    bool reverseDns{true};                   ///< Resolve hostnames
};

/**
 * @brief Sweeps a subnet without a database and prints the hosts as JSON.
 *
 * Progress goes to the log; the final scan record and the discovered hosts
 * are written to stdout as one JSON document.
 *
 * @return Process exit code: 0 on a completed scan, 1 otherwise.
 */
int runTestScan(const TestScanOptions& options);

} // namespace rackscan::app
