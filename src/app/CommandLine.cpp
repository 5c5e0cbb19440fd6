#include "app/CommandLine.hpp"

#include <cstdint>

namespace rackscan::app {

CLI::App* configureCommandLine(CLI::App& app, CommandLine& target) {
    app.add_option("-c,--config", target.configDir, "Configuration directory")
        ->capture_default_str();

    auto* testScan =
        app.add_subcommand("test-scan", "Sweep a subnet once and print the hosts as JSON");
    auto& options = target.testScan;

    testScan->add_option("cidr", options.subnet, "Subnet in CIDR notation, e.g. 10.0.0.0/24")
        ->required();
    testScan->add_option("-t,--timeout", options.timeoutSeconds, "Per-attempt timeout in seconds")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    testScan->add_option("-j,--concurrency", options.maxConcurrentHosts, "Hosts scanned in parallel")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    testScan->add_option("-x,--exclude", options.excludeIps, "Address or CIDR to skip (repeatable)")
        ->allow_extra_args(false);
    testScan->add_flag_function(
        "--no-dns", [&options](std::int64_t) { options.reverseDns = false; },
        "Skip reverse DNS lookups");

    return testScan;
}

} // namespace rackscan::app
