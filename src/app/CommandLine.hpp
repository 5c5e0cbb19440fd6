#pragma once

#include "app/TestScan.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>

namespace rackscan::app {

/**
 * @brief Values collected from the command line.
 */
struct CommandLine {
    std::filesystem::path configDir;   ///< Configuration directory of the service
    TestScanOptions testScan;          ///< Options of the test-scan subcommand
};

/**
 * @brief Registers the service options and the test-scan subcommand.
 *
 * Parsed values are written into target, which must outlive the parse.
 * Malformed numbers and non-positive timeouts or concurrency are rejected
 * by the parser with a CLI::ParseError.
 *
 * @param app Parser to configure.
 * @param target Receives the parsed values. Existing values act as defaults.
 * @return The test-scan subcommand.
 */
CLI::App* configureCommandLine(CLI::App& app, CommandLine& target);

} // namespace rackscan::app
