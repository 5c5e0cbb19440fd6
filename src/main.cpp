#include "app/Application.hpp"
#include "app/CommandLine.hpp"
#include "app/TestScan.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>

namespace {

std::filesystem::path defaultConfigDir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "rackscan";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "rackscan";
    }
    return std::filesystem::current_path() / "rackscan";
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App cli{"rackscan network discovery service"};
    rackscan::app::CommandLine commandLine;
    commandLine.configDir = defaultConfigDir();
    auto* testScan = rackscan::app::configureCommandLine(cli, commandLine);

    try {
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli.exit(e);
    }

    try {
        if (testScan->parsed()) {
            // Logs go to stderr so stdout stays valid JSON
            spdlog::set_default_logger(spdlog::stderr_color_mt("rackscan"));
            return rackscan::app::runTestScan(commandLine.testScan);
        }

        rackscan::app::Application app(commandLine.configDir);
        return app.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
