#pragma once

#include "app/DiscoveryService.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/SqliteDiscoveryStore.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/DiscoveryScanner.hpp"
#include "infrastructure/network/DiscoveryScheduler.hpp"
#include "infrastructure/network/HostProber.hpp"

#include <filesystem>
#include <memory>

namespace rackscan::app {

/**
 * @brief Long-running discovery daemon.
 *
 * Owns the configuration, database, I/O context and discovery components,
 * and runs the scheduler until SIGINT or SIGTERM.
 */
class Application {
public:
    explicit Application(const std::filesystem::path& configDir);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Runs until a termination signal arrives.
     * @return Process exit code.
     */
    int run();

    // Accessors
    infra::ConfigManager& config() { return *config_; }
    infra::Database& database() { return *database_; }
    infra::AsioContext& asioContext() { return *asioContext_; }
    DiscoveryService& discoveryService() { return *discoveryService_; }
    infra::DiscoveryScheduler& scheduler() { return *scheduler_; }

private:
    void initializeLogging();
    void initializeComponents();
    void shutdown();

    std::unique_ptr<infra::ConfigManager> config_;
    std::shared_ptr<infra::Database> database_;
    std::unique_ptr<infra::AsioContext> asioContext_;
    std::unique_ptr<infra::SqliteDiscoveryStore> store_;
    std::unique_ptr<infra::HostProber> prober_;
    std::unique_ptr<infra::DiscoveryScanner> scanner_;
    std::unique_ptr<DiscoveryService> discoveryService_;
    std::unique_ptr<infra::DiscoveryScheduler> scheduler_;
    bool shutDown_{false};
};

/**
 * @brief Builds the console + rotating file logger and makes it the default.
 * @param logPath Rotating log file (5 MiB x 3, debug level).
 * @param consoleLevel Level name for the console sink.
 */
void setupLogging(const std::filesystem::path& logPath, const std::string& consoleLevel);

} // namespace rackscan::app
