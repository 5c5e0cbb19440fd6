#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace rackscan::infra {

/**
 * @brief Application configuration settings.
 *
 * Holds the discovery engine defaults, scheduler switches and data
 * retention policy. Every value has a default so that a missing or partial
 * config file still yields a usable configuration.
 */
struct AppConfig {
    // General settings
    std::string dataDir;               ///< Database and log directory (config dir when empty).
    std::string logLevel{"info"};      ///< Console log level (trace..critical, off).

    // Discovery engine
    int defaultTimeoutSeconds{2};      ///< Per-attempt probe timeout when a rule sets none.
    int defaultMaxConcurrentScans{5};  ///< Hosts probed in parallel when a rule sets none.
    int progressInterval{50};          ///< Hosts between progress reports.
    int minPrefixLength{8};            ///< Shortest subnet prefix swept (0 for no limit).
    int asioThreads{4};                ///< Worker threads of the I/O context.
    bool schedulerEnabled{true};       ///< Run discovery rules on their schedule.
    int schedulerTickSeconds{10};      ///< How often the scheduler checks due rules.

    // Data retention
    int dataRetentionDays{30};   ///< Days to keep unpromoted discovered devices.
    bool autoCleanup{true};      ///< Run the retention task daily.
};

/**
 * @brief Manages application configuration persistence.
 *
 * Loads and saves config.json in the configuration directory. A missing
 * file is created with the defaults.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory (created if absent).
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk.
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    std::filesystem::path configPath() const { return configPath_; }

    /**
     * @brief Returns the directory holding the database and log file.
     *
     * A relative data_dir is resolved against the config directory.
     */
    std::filesystem::path dataDir() const;

    /**
     * @brief Returns the path to the database file.
     * @return Path to rackscan.db inside the data directory.
     */
    std::filesystem::path databasePath() const;

    /**
     * @brief Returns the path to the rotating log file.
     * @return Path to rackscan.log inside the data directory.
     */
    std::filesystem::path logPath() const;

    std::string configDir() const { return configDir_.string(); }

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace rackscan::infra
