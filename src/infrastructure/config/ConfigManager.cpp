#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace rackscan::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, writing defaults to {}", configPath_.string());
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // General
    j["general"]["data_dir"] = config_.dataDir;
    j["general"]["log_level"] = config_.logLevel;

    // Discovery
    j["discovery"]["default_timeout_seconds"] = config_.defaultTimeoutSeconds;
    j["discovery"]["default_max_concurrent_scans"] = config_.defaultMaxConcurrentScans;
    j["discovery"]["progress_interval"] = config_.progressInterval;
    j["discovery"]["min_prefix_length"] = config_.minPrefixLength;
    j["discovery"]["asio_threads"] = config_.asioThreads;
    j["discovery"]["scheduler_enabled"] = config_.schedulerEnabled;
    j["discovery"]["scheduler_tick_seconds"] = config_.schedulerTickSeconds;

    // Data retention
    j["data"]["retention_days"] = config_.dataRetentionDays;
    j["data"]["auto_cleanup"] = config_.autoCleanup;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    // General
    if (j.contains("general")) {
        const auto& g = j["general"];
        config_.dataDir = g.value("data_dir", "");
        config_.logLevel = g.value("log_level", "info");
    }

    // Discovery
    if (j.contains("discovery")) {
        const auto& d = j["discovery"];
        config_.defaultTimeoutSeconds = d.value("default_timeout_seconds", 2);
        config_.defaultMaxConcurrentScans = d.value("default_max_concurrent_scans", 5);
        config_.progressInterval = d.value("progress_interval", 50);
        config_.minPrefixLength = d.value("min_prefix_length", 8);
        config_.asioThreads = d.value("asio_threads", 4);
        config_.schedulerEnabled = d.value("scheduler_enabled", true);
        config_.schedulerTickSeconds = d.value("scheduler_tick_seconds", 10);
    }

    // Data
    if (j.contains("data")) {
        const auto& d = j["data"];
        config_.dataRetentionDays = d.value("retention_days", 30);
        config_.autoCleanup = d.value("auto_cleanup", true);
    }
}

std::filesystem::path ConfigManager::dataDir() const {
    if (config_.dataDir.empty()) {
        return configDir_;
    }
    std::filesystem::path dir(config_.dataDir);
    return dir.is_absolute() ? dir : configDir_ / dir;
}

std::filesystem::path ConfigManager::databasePath() const {
    return dataDir() / "rackscan.db";
}

std::filesystem::path ConfigManager::logPath() const {
    return dataDir() / "rackscan.log";
}

} // namespace rackscan::infra
