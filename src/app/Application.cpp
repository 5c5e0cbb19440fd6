#include "app/Application.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <future>

namespace rackscan::app {

namespace {

constexpr const char* kVersion = "1.0.0";

} // namespace

void setupLogging(const std::filesystem::path& logPath, const std::string& consoleLevel) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(spdlog::level::from_str(consoleLevel));
    sinks.push_back(consoleSink);

    if (!logPath.empty()) {
        std::filesystem::create_directories(logPath.parent_path());
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath.string(), 5 * 1024 * 1024, 3);
        fileSink->set_level(spdlog::level::debug);
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>("rackscan", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);
}

Application::Application(const std::filesystem::path& configDir) {
    config_ = std::make_unique<infra::ConfigManager>(configDir);
    config_->load();

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    shutdown();
}

void Application::initializeLogging() {
    auto logPath = config_->logPath();
    setupLogging(logPath, config_->config().logLevel);

    spdlog::info("rackscan {} starting...", kVersion);
    spdlog::info("Log file: {}", logPath.string());
}

void Application::initializeComponents() {
    const auto& cfg = config_->config();

    // Database
    database_ = std::make_shared<infra::Database>(config_->databasePath().string());
    database_->runMigrations();

    // Asio context
    asioContext_ = std::make_unique<infra::AsioContext>(
        static_cast<size_t>(cfg.asioThreads > 0 ? cfg.asioThreads : 1));
    asioContext_->start();

    // Discovery engine
    store_ = std::make_unique<infra::SqliteDiscoveryStore>(database_);
    prober_ = std::make_unique<infra::HostProber>(*asioContext_);

    infra::DiscoveryScannerOptions scannerOptions;
    scannerOptions.defaultMaxConcurrentHosts = cfg.defaultMaxConcurrentScans;
    scannerOptions.defaultTimeout = std::chrono::seconds(cfg.defaultTimeoutSeconds);
    scannerOptions.progressInterval = cfg.progressInterval;
    scannerOptions.minPrefixLength = cfg.minPrefixLength;
    scanner_ = std::make_unique<infra::DiscoveryScanner>(*store_, *prober_, scannerOptions);

    discoveryService_ = std::make_unique<DiscoveryService>(database_, *scanner_);

    // Scheduler
    infra::DiscoverySchedulerOptions schedulerOptions;
    schedulerOptions.tickInterval = std::chrono::seconds(cfg.schedulerTickSeconds);
    schedulerOptions.autoCleanup = cfg.autoCleanup;
    schedulerOptions.retentionDays = cfg.dataRetentionDays;
    scheduler_ = std::make_unique<infra::DiscoveryScheduler>(
        *asioContext_, database_,
        [service = discoveryService_.get()](const core::DiscoveryRule& rule) {
            if (service->isScanRunning(rule.networkId)) {
                return false;
            }
            service->startRuleScan(rule);
            return true;
        },
        schedulerOptions);

    spdlog::info("Application components initialized");
}

int Application::run() {
    if (config_->config().schedulerEnabled) {
        scheduler_->start();
    } else {
        spdlog::info("Discovery scheduler disabled by configuration");
    }

    std::promise<int> stopSignal;
    auto stopped = stopSignal.get_future();

    asio::signal_set signals(asioContext_->getContext(), SIGINT, SIGTERM);
    signals.async_wait([&stopSignal](const asio::error_code& ec, int signalNumber) {
        if (ec) {
            stopSignal.set_value(0);
            return;
        }
        spdlog::info("Received signal {}, stopping", signalNumber);
        stopSignal.set_value(signalNumber);
    });

    stopped.wait();
    shutdown();
    return 0;
}

void Application::shutdown() {
    if (shutDown_) {
        return;
    }
    shutDown_ = true;

    spdlog::info("Application shutting down...");

    // Returns once no tick is inside the launcher, so the service can go
    if (scheduler_) {
        scheduler_->stop();
    }

    // Cancels running scans and joins them while probes can still complete
    discoveryService_.reset();

    if (asioContext_) {
        asioContext_->stop();
    }
}

} // namespace rackscan::app
