#include "app/Application.hpp"

#include "core/types/Errors.hpp"
#include "infrastructure/discovery/DeviceIdentifier.hpp"
#include "infrastructure/discovery/DiscoverySessionStore.hpp"
#include "infrastructure/network/HttpClient.hpp"
#include "infrastructure/network/NameResolver.hpp"
#include "infrastructure/network/NeighborTableReader.hpp"
#include "infrastructure/network/PortScanner.hpp"
#include "infrastructure/network/SnmpService.hpp"
#include "infrastructure/polling/ResilienceTracker.hpp"
#include "infrastructure/shell/CiscoShellClient.hpp"
#include "infrastructure/shell/SshShellTransport.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <future>

namespace fleetwatch::app {

namespace {

constexpr const char* VERSION = "1.0.0";
constexpr size_t API_THREADS = 4;

} // namespace

Application::Application(const std::filesystem::path& configDir) : configDir_(configDir) {
    std::filesystem::create_directories(configDir_);
    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    spdlog::info("FleetWatch shutting down...");

    if (restApiServer_) {
        restApiServer_->stop();
    }
    if (purgeTimer_) {
        purgeTimer_->cancel();
    }
    if (apiContext_) {
        apiContext_->stop();
    }
    if (ioContext_) {
        ioContext_->stop();
    }
}

void Application::initializeLogging() {
    auto logDir = configDir_ / "logs";
    std::filesystem::create_directories(logDir);
    auto logPath = logDir / "fleetwatch.log";

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto fileSink =
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath.string(), 5 * 1024 * 1024, 3);

    auto logger =
        std::make_shared<spdlog::logger>("fleetwatch", spdlog::sinks_init_list{consoleSink, fileSink});
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(spdlog::level::info);
    spdlog::set_default_logger(logger);

    spdlog::info("FleetWatch {} starting...", VERSION);
    spdlog::info("Log file: {}", logPath.string());
}

void Application::applyLogLevel() {
    const auto& name = config_->config().logLevel;
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("Unknown LOG_LEVEL '{}', keeping info", name);
        return;
    }
    spdlog::set_level(level);
}

void Application::initializeComponents() {
    config_ = std::make_unique<infra::ConfigManager>(configDir_);
    if (!config_->load()) {
        spdlog::warn("Using default configuration");
    }
    applyLogLevel();
    const auto& settings = config_->config();

    database_ = std::make_shared<infra::Database>(config_->stateDbPath().string());
    database_->runMigrations();
    store_ = std::make_shared<infra::KeyValueStore>(database_);

    ioContext_ = std::make_unique<infra::AsioContext>(static_cast<size_t>(settings.ioThreads));
    ioContext_->start();
    apiContext_ = std::make_unique<infra::AsioContext>(API_THREADS);

    // Network services
    auto scanner = std::make_shared<infra::PortScanner>(*ioContext_);
    auto snmp = std::make_shared<infra::SnmpService>();
    auto http = std::make_shared<infra::HttpClient>();
    auto neighbors = std::make_shared<infra::NeighborTableReader>();
    auto resolver = std::make_shared<infra::NameResolver>();

    // Discovery
    discovery_ = std::make_shared<infra::DiscoveryService>(
        std::make_shared<infra::DiscoverySessionStore>(store_), scanner,
        std::make_shared<infra::DeviceIdentifier>(snmp, http), neighbors, settings.scan);

    // Probes
    auto shell = std::make_shared<infra::CiscoShellClient>(std::make_shared<infra::SshShellTransport>());
    auto snmpSwitch = std::make_shared<infra::SnmpSwitchProbe>(snmp);
    probes_ = std::make_shared<infra::ProbeSet>(
        std::make_shared<infra::GenericProbe>(scanner, snmp, resolver, neighbors), snmpSwitch,
        std::make_shared<infra::ShellSwitchProbe>(shell, snmpSwitch),
        std::make_shared<infra::MediaPlayerProbe>(scanner, std::make_shared<infra::IconbitClient>(http)),
        std::make_shared<infra::SnmpPrinterProbe>(snmp),
        std::make_shared<infra::TcpLivenessProbe>(scanner, infra::ProbeSet::kLabelPrinterPort,
                                                  infra::ProbeSet::kLabelPrinterTimeout));

    // Polling
    auto resilience = std::make_shared<infra::ResilienceTracker>(store_, settings.poll);
    poller_ = std::make_shared<infra::PollCycleRunner>(
        probes_, resilience, neighbors, static_cast<size_t>(std::max(settings.poll.maxWorkers, 1)));

    // Control API
    restApiServer_ = std::make_shared<infra::RestApiServer>(
        *apiContext_, infra::ApiServices{discovery_, poller_, probes_}, settings.apiPort);
    if (auto token = config_->internalToken()) {
        restApiServer_->setInternalToken(*token);
    } else {
        spdlog::warn("No internal service token configured; the control API is unauthenticated");
    }

    spdlog::info("Application components initialized");
}

void Application::schedulePurge() {
    purgeTimer_->expires_after(kPurgeInterval);
    purgeTimer_->async_wait([this](const asio::error_code& ec) {
        if (ec) {
            return;
        }
        try {
            int purged = store_->purgeExpired();
            if (purged > 0) {
                spdlog::debug("Purged {} expired state keys", purged);
            }
        } catch (const core::StateStoreError& e) {
            spdlog::warn("Expired state purge failed: {}", e.what());
        }
        schedulePurge();
    });
}

int Application::run() {
    restApiServer_->start();
    apiContext_->start();

    purgeTimer_ = std::make_unique<asio::steady_timer>(apiContext_->getContext());
    schedulePurge();

    std::promise<int> stopped;
    auto stoppedFuture = stopped.get_future();
    asio::signal_set signals(apiContext_->getContext(), SIGINT, SIGTERM);
    signals.async_wait([&stopped](const asio::error_code& ec, int signal) {
        if (!ec) {
            spdlog::info("Received signal {}, stopping", signal);
        }
        stopped.set_value(0);
    });

    int code = stoppedFuture.get();
    restApiServer_->stop();
    purgeTimer_->cancel();
    return code;
}

} // namespace fleetwatch::app
