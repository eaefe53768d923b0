#pragma once

#include "infrastructure/api/RestApiServer.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/KeyValueStore.hpp"
#include "infrastructure/discovery/DiscoveryService.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/polling/PollCycleRunner.hpp"
#include "infrastructure/probes/ProbeSet.hpp"

#include <asio.hpp>
#include <filesystem>
#include <memory>

namespace fleetwatch::app {

/**
 * @brief Owns every component of the engine and runs the control API until a signal arrives.
 */
class Application {
public:
    static constexpr std::chrono::seconds kPurgeInterval{60};

    explicit Application(const std::filesystem::path& configDir);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Serves until SIGINT or SIGTERM.
     * @return Process exit code.
     */
    int run();

    infra::ConfigManager& config() { return *config_; }
    infra::DiscoveryService& discovery() { return *discovery_; }
    infra::PollCycleRunner& poller() { return *poller_; }

private:
    void initializeLogging();
    void applyLogLevel();
    void initializeComponents();
    void schedulePurge();

    std::filesystem::path configDir_;
    std::unique_ptr<infra::ConfigManager> config_;
    std::shared_ptr<infra::Database> database_;
    std::shared_ptr<infra::KeyValueStore> store_;
    std::unique_ptr<infra::AsioContext> ioContext_;
    std::unique_ptr<infra::AsioContext> apiContext_;

    std::shared_ptr<infra::DiscoveryService> discovery_;
    std::shared_ptr<infra::ProbeSet> probes_;
    std::shared_ptr<infra::PollCycleRunner> poller_;
    std::shared_ptr<infra::RestApiServer> restApiServer_;
    std::unique_ptr<asio::steady_timer> purgeTimer_;
};

} // namespace fleetwatch::app
