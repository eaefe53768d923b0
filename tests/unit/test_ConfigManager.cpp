#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "infrastructure/config/ConfigManager.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>

using namespace fleetwatch::infra;
using namespace fleetwatch::core;

namespace {

class TestConfigDir {
public:
    TestConfigDir()
        : configDir_(std::filesystem::temp_directory_path() / "fleetwatch_config_test") {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::filesystem::path path() const { return configDir_; }

    void write(const std::string& content) const {
        std::ofstream file(configDir_ / "config.json");
        file << content;
    }

private:
    void cleanup() {
        if (std::filesystem::exists(configDir_)) {
            std::filesystem::remove_all(configDir_);
        }
    }

    std::filesystem::path configDir_;
};

ConfigManager::EnvLookup fakeEnv(std::map<std::string, std::string> vars = {}) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

} // namespace

TEST_CASE("ConfigManager constructor", "[ConfigManager]") {
    SECTION("Creates config directory if it does not exist") {
        auto tempPath = std::filesystem::temp_directory_path() / "fleetwatch_config_new_test";
        std::filesystem::remove_all(tempPath);

        REQUIRE_FALSE(std::filesystem::exists(tempPath));

        ConfigManager manager(tempPath, fakeEnv());

        REQUIRE(std::filesystem::exists(tempPath));
        REQUIRE(std::filesystem::is_directory(tempPath));

        std::filesystem::remove_all(tempPath);
    }

    SECTION("Paths") {
        TestConfigDir testDir;
        ConfigManager manager(testDir.path(), fakeEnv());

        REQUIRE(manager.configPath() == testDir.path() / "config.json");
        REQUIRE(manager.stateDbPath() == testDir.path() / "state.db");
        REQUIRE(manager.logDir() == testDir.path() / "logs");

        manager.config().stateDbPath = "/var/lib/fleetwatch/state.db";
        REQUIRE(manager.stateDbPath() == "/var/lib/fleetwatch/state.db");
    }
}

TEST_CASE("ConfigManager load operations", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("load writes defaults when the file does not exist") {
        ConfigManager manager(testDir.path(), fakeEnv());

        REQUIRE(manager.load());
        REQUIRE(std::filesystem::exists(manager.configPath()));

        const auto& config = manager.config();
        REQUIRE(config.scan.subnet.empty());
        REQUIRE(config.scan.ports == "9100,631,80,443");
        REQUIRE(config.scan.maxHosts == 4096);
        REQUIRE(config.scan.tcpRetries == 1);
        REQUIRE(config.scan.tcpConcurrency == 256);
        REQUIRE(config.poll.jitterMaxMs == 250);
        REQUIRE(config.poll.offlineConfirmations == 2);
        REQUIRE(config.poll.circuitFailureThreshold == 4);
        REQUIRE(config.poll.circuitOpenSeconds == 300);
        REQUIRE(config.poll.resilienceStateTtlSeconds == 86400);
        REQUIRE(config.poll.maxWorkers == 20);
        REQUIRE(config.apiPort == 8090);
        REQUIRE(config.logLevel == "info");
    }

    SECTION("load reads nested sections") {
        testDir.write(R"({
            "scan": {"subnet": "10.0.0.0/24, 10.0.1.0/24", "tcp_timeout": 0.75, "max_hosts": 512},
            "poll": {"offline_confirmations": 3, "max_workers": 8},
            "api": {"port": 9000},
            "logging": {"level": "debug"}
        })");
        ConfigManager manager(testDir.path(), fakeEnv());

        REQUIRE(manager.load());
        const auto& config = manager.config();
        REQUIRE(config.scan.subnet == "10.0.0.0/24, 10.0.1.0/24");
        REQUIRE_THAT(config.scan.tcpTimeoutSeconds, Catch::Matchers::WithinAbs(0.75, 1e-9));
        REQUIRE(config.scan.maxHosts == 512);
        REQUIRE(config.poll.offlineConfirmations == 3);
        REQUIRE(config.poll.maxWorkers == 8);
        REQUIRE(config.poll.circuitFailureThreshold == 4);
        REQUIRE(config.apiPort == 9000);
        REQUIRE(config.logLevel == "debug");
    }

    SECTION("load returns false for invalid JSON") {
        testDir.write("{ this is not json");
        ConfigManager manager(testDir.path(), fakeEnv());

        REQUIRE_FALSE(manager.load());
        REQUIRE(manager.config().apiPort == 8090);
    }
}

TEST_CASE("ConfigManager environment overlay", "[ConfigManager]") {
    TestConfigDir testDir;
    testDir.write(R"({"scan": {"subnet": "192.168.0.0/24"}, "poll": {"jitter_max_ms": 100}})");

    SECTION("Environment wins over the file") {
        ConfigManager manager(testDir.path(), fakeEnv({{"SCAN_SUBNET", "172.16.0.0/22"},
                                                       {"SCAN_TCP_TIMEOUT", "2.5"},
                                                       {"POLL_JITTER_MAX_MS", "0"},
                                                       {"POLL_CIRCUIT_OPEN_SECONDS", "60"},
                                                       {"API_PORT", "18090"},
                                                       {"LOG_LEVEL", "warn"}}));
        REQUIRE(manager.load());

        const auto& config = manager.config();
        REQUIRE(config.scan.subnet == "172.16.0.0/22");
        REQUIRE_THAT(config.scan.tcpTimeoutSeconds, Catch::Matchers::WithinAbs(2.5, 1e-9));
        REQUIRE(config.poll.jitterMaxMs == 0);
        REQUIRE(config.poll.circuitOpenSeconds == 60);
        REQUIRE(config.apiPort == 18090);
        REQUIRE(config.logLevel == "warn");
    }

    SECTION("Malformed values are ignored") {
        ConfigManager manager(testDir.path(), fakeEnv({{"POLL_JITTER_MAX_MS", "fast"},
                                                       {"SCAN_TCP_TIMEOUT", "1s"},
                                                       {"SCAN_MAX_HOSTS", "12abc"},
                                                       {"API_PORT", "70000"}}));
        REQUIRE(manager.load());

        const auto& config = manager.config();
        REQUIRE(config.poll.jitterMaxMs == 100);
        REQUIRE_THAT(config.scan.tcpTimeoutSeconds, Catch::Matchers::WithinAbs(1.0, 1e-9));
        REQUIRE(config.scan.maxHosts == 4096);
        REQUIRE(config.apiPort == 8090);
    }
}

TEST_CASE("ConfigManager save operations", "[ConfigManager]") {
    TestConfigDir testDir;

    ConfigManager manager(testDir.path(), fakeEnv());
    manager.config().scan.ports = "9100";
    manager.config().poll.resilienceStateTtlSeconds = 7200;
    manager.config().ioThreads = 2;
    REQUIRE(manager.save());

    ConfigManager reloaded(testDir.path(), fakeEnv());
    REQUIRE(reloaded.load());
    REQUIRE(reloaded.config().scan.ports == "9100");
    REQUIRE(reloaded.config().poll.resilienceStateTtlSeconds == 7200);
    REQUIRE(reloaded.config().ioThreads == 2);

    SECTION("File uses nested snake_case sections") {
        std::ifstream file(manager.configPath());
        nlohmann::json j;
        file >> j;
        REQUIRE(j["scan"]["ports"] == "9100");
        REQUIRE(j["poll"]["resilience_state_ttl_seconds"] == 7200);
        REQUIRE(j["io"]["threads"] == 2);
        REQUIRE(j["api"]["port"] == 8090);
    }
}

TEST_CASE("ConfigManager secure storage", "[ConfigManager]") {
    TestConfigDir testDir;
    ConfigManager manager(testDir.path(), fakeEnv());

    SECTION("setSecureValue and getSecureValue roundtrip") {
        manager.setSecureValue("ssh_password", "p@$$w0rd!#");
        REQUIRE(manager.getSecureValue("ssh_password") == "p@$$w0rd!#");
    }

    SECTION("getSecureValue returns nullopt for non-existent key") {
        REQUIRE_FALSE(manager.getSecureValue("missing").has_value());
    }

    SECTION("Stored values are not plaintext") {
        manager.setSecureValue("ssh_password", "plain-secret");
        std::ifstream file(manager.configPath());
        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        REQUIRE(content.find("plain-secret") == std::string::npos);
    }

    SECTION("Secure values persist after save/load") {
        manager.setSecureValue("community", "private");

        ConfigManager reloaded(testDir.path(), fakeEnv());
        REQUIRE(reloaded.load());
        REQUIRE(reloaded.getSecureValue("community") == "private");
    }
}

TEST_CASE("ConfigManager internal token", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("No token configured") {
        ConfigManager manager(testDir.path(), fakeEnv());
        REQUIRE_FALSE(manager.internalToken().has_value());
    }

    SECTION("Stored token") {
        ConfigManager manager(testDir.path(), fakeEnv());
        manager.setSecureValue(ConfigManager::kInternalTokenKey, "stored-token");
        REQUIRE(manager.internalToken() == "stored-token");
    }

    SECTION("Environment token wins") {
        ConfigManager manager(testDir.path(), fakeEnv({{"INTERNAL_SERVICE_TOKEN", "env-token"}}));
        manager.setSecureValue(ConfigManager::kInternalTokenKey, "stored-token");
        REQUIRE(manager.internalToken() == "env-token");
    }

    SECTION("Empty stored token disables the check") {
        ConfigManager manager(testDir.path(), fakeEnv());
        manager.setSecureValue(ConfigManager::kInternalTokenKey, "");
        REQUIRE_FALSE(manager.internalToken().has_value());
    }
}
