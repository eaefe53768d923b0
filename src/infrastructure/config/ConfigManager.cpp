#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace fleetwatch::infra {

namespace {

std::optional<int> parseInt(const std::string& text) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<double> parseDouble(const std::string& text) {
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

ConfigManager::ConfigManager(const std::filesystem::path& configDir, EnvLookup env)
    : configDir_(configDir), env_(std::move(env)) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }
    if (!env_) {
        env_ = [](const std::string& name) -> std::optional<std::string> {
            const char* value = std::getenv(name.c_str());
            if (!value) {
                return std::nullopt;
            }
            return std::string(value);
        };
    }

    configPath_ = configDir_ / "config.json";
    secretBox_ = std::make_unique<SecretBox>(configDir_ / ".keyfile");
}

bool ConfigManager::load() {
    bool ok = true;

    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, writing defaults to {}", configPath_.string());
        save();
    } else {
        try {
            std::ifstream file(configPath_);
            if (!file) {
                throw std::runtime_error("cannot open " + configPath_.string());
            }
            nlohmann::json j;
            file >> j;
            fromJson(j, config_);
            if (j.contains("secure") && j["secure"].is_object()) {
                secureValues_ = j["secure"];
            }
            spdlog::info("Loaded configuration from {}", configPath_.string());
        } catch (const std::exception& e) {
            spdlog::error("Failed to load config: {}", e.what());
            ok = false;
        }
    }

    applyEnvironment();
    return ok;
}

bool ConfigManager::save() {
    try {
        auto j = toJson(config_);
        if (!secureValues_.empty()) {
            j["secure"] = secureValues_;
        }

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

void ConfigManager::applyEnvironment() {
    auto text = [this](const char* name, std::string& target) {
        if (auto value = env_(name)) {
            target = *value;
        }
    };
    auto integer = [this](const char* name, int& target) {
        if (auto value = env_(name)) {
            if (auto parsed = parseInt(*value)) {
                target = *parsed;
            } else {
                spdlog::warn("Ignoring {}='{}': not an integer", name, *value);
            }
        }
    };

    text("SCAN_SUBNET", config_.scan.subnet);
    text("SCAN_PORTS", config_.scan.ports);
    integer("SCAN_MAX_HOSTS", config_.scan.maxHosts);
    if (auto value = env_("SCAN_TCP_TIMEOUT")) {
        if (auto parsed = parseDouble(*value)) {
            config_.scan.tcpTimeoutSeconds = *parsed;
        } else {
            spdlog::warn("Ignoring SCAN_TCP_TIMEOUT='{}': not a number", *value);
        }
    }
    integer("SCAN_TCP_RETRIES", config_.scan.tcpRetries);
    integer("SCAN_TCP_CONCURRENCY", config_.scan.tcpConcurrency);

    integer("POLL_JITTER_MAX_MS", config_.poll.jitterMaxMs);
    integer("POLL_OFFLINE_CONFIRMATIONS", config_.poll.offlineConfirmations);
    integer("POLL_CIRCUIT_FAILURE_THRESHOLD", config_.poll.circuitFailureThreshold);
    integer("POLL_CIRCUIT_OPEN_SECONDS", config_.poll.circuitOpenSeconds);
    integer("POLL_RESILIENCE_STATE_TTL_SECONDS", config_.poll.resilienceStateTtlSeconds);
    integer("POLL_MAX_WORKERS", config_.poll.maxWorkers);

    int apiPort = config_.apiPort;
    integer("API_PORT", apiPort);
    if (apiPort > 0 && apiPort <= 65535) {
        config_.apiPort = static_cast<uint16_t>(apiPort);
    } else {
        spdlog::warn("Ignoring API_PORT={}: out of range", apiPort);
    }

    integer("IO_THREADS", config_.ioThreads);
    text("STATE_DB_PATH", config_.stateDbPath);
    text("LOG_LEVEL", config_.logLevel);
}

nlohmann::json ConfigManager::toJson(const EngineConfig& config) {
    nlohmann::json j;

    j["scan"]["subnet"] = config.scan.subnet;
    j["scan"]["ports"] = config.scan.ports;
    j["scan"]["max_hosts"] = config.scan.maxHosts;
    j["scan"]["tcp_timeout"] = config.scan.tcpTimeoutSeconds;
    j["scan"]["tcp_retries"] = config.scan.tcpRetries;
    j["scan"]["tcp_concurrency"] = config.scan.tcpConcurrency;

    j["poll"]["jitter_max_ms"] = config.poll.jitterMaxMs;
    j["poll"]["offline_confirmations"] = config.poll.offlineConfirmations;
    j["poll"]["circuit_failure_threshold"] = config.poll.circuitFailureThreshold;
    j["poll"]["circuit_open_seconds"] = config.poll.circuitOpenSeconds;
    j["poll"]["resilience_state_ttl_seconds"] = config.poll.resilienceStateTtlSeconds;
    j["poll"]["max_workers"] = config.poll.maxWorkers;

    j["api"]["port"] = config.apiPort;
    j["state"]["db_path"] = config.stateDbPath;
    j["logging"]["level"] = config.logLevel;
    j["io"]["threads"] = config.ioThreads;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j, EngineConfig& config) {
    if (j.contains("scan")) {
        const auto& s = j["scan"];
        config.scan.subnet = s.value("subnet", config.scan.subnet);
        config.scan.ports = s.value("ports", config.scan.ports);
        config.scan.maxHosts = s.value("max_hosts", config.scan.maxHosts);
        config.scan.tcpTimeoutSeconds = s.value("tcp_timeout", config.scan.tcpTimeoutSeconds);
        config.scan.tcpRetries = s.value("tcp_retries", config.scan.tcpRetries);
        config.scan.tcpConcurrency = s.value("tcp_concurrency", config.scan.tcpConcurrency);
    }

    if (j.contains("poll")) {
        const auto& p = j["poll"];
        config.poll.jitterMaxMs = p.value("jitter_max_ms", config.poll.jitterMaxMs);
        config.poll.offlineConfirmations =
            p.value("offline_confirmations", config.poll.offlineConfirmations);
        config.poll.circuitFailureThreshold =
            p.value("circuit_failure_threshold", config.poll.circuitFailureThreshold);
        config.poll.circuitOpenSeconds =
            p.value("circuit_open_seconds", config.poll.circuitOpenSeconds);
        config.poll.resilienceStateTtlSeconds =
            p.value("resilience_state_ttl_seconds", config.poll.resilienceStateTtlSeconds);
        config.poll.maxWorkers = p.value("max_workers", config.poll.maxWorkers);
    }

    if (j.contains("api")) {
        config.apiPort = j["api"].value("port", config.apiPort);
    }
    if (j.contains("state")) {
        config.stateDbPath = j["state"].value("db_path", config.stateDbPath);
    }
    if (j.contains("logging")) {
        config.logLevel = j["logging"].value("level", config.logLevel);
    }
    if (j.contains("io")) {
        config.ioThreads = j["io"].value("threads", config.ioThreads);
    }
}

void ConfigManager::setSecureValue(const std::string& key, const std::string& value) {
    secureValues_[key] = secretBox_->seal(value);
    save();
}

std::optional<std::string> ConfigManager::getSecureValue(const std::string& key) const {
    if (!secureValues_.contains(key) || !secureValues_[key].is_string()) {
        return std::nullopt;
    }
    auto value = secretBox_->open(secureValues_[key].get<std::string>());
    if (!value) {
        spdlog::warn("Secure value '{}' cannot be decrypted with the current key", key);
    }
    return value;
}

std::optional<std::string> ConfigManager::internalToken() const {
    if (auto fromEnv = env_("INTERNAL_SERVICE_TOKEN"); fromEnv && !fromEnv->empty()) {
        return fromEnv;
    }
    auto stored = getSecureValue(kInternalTokenKey);
    if (stored && stored->empty()) {
        return std::nullopt;
    }
    return stored;
}

std::filesystem::path ConfigManager::stateDbPath() const {
    if (!config_.stateDbPath.empty()) {
        return config_.stateDbPath;
    }
    return configDir_ / "state.db";
}

} // namespace fleetwatch::infra
