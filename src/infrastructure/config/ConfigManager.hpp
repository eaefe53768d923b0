#pragma once

#include "infrastructure/crypto/SecretBox.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace fleetwatch::infra {

/**
 * @brief Discovery scan defaults.
 */
struct ScanSettings {
    std::string subnet;                      ///< SCAN_SUBNET, comma-separated CIDRs.
    std::string ports{"9100,631,80,443"};    ///< SCAN_PORTS
    int maxHosts{4096};                      ///< SCAN_MAX_HOSTS
    double tcpTimeoutSeconds{1.0};           ///< SCAN_TCP_TIMEOUT
    int tcpRetries{1};                       ///< SCAN_TCP_RETRIES
    int tcpConcurrency{256};                 ///< SCAN_TCP_CONCURRENCY
};

/**
 * @brief Bulk polling and resilience settings.
 */
struct PollSettings {
    int jitterMaxMs{250};                    ///< POLL_JITTER_MAX_MS
    int offlineConfirmations{2};             ///< POLL_OFFLINE_CONFIRMATIONS
    int circuitFailureThreshold{4};          ///< POLL_CIRCUIT_FAILURE_THRESHOLD
    int circuitOpenSeconds{300};             ///< POLL_CIRCUIT_OPEN_SECONDS
    int resilienceStateTtlSeconds{86400};    ///< POLL_RESILIENCE_STATE_TTL_SECONDS
    int maxWorkers{20};                      ///< POLL_MAX_WORKERS
};

/**
 * @brief Complete engine configuration.
 */
struct EngineConfig {
    ScanSettings scan;
    PollSettings poll;
    uint16_t apiPort{8090};                  ///< API_PORT
    std::string stateDbPath;                 ///< STATE_DB_PATH; empty means <configDir>/state.db
    std::string logLevel{"info"};            ///< LOG_LEVEL
    int ioThreads{4};                        ///< IO_THREADS
};

/**
 * @brief Loads config.json, overlays the environment and keeps secrets encrypted.
 *
 * Values come from the defaults above, then config.json, then environment
 * variables. Malformed environment values are logged and ignored.
 */
class ConfigManager {
public:
    /// Looks up an environment variable; std::nullopt when unset.
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @param configDir Directory holding config.json, the key file and logs.
     * @param env Environment source; the process environment when empty.
     */
    explicit ConfigManager(const std::filesystem::path& configDir, EnvLookup env = {});

    /**
     * @brief Reads config.json (writing defaults if it is missing) and overlays the environment.
     * @return False if the file exists but could not be parsed; defaults stay in effect.
     */
    bool load();

    bool save();

    /**
     * @brief Applies every recognised environment variable to the current configuration.
     */
    void applyEnvironment();

    EngineConfig& config() { return config_; }
    const EngineConfig& config() const { return config_; }

    void setSecureValue(const std::string& key, const std::string& value);
    std::optional<std::string> getSecureValue(const std::string& key) const;

    /**
     * @brief Token required on the control API; INTERNAL_SERVICE_TOKEN wins over the stored value.
     */
    std::optional<std::string> internalToken() const;

    /// Secure value name under which the control API token is stored.
    static constexpr const char* kInternalTokenKey = "internal_service_token";

    std::filesystem::path configPath() const { return configPath_; }
    std::filesystem::path stateDbPath() const;
    std::filesystem::path logDir() const { return configDir_ / "logs"; }

    static nlohmann::json toJson(const EngineConfig& config);
    static void fromJson(const nlohmann::json& j, EngineConfig& config);

private:
    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    EnvLookup env_;
    EngineConfig config_;
    std::unique_ptr<SecretBox> secretBox_;
    nlohmann::json secureValues_ = nlohmann::json::object();
};

} // namespace fleetwatch::infra
