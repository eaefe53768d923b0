/**
 * @file PollTypes.hpp
 * @brief Poll targets, probe outcomes and the attribute records probes return.
 */

#pragma once

#include "core/types/DeviceKind.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fleetwatch::core {

/**
 * @brief Credentials for an interactive shell session.
 */
struct ShellCredentials {
    std::string username;
    std::string password;
    std::optional<std::string> enableSecret; ///< Falls back to the password when unset
    uint16_t port{22};

    [[nodiscard]] const std::string& effectiveEnableSecret() const {
        return enableSecret ? *enableSecret : password;
    }
};

/**
 * @brief Read-only view of one inventory entity to poll.
 */
struct PollTarget {
    std::string id;
    DeviceKind kind{DeviceKind::Generic};
    std::string address;
    std::string vendor;                      ///< Lower-case vendor hint, may be empty
    std::optional<std::string> deviceType;   ///< Media player model family
    bool lastOnline{false};                  ///< Effective state as known by inventory
    std::optional<std::string> macAddress;
    std::string snmpCommunity{"public"};
    std::optional<std::string> snmpWriteCommunity;
    std::optional<ShellCredentials> shell;

    /**
     * @brief Builds a target from the control API representation.
     * @throws ConfigurationError if the address is missing.
     */
    static PollTarget fromJson(const nlohmann::json& j, DeviceKind kind);
};

/**
 * @brief One consumable slot of a printer.
 */
struct TonerLevel {
    std::string description;
    std::optional<std::string> color;
    std::optional<int> levelPct;
    int64_t maxCapacity{0};
    int64_t currentLevel{0};

    nlohmann::json toJson() const;

    bool operator==(const TonerLevel& other) const = default;
};

/**
 * @brief Playback state and storage of a media player.
 */
struct MediaPlayerStatus {
    std::optional<std::string> nowPlaying;
    bool isPlaying{false};
    std::optional<std::string> state;
    std::optional<int> position; ///< Seconds
    std::optional<int> duration; ///< Seconds
    std::vector<std::string> files;
    std::optional<std::string> freeSpace;

    nlohmann::json toJson() const;
};

/**
 * @brief Result of a single status probe, before resilience smoothing.
 *
 * probedError distinguishes a transport or protocol failure from a clean
 * "nothing answered" result. Only the former feeds the circuit breaker.
 */
struct PollOutcome {
    bool probedOnline{false};
    bool probedError{false};
    std::optional<std::string> errorMessage;

    std::optional<std::string> hostname;
    std::optional<std::string> model;
    std::optional<std::string> osVersion;
    std::optional<std::string> uptime;
    std::optional<std::string> macAddress;
    std::vector<uint16_t> openPorts;
    std::optional<std::string> printerStatus;
    std::vector<TonerLevel> toners;
    std::optional<MediaPlayerStatus> mediaPlayer;

    static PollOutcome error(const std::string& message) {
        PollOutcome outcome;
        outcome.probedError = true;
        outcome.errorMessage = message;
        return outcome;
    }

    nlohmann::json toJson() const;
};

/**
 * @brief One row of a switch port table.
 */
struct PortState {
    std::string port;
    int ifIndex{0};
    std::optional<std::string> description;
    std::optional<std::string> adminStatus;
    std::optional<std::string> operStatus;
    std::optional<int64_t> speedMbps;
    std::optional<std::string> duplex;
    std::optional<int> vlan;
    std::optional<bool> poeEnabled;
    std::optional<double> poePowerW;
    std::optional<int> macCount;

    nlohmann::json toJson() const;

    bool operator==(const PortState& other) const = default;
};

/**
 * @brief Wireless access point found behind a switch port.
 */
struct AccessPointInfo {
    std::string macAddress;
    std::string port;
    int vlan{0};
    std::optional<std::string> ipAddress;
    std::optional<std::string> cdpName;
    std::optional<std::string> cdpPlatform;
    std::optional<std::string> poePower;
    std::optional<std::string> poeStatus;

    nlohmann::json toJson() const;
};

struct AdminStateChange {
    bool enabled{true};
};

struct DescriptionChange {
    std::string text;
};

struct VlanChange {
    int vlan{1};
};

enum class PoeAction {
    On,
    Off,
    Cycle
};

struct PoeChange {
    PoeAction action{PoeAction::On};
};

using PortSetting = std::variant<AdminStateChange, DescriptionChange, VlanChange, PoeChange>;

/**
 * @brief A single configuration write to one switch port.
 */
struct PortConfigChange {
    std::string port;
    PortSetting setting;

    /**
     * @brief Parses {"port":..., "admin_status"|"description"|"vlan"|"poe": ...}.
     * @throws ConfigurationError on a missing port or an unrecognised setting.
     */
    static PortConfigChange fromJson(const nlohmann::json& j);
};

} // namespace fleetwatch::core
