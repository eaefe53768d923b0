/**
 * @file DiscoveryTypes.hpp
 * @brief Scan progress and discovered-device records.
 */

#pragma once

#include "core/types/DeviceKind.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace fleetwatch::core {

/**
 * @brief Lifecycle state of a discovery scan.
 */
enum class ScanStatus {
    Idle,
    Running,
    Done,
    Error
};

std::string scanStatusToString(ScanStatus status);
ScanStatus scanStatusFromString(const std::string& str);

/**
 * @brief Progress of the latest scan of one device kind.
 */
struct ScanProgress {
    ScanStatus status{ScanStatus::Idle};
    size_t scanned{0};
    size_t total{0};
    size_t found{0};
    std::optional<std::string> message;

    nlohmann::json toJson() const;
    static ScanProgress fromJson(const nlohmann::json& j);

    bool operator==(const ScanProgress& other) const = default;
};

/**
 * @brief Inventory record passed into a scan for correlation.
 */
struct KnownDevice {
    std::string id;
    std::string ipAddress;
    std::optional<std::string> macAddress;

    static KnownDevice fromJson(const nlohmann::json& j);
};

/**
 * @brief A host that answered the port scan, with everything learned about it.
 */
struct DiscoveredDevice {
    std::string ip;
    std::optional<std::string> mac;
    std::vector<uint16_t> openPorts;
    std::optional<std::string> hostname;
    std::optional<std::string> modelInfo;
    std::optional<std::string> vendor;
    std::optional<DeviceKind> deviceKind;
    bool isKnown{false};
    std::optional<std::string> knownDeviceId;
    bool ipChanged{false};
    std::optional<std::string> oldIp;

    [[nodiscard]] bool hasAnyPort(std::initializer_list<uint16_t> ports) const;

    nlohmann::json toJson() const;
    static DiscoveredDevice fromJson(const nlohmann::json& j);

    bool operator==(const DiscoveredDevice& other) const = default;
};

} // namespace fleetwatch::core
