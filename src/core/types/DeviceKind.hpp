#pragma once

#include <optional>
#include <string>

namespace fleetwatch::core {

/**
 * @brief Category of managed device.
 *
 * Printer, Switch and MediaPlayer can be discovered; LabelPrinter and Generic
 * are only polled.
 */
enum class DeviceKind {
    Printer,
    Switch,
    MediaPlayer,
    LabelPrinter,
    Generic
};

/**
 * @brief Converts a kind to its wire name ("printer", "switch", ...).
 */
std::string deviceKindToString(DeviceKind kind);

/**
 * @brief Parses a wire name.
 * @return The kind, or std::nullopt for unknown names.
 */
std::optional<DeviceKind> deviceKindFromString(const std::string& name);

/**
 * @brief Parses a wire name and throws ConfigurationError on unknown names.
 */
DeviceKind parseDeviceKind(const std::string& name);

/**
 * @brief Whether discovery scans are supported for this kind.
 */
bool isDiscoverable(DeviceKind kind);

} // namespace fleetwatch::core
