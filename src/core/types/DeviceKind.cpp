#include "core/types/DeviceKind.hpp"

#include "core/types/Errors.hpp"

namespace fleetwatch::core {

std::string deviceKindToString(DeviceKind kind) {
    switch (kind) {
    case DeviceKind::Printer:
        return "printer";
    case DeviceKind::Switch:
        return "switch";
    case DeviceKind::MediaPlayer:
        return "media_player";
    case DeviceKind::LabelPrinter:
        return "label_printer";
    case DeviceKind::Generic:
        return "generic";
    }
    return "generic";
}

std::optional<DeviceKind> deviceKindFromString(const std::string& name) {
    if (name == "printer")
        return DeviceKind::Printer;
    if (name == "switch")
        return DeviceKind::Switch;
    if (name == "media_player")
        return DeviceKind::MediaPlayer;
    if (name == "label_printer")
        return DeviceKind::LabelPrinter;
    if (name == "generic")
        return DeviceKind::Generic;
    return std::nullopt;
}

DeviceKind parseDeviceKind(const std::string& name) {
    auto kind = deviceKindFromString(name);
    if (!kind) {
        throw ConfigurationError("Unsupported device kind: " + name);
    }
    return *kind;
}

bool isDiscoverable(DeviceKind kind) {
    return kind == DeviceKind::Printer || kind == DeviceKind::Switch ||
           kind == DeviceKind::MediaPlayer;
}

} // namespace fleetwatch::core
