#include "core/types/DiscoveryTypes.hpp"

#include <algorithm>

namespace fleetwatch::core {

namespace {

template <typename T>
void putOptional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

std::optional<std::string> optionalString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

} // namespace

std::string scanStatusToString(ScanStatus status) {
    switch (status) {
    case ScanStatus::Idle:
        return "idle";
    case ScanStatus::Running:
        return "running";
    case ScanStatus::Done:
        return "done";
    case ScanStatus::Error:
        return "error";
    }
    return "idle";
}

ScanStatus scanStatusFromString(const std::string& str) {
    if (str == "running")
        return ScanStatus::Running;
    if (str == "done")
        return ScanStatus::Done;
    if (str == "error")
        return ScanStatus::Error;
    return ScanStatus::Idle;
}

nlohmann::json ScanProgress::toJson() const {
    nlohmann::json j;
    j["status"] = scanStatusToString(status);
    j["scanned"] = scanned;
    j["total"] = total;
    j["found"] = found;
    putOptional(j, "message", message);
    return j;
}

ScanProgress ScanProgress::fromJson(const nlohmann::json& j) {
    ScanProgress progress;
    progress.status = scanStatusFromString(j.value("status", "idle"));
    progress.scanned = j.value("scanned", size_t{0});
    progress.total = j.value("total", size_t{0});
    progress.found = j.value("found", size_t{0});
    progress.message = optionalString(j, "message");
    return progress;
}

KnownDevice KnownDevice::fromJson(const nlohmann::json& j) {
    KnownDevice device;
    // Inventory ids arrive as strings or integers
    device.id = optionalString(j, "id").value_or("");
    device.ipAddress = optionalString(j, "ip_address").value_or("");
    device.macAddress = optionalString(j, "mac_address");
    return device;
}

bool DiscoveredDevice::hasAnyPort(std::initializer_list<uint16_t> ports) const {
    return std::any_of(ports.begin(), ports.end(), [this](uint16_t port) {
        return std::find(openPorts.begin(), openPorts.end(), port) != openPorts.end();
    });
}

nlohmann::json DiscoveredDevice::toJson() const {
    nlohmann::json j;
    j["ip"] = ip;
    putOptional(j, "mac", mac);
    j["open_ports"] = openPorts;
    putOptional(j, "hostname", hostname);
    putOptional(j, "model_info", modelInfo);
    putOptional(j, "vendor", vendor);
    if (deviceKind) {
        j["device_kind"] = deviceKindToString(*deviceKind);
    } else {
        j["device_kind"] = nullptr;
    }
    j["is_known"] = isKnown;
    putOptional(j, "known_device_id", knownDeviceId);
    j["ip_changed"] = ipChanged;
    putOptional(j, "old_ip", oldIp);
    return j;
}

DiscoveredDevice DiscoveredDevice::fromJson(const nlohmann::json& j) {
    DiscoveredDevice device;
    device.ip = j.value("ip", "");
    device.mac = optionalString(j, "mac");
    if (j.contains("open_ports") && j["open_ports"].is_array()) {
        device.openPorts = j["open_ports"].get<std::vector<uint16_t>>();
    }
    device.hostname = optionalString(j, "hostname");
    device.modelInfo = optionalString(j, "model_info");
    device.vendor = optionalString(j, "vendor");
    if (auto kind = optionalString(j, "device_kind")) {
        device.deviceKind = deviceKindFromString(*kind);
    }
    device.isKnown = j.value("is_known", false);
    device.knownDeviceId = optionalString(j, "known_device_id");
    device.ipChanged = j.value("ip_changed", false);
    device.oldIp = optionalString(j, "old_ip");
    return device;
}

} // namespace fleetwatch::core
