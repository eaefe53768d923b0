#include "core/types/PollTypes.hpp"

#include "core/types/Errors.hpp"

#include <cctype>

namespace fleetwatch::core {

namespace {

template <typename T>
nlohmann::json orNull(const std::optional<T>& value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

std::optional<std::string> stringField(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        auto value = it->get<std::string>();
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    }
    return it->dump();
}

} // namespace

PollTarget PollTarget::fromJson(const nlohmann::json& j, DeviceKind kind) {
    PollTarget target;
    target.kind = kind;
    target.id = stringField(j, "id").value_or("");
    target.address = stringField(j, "address").value_or(stringField(j, "ip_address").value_or(""));
    if (target.address.empty()) {
        throw ConfigurationError("Poll target '" + target.id + "' has no address");
    }
    target.vendor = stringField(j, "vendor").value_or("");
    for (auto& c : target.vendor) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    target.deviceType = stringField(j, "device_type");
    target.lastOnline = j.value("is_online", false);
    target.macAddress = stringField(j, "mac_address");
    target.snmpCommunity = stringField(j, "snmp_community").value_or("public");
    target.snmpWriteCommunity = stringField(j, "snmp_write_community");

    if (j.contains("ssh") && j["ssh"].is_object()) {
        const auto& ssh = j["ssh"];
        ShellCredentials creds;
        creds.username = ssh.value("username", "");
        creds.password = ssh.value("password", "");
        creds.enableSecret = stringField(ssh, "enable_secret");
        creds.port = ssh.value("port", uint16_t{22});
        if (!creds.username.empty()) {
            target.shell = creds;
        }
    }
    return target;
}

nlohmann::json TonerLevel::toJson() const {
    return {{"description", description},
            {"color", orNull(color)},
            {"level_pct", orNull(levelPct)},
            {"max_capacity", maxCapacity},
            {"current_level", currentLevel}};
}

nlohmann::json MediaPlayerStatus::toJson() const {
    return {{"now_playing", orNull(nowPlaying)},
            {"is_playing", isPlaying},
            {"state", orNull(state)},
            {"position", orNull(position)},
            {"duration", orNull(duration)},
            {"files", files},
            {"free_space", orNull(freeSpace)}};
}

nlohmann::json PollOutcome::toJson() const {
    nlohmann::json j;
    j["probed_online"] = probedOnline;
    j["probed_error"] = probedError;
    j["error"] = orNull(errorMessage);
    j["hostname"] = orNull(hostname);
    j["model"] = orNull(model);
    j["os_version"] = orNull(osVersion);
    j["uptime"] = orNull(uptime);
    j["mac_address"] = orNull(macAddress);
    j["open_ports"] = openPorts;
    j["printer_status"] = orNull(printerStatus);

    auto tonerArray = nlohmann::json::array();
    for (const auto& toner : toners) {
        tonerArray.push_back(toner.toJson());
    }
    j["toners"] = tonerArray;
    j["media_player"] = mediaPlayer ? mediaPlayer->toJson() : nlohmann::json(nullptr);
    return j;
}

nlohmann::json PortState::toJson() const {
    return {{"port", port},
            {"if_index", ifIndex},
            {"description", orNull(description)},
            {"admin_status", orNull(adminStatus)},
            {"oper_status", orNull(operStatus)},
            {"speed_mbps", orNull(speedMbps)},
            {"duplex", orNull(duplex)},
            {"vlan", orNull(vlan)},
            {"poe_enabled", orNull(poeEnabled)},
            {"poe_power_w", orNull(poePowerW)},
            {"mac_count", orNull(macCount)}};
}

nlohmann::json AccessPointInfo::toJson() const {
    return {{"mac_address", macAddress},
            {"port", port},
            {"vlan", vlan},
            {"ip_address", orNull(ipAddress)},
            {"cdp_name", orNull(cdpName)},
            {"cdp_platform", orNull(cdpPlatform)},
            {"poe_power", orNull(poePower)},
            {"poe_status", orNull(poeStatus)}};
}

PortConfigChange PortConfigChange::fromJson(const nlohmann::json& j) {
    PortConfigChange change;
    change.port = stringField(j, "port").value_or("");
    if (change.port.empty()) {
        throw ConfigurationError("Port change requires a port name");
    }

    if (auto admin = stringField(j, "admin_status")) {
        if (*admin != "up" && *admin != "down") {
            throw ConfigurationError("admin_status must be 'up' or 'down'");
        }
        change.setting = AdminStateChange{*admin == "up"};
    } else if (j.contains("description") && j["description"].is_string()) {
        change.setting = DescriptionChange{j["description"].get<std::string>()};
    } else if (j.contains("vlan") && j["vlan"].is_number_integer()) {
        int vlan = j["vlan"].get<int>();
        if (vlan < 1 || vlan > 4094) {
            throw ConfigurationError("VLAN must be between 1 and 4094");
        }
        change.setting = VlanChange{vlan};
    } else if (auto poe = stringField(j, "poe")) {
        if (*poe == "on") {
            change.setting = PoeChange{PoeAction::On};
        } else if (*poe == "off") {
            change.setting = PoeChange{PoeAction::Off};
        } else if (*poe == "cycle") {
            change.setting = PoeChange{PoeAction::Cycle};
        } else {
            throw ConfigurationError("poe must be 'on', 'off' or 'cycle'");
        }
    } else {
        throw ConfigurationError("Port change for '" + change.port + "' names no setting");
    }
    return change;
}

} // namespace fleetwatch::core
