#include "infrastructure/shell/CiscoShellClient.hpp"

#include <spdlog/spdlog.h>

#include <thread>
#include <type_traits>

namespace fleetwatch::infra {

CiscoShellClient::CiscoShellClient(std::shared_ptr<core::IShellConnector> connector,
                                   ShellSession::Timing timing,
                                   std::chrono::milliseconds poeCycleDelay)
    : connector_(std::move(connector)), timing_(timing), poeCycleDelay_(poeCycleDelay) {}

std::unique_ptr<ShellSession> CiscoShellClient::openSession(
    const std::string& address, const core::ShellCredentials& credentials) {
    auto session = std::make_unique<ShellSession>(connector_, address, credentials, timing_);
    session->connect();
    return session;
}

core::cisco::VersionInfo CiscoShellClient::showVersion(const std::string& address,
                                                       const core::ShellCredentials& credentials) {
    auto session = openSession(address, credentials);
    return core::cisco::parseShowVersion(session->execute("show version"));
}

std::vector<core::PortState> CiscoShellClient::interfacesStatus(
    const std::string& address, const core::ShellCredentials& credentials) {
    auto session = openSession(address, credentials);
    return core::cisco::parseInterfacesStatus(session->execute("show interfaces status"));
}

std::vector<core::AccessPointInfo> CiscoShellClient::accessPoints(
    const std::string& address, const core::ShellCredentials& credentials, int vlan) {
    auto session = openSession(address, credentials);

    auto aps = core::cisco::parseCdpAccessPoints(session->execute("show cdp neighbors detail"), vlan);
    spdlog::info("CDP found {} access points on {} vlan {}", aps.size(), address, vlan);
    if (aps.empty()) {
        return aps;
    }

    const auto vlanText = std::to_string(vlan);
    auto macByPort =
        core::cisco::parseMacAddressTable(session->execute("show mac address-table vlan " + vlanText));
    auto poeByPort = core::cisco::parsePowerInline(session->execute("show power inline"));
    auto ipByMac = core::cisco::parseIpArp(session->execute("show ip arp vlan " + vlanText));

    core::cisco::enrichAccessPoints(aps, macByPort, poeByPort, ipByMac);
    return aps;
}

void CiscoShellClient::configure(const std::string& address,
                                 const core::ShellCredentials& credentials,
                                 const std::vector<std::string>& commands) {
    auto session = openSession(address, credentials);
    session->execute("configure terminal");
    for (const auto& command : commands) {
        session->execute(command);
    }
    session->execute("end");
}

std::vector<std::string> CiscoShellClient::interfaceCommands(const core::PortConfigChange& change) {
    std::vector<std::string> commands = {"interface " + change.port};
    std::visit(
        [&commands](const auto& setting) {
            using T = std::decay_t<decltype(setting)>;
            if constexpr (std::is_same_v<T, core::AdminStateChange>) {
                commands.push_back(setting.enabled ? "no shutdown" : "shutdown");
            } else if constexpr (std::is_same_v<T, core::DescriptionChange>) {
                commands.push_back("description " + setting.text);
            } else if constexpr (std::is_same_v<T, core::VlanChange>) {
                commands.push_back("switchport mode access");
                commands.push_back("switchport access vlan " + std::to_string(setting.vlan));
            } else if constexpr (std::is_same_v<T, core::PoeChange>) {
                commands.push_back(setting.action == core::PoeAction::Off ? "power inline never"
                                                                          : "power inline auto");
            }
        },
        change.setting);
    return commands;
}

void CiscoShellClient::applyPortChange(const std::string& address,
                                       const core::ShellCredentials& credentials,
                                       const core::PortConfigChange& change) {
    const auto* poe = std::get_if<core::PoeChange>(&change.setting);
    if (poe && poe->action == core::PoeAction::Cycle) {
        configure(address, credentials, {"interface " + change.port, "power inline never"});
        std::this_thread::sleep_for(poeCycleDelay_);
        configure(address, credentials, {"interface " + change.port, "power inline auto"});
        spdlog::info("PoE cycle completed on {} port {}", address, change.port);
        return;
    }
    configure(address, credentials, interfaceCommands(change));
}

} // namespace fleetwatch::infra
