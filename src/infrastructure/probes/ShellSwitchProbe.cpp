#include "infrastructure/probes/ShellSwitchProbe.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

namespace fleetwatch::infra {

ShellSwitchProbe::ShellSwitchProbe(std::shared_ptr<CiscoShellClient> shell,
                                   std::shared_ptr<SnmpSwitchProbe> snmp)
    : shell_(std::move(shell)), snmp_(std::move(snmp)) {}

const core::ShellCredentials& ShellSwitchProbe::requireCredentials(const core::PollTarget& target) {
    if (!target.shell || target.shell->username.empty()) {
        throw core::ConfigurationError("Shell credentials are not configured for " + target.address);
    }
    return *target.shell;
}

core::PollOutcome ShellSwitchProbe::poll(const core::PollTarget& target) {
    if (target.shell && !target.shell->username.empty()) {
        try {
            auto info = shell_->showVersion(target.address, *target.shell);
            core::PollOutcome outcome;
            outcome.probedOnline = true;
            outcome.hostname = info.hostname;
            outcome.model = info.model;
            outcome.osVersion = info.version;
            outcome.uptime = info.uptime;
            return outcome;
        } catch (const core::ProbeError& e) {
            spdlog::warn("Shell poll of {} failed, falling back to SNMP: {}", target.address,
                         e.what());
        }
    }
    return snmp_->poll(target);
}

std::vector<core::PortState> ShellSwitchProbe::getPortTable(const core::PollTarget& target) {
    auto ports = snmp_->getPortTable(target);
    if (!ports.empty() || !target.shell) {
        return ports;
    }
    spdlog::info("SNMP returned no ports for {}, reading them over the shell", target.address);
    return shell_->interfacesStatus(target.address, *target.shell);
}

void ShellSwitchProbe::writePortConfig(const core::PollTarget& target,
                                       const core::PortConfigChange& change) {
    shell_->applyPortChange(target.address, requireCredentials(target), change);
}

std::vector<core::AccessPointInfo> ShellSwitchProbe::accessPoints(const core::PollTarget& target,
                                                                  int vlan) {
    return shell_->accessPoints(target.address, requireCredentials(target), vlan);
}

} // namespace fleetwatch::infra
