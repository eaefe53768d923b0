#pragma once

#include "core/services/IStatusProbe.hpp"
#include "infrastructure/probes/SnmpSwitchProbe.hpp"
#include "infrastructure/shell/CiscoShellClient.hpp"

#include <memory>

namespace fleetwatch::infra {

/**
 * @brief Cisco switches: interactive shell first, SNMP where the shell has nothing to add.
 */
class ShellSwitchProbe : public core::IStatusProbe {
public:
    ShellSwitchProbe(std::shared_ptr<CiscoShellClient> shell,
                     std::shared_ptr<SnmpSwitchProbe> snmp);

    /**
     * @brief `show version` over the shell; the SNMP poll when the shell fails
     *        or no credentials are set.
     */
    core::PollOutcome poll(const core::PollTarget& target) override;

    /**
     * @brief SNMP port table, or `show interfaces status` when SNMP returned none.
     */
    std::vector<core::PortState> getPortTable(const core::PollTarget& target) override;

    /**
     * @throws core::ConfigurationError if the target has no shell credentials.
     * @throws core::ProbeError if the session fails.
     */
    void writePortConfig(const core::PollTarget& target,
                         const core::PortConfigChange& change) override;

    /**
     * @brief Wireless access points behind the switch on @p vlan.
     * @throws core::ConfigurationError if the target has no shell credentials.
     */
    std::vector<core::AccessPointInfo> accessPoints(const core::PollTarget& target, int vlan);

private:
    static const core::ShellCredentials& requireCredentials(const core::PollTarget& target);

    std::shared_ptr<CiscoShellClient> shell_;
    std::shared_ptr<SnmpSwitchProbe> snmp_;
};

} // namespace fleetwatch::infra
