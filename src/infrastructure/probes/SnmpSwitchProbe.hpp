#pragma once

#include "core/services/ISnmpService.hpp"
#include "core/services/IStatusProbe.hpp"

#include <chrono>
#include <memory>

namespace fleetwatch::infra {

/**
 * @brief Switch status, port table and port writes over SNMP.
 *
 * Reads use the target's community, writes its write community.
 */
class SnmpSwitchProbe : public core::IStatusProbe {
public:
    static constexpr std::chrono::milliseconds kTimeout{2000};
    static constexpr int kRetries = 1;

    explicit SnmpSwitchProbe(std::shared_ptr<core::ISnmpService> snmp);

    /**
     * @brief Online iff sysName or sysDescr answered. Hostname defaults to the address.
     */
    core::PollOutcome poll(const core::PollTarget& target) override;

    /**
     * @brief Walks the interface, VLAN and PoE columns into rows sorted by ifIndex.
     */
    std::vector<core::PortState> getPortTable(const core::PollTarget& target) override;

    /**
     * @throws core::ConfigurationError "SNMP write community is not configured"
     * @throws core::ProbeError if the port is unknown or a SET fails.
     */
    void writePortConfig(const core::PollTarget& target,
                         const core::PortConfigChange& change) override;

private:
    void set(const core::PollTarget& target, const std::string& oid, const core::SnmpValue& value);

    std::shared_ptr<core::ISnmpService> snmp_;
};

} // namespace fleetwatch::infra
