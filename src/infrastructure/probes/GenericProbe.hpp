#pragma once

#include "core/services/INetworkLookup.hpp"
#include "core/services/IPortScanner.hpp"
#include "core/services/ISnmpService.hpp"
#include "core/services/IStatusProbe.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace fleetwatch::infra {

/**
 * @brief Best-effort probe for hosts of unknown type.
 *
 * Combines a short port sweep, the SNMP system group, the interface MAC and
 * name lookups. Online iff any port is open or SNMP answered.
 */
class GenericProbe : public core::IStatusProbe {
public:
    static const std::vector<uint16_t> kPorts;
    static constexpr std::chrono::milliseconds kPortTimeout{1500};
    static constexpr std::chrono::milliseconds kSnmpTimeout{3000};
    static constexpr int kSnmpRetries = 1;
    static constexpr size_t kMaxTextLength = 255;

    GenericProbe(std::shared_ptr<core::IPortScanner> scanner,
                 std::shared_ptr<core::ISnmpService> snmp,
                 std::shared_ptr<core::INameResolver> resolver,
                 std::shared_ptr<core::INeighborTableSource> neighbors);

    core::PollOutcome poll(const core::PollTarget& target) override;

    std::vector<core::PortState> getPortTable(const core::PollTarget& target) override;

    /**
     * @throws core::ConfigurationError always.
     */
    void writePortConfig(const core::PollTarget& target,
                         const core::PortConfigChange& change) override;

private:
    bool readSystemGroup(const core::PollTarget& target, core::PollOutcome& outcome);
    std::optional<std::string> lookupMac(const core::PollTarget& target);
    std::optional<std::string> lookupHostname(const std::string& address);

    std::shared_ptr<core::IPortScanner> scanner_;
    std::shared_ptr<core::ISnmpService> snmp_;
    std::shared_ptr<core::INameResolver> resolver_;
    std::shared_ptr<core::INeighborTableSource> neighbors_;
};

} // namespace fleetwatch::infra
