#pragma once

#include "core/services/ISnmpService.hpp"
#include "core/services/IStatusProbe.hpp"

#include <chrono>
#include <memory>

namespace fleetwatch::infra {

/**
 * @brief Network printers: identity, device status and toner levels over SNMP.
 */
class SnmpPrinterProbe : public core::IStatusProbe {
public:
    static constexpr std::chrono::milliseconds kTimeout{3000};
    static constexpr int kRetries = 1;

    explicit SnmpPrinterProbe(std::shared_ptr<core::ISnmpService> snmp);

    /**
     * @brief Offline with status "offline" when sysDescr does not answer.
     */
    core::PollOutcome poll(const core::PollTarget& target) override;

    std::vector<core::PortState> getPortTable(const core::PollTarget& target) override;

    /**
     * @throws core::ConfigurationError always.
     */
    void writePortConfig(const core::PollTarget& target,
                         const core::PortConfigChange& change) override;

private:
    std::shared_ptr<core::ISnmpService> snmp_;
};

} // namespace fleetwatch::infra
