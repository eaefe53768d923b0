#pragma once

#include "core/services/IPortScanner.hpp"
#include "core/services/IStatusProbe.hpp"

#include <chrono>
#include <memory>

namespace fleetwatch::infra {

/**
 * @brief Online iff one TCP port accepts a connection in time.
 */
class TcpLivenessProbe : public core::IStatusProbe {
public:
    TcpLivenessProbe(std::shared_ptr<core::IPortScanner> scanner, uint16_t port,
                     std::chrono::milliseconds timeout);

    core::PollOutcome poll(const core::PollTarget& target) override;

    std::vector<core::PortState> getPortTable(const core::PollTarget& target) override;

    /**
     * @throws core::ConfigurationError always; these devices have no configurable ports.
     */
    void writePortConfig(const core::PollTarget& target,
                         const core::PortConfigChange& change) override;

    uint16_t port() const { return port_; }

private:
    std::shared_ptr<core::IPortScanner> scanner_;
    uint16_t port_;
    std::chrono::milliseconds timeout_;
};

} // namespace fleetwatch::infra
