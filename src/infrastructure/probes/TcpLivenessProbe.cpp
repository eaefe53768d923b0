#include "infrastructure/probes/TcpLivenessProbe.hpp"

#include "core/types/Errors.hpp"

namespace fleetwatch::infra {

TcpLivenessProbe::TcpLivenessProbe(std::shared_ptr<core::IPortScanner> scanner, uint16_t port,
                                   std::chrono::milliseconds timeout)
    : scanner_(std::move(scanner)), port_(port), timeout_(timeout) {}

core::PollOutcome TcpLivenessProbe::poll(const core::PollTarget& target) {
    core::PollOutcome outcome;
    outcome.probedOnline = scanner_->isPortOpen(target.address, port_, timeout_).get();
    if (outcome.probedOnline) {
        outcome.openPorts.push_back(port_);
    }
    return outcome;
}

std::vector<core::PortState> TcpLivenessProbe::getPortTable(const core::PollTarget&) {
    return {};
}

void TcpLivenessProbe::writePortConfig(const core::PollTarget& target,
                                       const core::PortConfigChange&) {
    throw core::ConfigurationError("Port configuration is not supported for " +
                                   core::deviceKindToString(target.kind) + " devices");
}

} // namespace fleetwatch::infra
