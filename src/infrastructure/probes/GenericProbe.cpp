#include "infrastructure/probes/GenericProbe.hpp"

#include "core/types/Errors.hpp"
#include "core/types/SnmpReadings.hpp"
#include "core/types/TextUtils.hpp"
#include "infrastructure/probes/SnmpQueries.hpp"

#include <spdlog/spdlog.h>

namespace fleetwatch::infra {

const std::vector<uint16_t> GenericProbe::kPorts = {22, 80, 135, 139, 443, 445, 554, 3389, 8080, 9090};

GenericProbe::GenericProbe(std::shared_ptr<core::IPortScanner> scanner,
                           std::shared_ptr<core::ISnmpService> snmp,
                           std::shared_ptr<core::INameResolver> resolver,
                           std::shared_ptr<core::INeighborTableSource> neighbors)
    : scanner_(std::move(scanner)),
      snmp_(std::move(snmp)),
      resolver_(std::move(resolver)),
      neighbors_(std::move(neighbors)) {}

core::PollOutcome GenericProbe::poll(const core::PollTarget& target) {
    auto openPorts = scanner_->checkPorts(target.address, kPorts, kPortTimeout);

    core::PollOutcome outcome;
    const bool snmpAnswered = readSystemGroup(target, outcome);
    outcome.macAddress = lookupMac(target);
    outcome.openPorts = openPorts.get();
    outcome.probedOnline = snmpAnswered || !outcome.openPorts.empty();

    if (!outcome.hostname) {
        outcome.hostname = lookupHostname(target.address);
    }
    return outcome;
}

bool GenericProbe::readSystemGroup(const core::PollTarget& target, core::PollOutcome& outcome) {
    auto config = snmp::readConfig(target, kSnmpTimeout, kSnmpRetries);
    auto result = snmp_->getAsync(target.address,
                                  {core::SnmpOids::SYS_DESCR, core::SnmpOids::SYS_NAME,
                                   core::SnmpOids::SYS_UPTIME},
                                  config)
                      .get();
    if (!result.success) {
        spdlog::debug("SNMP system group of {} unavailable: {}", target.address, result.errorMessage);
        return false;
    }

    bool answered = false;
    if (auto descr = result.textOf(core::SnmpOids::SYS_DESCR)) {
        auto text = core::text::trim(*descr);
        if (!text.empty()) {
            outcome.osVersion = text.substr(0, kMaxTextLength);
            answered = true;
        }
    }
    if (auto name = result.textOf(core::SnmpOids::SYS_NAME)) {
        auto text = core::text::trim(*name);
        if (!text.empty()) {
            outcome.hostname = text.substr(0, kMaxTextLength);
            answered = true;
        }
    }
    if (auto uptime = result.getVarBind(core::SnmpOids::SYS_UPTIME); uptime && !uptime->isException()) {
        if (auto ticks = uptime->numeric()) {
            outcome.uptime = core::formatUptimeCompact(*ticks);
            answered = true;
        }
    }
    return answered;
}

std::optional<std::string> GenericProbe::lookupMac(const core::PollTarget& target) {
    auto config = snmp::readConfig(target, kSnmpTimeout, kSnmpRetries);
    if (auto mac = core::firstMacAddress(
            snmp::walk(*snmp_, target.address, core::SnmpOids::IF_PHYS_ADDRESS, config))) {
        return mac;
    }
    return neighbors_->read().macFor(target.address);
}

std::optional<std::string> GenericProbe::lookupHostname(const std::string& address) {
    if (auto name = resolver_->reverseLookup(address)) {
        return name;
    }
    return resolver_->netbiosName(address);
}

std::vector<core::PortState> GenericProbe::getPortTable(const core::PollTarget&) {
    return {};
}

void GenericProbe::writePortConfig(const core::PollTarget&, const core::PortConfigChange&) {
    throw core::ConfigurationError("Port configuration is not supported for generic devices");
}

} // namespace fleetwatch::infra
