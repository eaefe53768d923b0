#include "infrastructure/probes/SnmpPrinterProbe.hpp"

#include "core/types/Errors.hpp"
#include "core/types/SnmpReadings.hpp"
#include "infrastructure/probes/SnmpQueries.hpp"

#include <spdlog/spdlog.h>

namespace fleetwatch::infra {

SnmpPrinterProbe::SnmpPrinterProbe(std::shared_ptr<core::ISnmpService> snmp)
    : snmp_(std::move(snmp)) {}

core::PollOutcome SnmpPrinterProbe::poll(const core::PollTarget& target) {
    auto config = snmp::readConfig(target, kTimeout, kRetries);
    const auto& address = target.address;

    core::PollOutcome outcome;
    auto descr = snmp::getText(*snmp_, address, core::SnmpOids::SYS_DESCR, config);
    if (!descr) {
        outcome.printerStatus = "offline";
        return outcome;
    }

    outcome.probedOnline = true;
    outcome.model = descr;
    if (auto code = snmp::getNumber(*snmp_, address, core::SnmpOids::HR_PRINTER_STATUS, config)) {
        outcome.printerStatus = core::printerStatusFromCode(*code);
    } else {
        outcome.printerStatus = "unknown";
    }

    auto descriptions = snmp::walk(*snmp_, address, core::SnmpOids::PRT_MARKER_SUPPLIES_DESCR, config);
    if (!descriptions.empty()) {
        auto maxLevels = snmp::walk(*snmp_, address, core::SnmpOids::PRT_MARKER_SUPPLIES_MAX, config);
        auto levels = snmp::walk(*snmp_, address, core::SnmpOids::PRT_MARKER_SUPPLIES_LEVEL, config);
        outcome.toners = core::buildTonerLevels(descriptions, maxLevels, levels);
    }
    spdlog::debug("Printer {}: status {}, {} supplies", address, *outcome.printerStatus,
                  outcome.toners.size());
    return outcome;
}

std::vector<core::PortState> SnmpPrinterProbe::getPortTable(const core::PollTarget&) {
    return {};
}

void SnmpPrinterProbe::writePortConfig(const core::PollTarget&, const core::PortConfigChange&) {
    throw core::ConfigurationError("Port configuration is not supported for printer devices");
}

} // namespace fleetwatch::infra
