#include "infrastructure/probes/SnmpSwitchProbe.hpp"

#include "core/types/Errors.hpp"
#include "core/types/SnmpReadings.hpp"
#include "infrastructure/probes/SnmpQueries.hpp"

#include <spdlog/spdlog.h>

#include <type_traits>

namespace fleetwatch::infra {

namespace {

std::string indexed(const char* column, int ifIndex) {
    return std::string(column) + "." + std::to_string(ifIndex);
}

} // namespace

SnmpSwitchProbe::SnmpSwitchProbe(std::shared_ptr<core::ISnmpService> snmp)
    : snmp_(std::move(snmp)) {}

core::PollOutcome SnmpSwitchProbe::poll(const core::PollTarget& target) {
    auto config = snmp::readConfig(target, kTimeout, kRetries);

    auto name = snmp::getText(*snmp_, target.address, core::SnmpOids::SYS_NAME, config);
    auto descr = snmp::getText(*snmp_, target.address, core::SnmpOids::SYS_DESCR, config);
    auto ticks = snmp::getNumber(*snmp_, target.address, core::SnmpOids::SYS_UPTIME, config);

    core::PollOutcome outcome;
    outcome.probedOnline = name.has_value() || descr.has_value();
    outcome.hostname = name && !name->empty() ? *name : target.address;
    outcome.model = descr;
    if (ticks) {
        outcome.uptime = core::formatUptimeFull(*ticks);
    }
    return outcome;
}

std::vector<core::PortState> SnmpSwitchProbe::getPortTable(const core::PollTarget& target) {
    auto config = snmp::readConfig(target, kTimeout, kRetries);
    const auto& address = target.address;

    core::PortTableColumns columns;
    columns.descr = snmp::walk(*snmp_, address, core::SnmpOids::IF_DESCR, config);
    if (columns.descr.empty()) {
        spdlog::warn("No interfaces returned by {}", address);
        return {};
    }
    columns.alias = snmp::walk(*snmp_, address, core::SnmpOids::IF_ALIAS, config);
    columns.adminStatus = snmp::walk(*snmp_, address, core::SnmpOids::IF_ADMIN_STATUS, config);
    columns.operStatus = snmp::walk(*snmp_, address, core::SnmpOids::IF_OPER_STATUS, config);
    columns.speed = snmp::walk(*snmp_, address, core::SnmpOids::IF_SPEED, config);
    columns.pvid = snmp::walk(*snmp_, address, core::SnmpOids::DOT1Q_PVID, config);
    columns.poeAdmin = snmp::walk(*snmp_, address, core::SnmpOids::PETH_PSE_PORT_ADMIN_ENABLE, config);
    columns.poePower = snmp::walk(*snmp_, address, core::SnmpOids::PETH_PSE_PORT_POWER, config);

    return core::assemblePortTable(columns);
}

void SnmpSwitchProbe::writePortConfig(const core::PollTarget& target,
                                      const core::PortConfigChange& change) {
    if (!target.snmpWriteCommunity || target.snmpWriteCommunity->empty()) {
        throw core::ConfigurationError("SNMP write community is not configured");
    }

    const int ifIndex = core::resolveIfIndex(getPortTable(target), change.port);

    std::visit(
        [&](const auto& setting) {
            using T = std::decay_t<decltype(setting)>;
            if constexpr (std::is_same_v<T, core::AdminStateChange>) {
                set(target, indexed(core::SnmpOids::IF_ADMIN_STATUS, ifIndex),
                    int64_t{setting.enabled ? 1 : 2});
            } else if constexpr (std::is_same_v<T, core::DescriptionChange>) {
                set(target, indexed(core::SnmpOids::IF_ALIAS, ifIndex), setting.text);
            } else if constexpr (std::is_same_v<T, core::VlanChange>) {
                set(target, indexed(core::SnmpOids::DOT1Q_PVID, ifIndex), int64_t{setting.vlan});
            } else if constexpr (std::is_same_v<T, core::PoeChange>) {
                const auto oid = indexed(core::SnmpOids::PETH_PSE_PORT_ADMIN_ENABLE, ifIndex);
                if (setting.action == core::PoeAction::Cycle) {
                    set(target, oid, int64_t{2});
                    set(target, oid, int64_t{1});
                } else {
                    set(target, oid, int64_t{setting.action == core::PoeAction::On ? 1 : 2});
                }
            }
        },
        change.setting);

    spdlog::info("Port {} (ifIndex {}) on {} updated over SNMP", change.port, ifIndex,
                 target.address);
}

void SnmpSwitchProbe::set(const core::PollTarget& target, const std::string& oid,
                          const core::SnmpValue& value) {
    auto config = snmp::readConfig(target, kTimeout, kRetries);
    config.community = *target.snmpWriteCommunity;

    auto result = snmp_->setAsync(target.address, oid, value, config).get();
    if (!result.success) {
        throw core::ProbeError("SNMP SET " + oid + " on " + target.address +
                               " failed: " + result.errorMessage);
    }
}

} // namespace fleetwatch::infra
