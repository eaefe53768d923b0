#include "infrastructure/probes/SnmpQueries.hpp"

#include <spdlog/spdlog.h>

namespace fleetwatch::infra::snmp {

core::SnmpDeviceConfig readConfig(const core::PollTarget& target, std::chrono::milliseconds timeout,
                                  int retries) {
    core::SnmpDeviceConfig config;
    config.community = target.snmpCommunity.empty() ? "public" : target.snmpCommunity;
    config.timeoutMs = static_cast<int>(timeout.count());
    config.retries = retries;
    return config;
}

std::optional<core::SnmpVarBind> getOne(core::ISnmpService& service, const std::string& address,
                                        const std::string& oid, const core::SnmpDeviceConfig& config) {
    auto result = service.getAsync(address, {oid}, config).get();
    if (!result.success) {
        spdlog::debug("SNMP GET {} on {} failed: {}", oid, address, result.errorMessage);
        return std::nullopt;
    }
    auto vb = result.getVarBind(oid);
    if (!vb || vb->isException()) {
        return std::nullopt;
    }
    return vb;
}

std::optional<std::string> getText(core::ISnmpService& service, const std::string& address,
                                   const std::string& oid, const core::SnmpDeviceConfig& config) {
    auto vb = getOne(service, address, oid, config);
    if (!vb) {
        return std::nullopt;
    }
    return vb->value;
}

std::optional<int64_t> getNumber(core::ISnmpService& service, const std::string& address,
                                 const std::string& oid, const core::SnmpDeviceConfig& config) {
    auto vb = getOne(service, address, oid, config);
    if (!vb) {
        return std::nullopt;
    }
    return vb->numeric();
}

std::vector<core::SnmpVarBind> walk(core::ISnmpService& service, const std::string& address,
                                    const std::string& rootOid, const core::SnmpDeviceConfig& config) {
    return service.walkAsync(address, rootOid, config).get();
}

} // namespace fleetwatch::infra::snmp
