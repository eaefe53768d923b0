#pragma once

#include "core/services/ISnmpService.hpp"
#include "core/types/PollTypes.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace fleetwatch::infra::snmp {

/**
 * @brief Read configuration for a target's community with the given limits.
 */
core::SnmpDeviceConfig readConfig(const core::PollTarget& target, std::chrono::milliseconds timeout,
                                  int retries);

/**
 * @brief Single-OID GET; std::nullopt on any failure or exception value.
 */
std::optional<core::SnmpVarBind> getOne(core::ISnmpService& service, const std::string& address,
                                        const std::string& oid, const core::SnmpDeviceConfig& config);

std::optional<std::string> getText(core::ISnmpService& service, const std::string& address,
                                   const std::string& oid, const core::SnmpDeviceConfig& config);

std::optional<int64_t> getNumber(core::ISnmpService& service, const std::string& address,
                                 const std::string& oid, const core::SnmpDeviceConfig& config);

std::vector<core::SnmpVarBind> walk(core::ISnmpService& service, const std::string& address,
                                    const std::string& rootOid, const core::SnmpDeviceConfig& config);

} // namespace fleetwatch::infra::snmp
