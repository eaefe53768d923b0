/**
 * @file SnmpReadings.hpp
 * @brief Interpretation of raw SNMP values read by the probes.
 */

#pragma once

#include "core/types/PollTypes.hpp"
#include "core/types/SnmpTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fleetwatch::core {

/**
 * @brief Last arc of an OID as an integer, e.g. the ifIndex of a table row.
 */
std::optional<int> oidIndex(const std::string& oid);

/**
 * @brief Formats TimeTicks as "Xd Yh Zm", leaving out zero days and hours.
 */
std::string formatUptimeCompact(int64_t ticks);

/**
 * @brief Formats TimeTicks as "Xd Yh Zm" with every part present.
 */
std::string formatUptimeFull(int64_t ticks);

/**
 * @brief Maps hrPrinterStatus codes; unknown codes read "unknown".
 */
std::string printerStatusFromCode(int64_t code);

/**
 * @brief Colour named by a supply description (black, cyan, magenta, yellow).
 */
std::optional<std::string> tonerColor(const std::string& description);

/**
 * @brief Fill percentage clamped to 0..100.
 * @return std::nullopt when the level is negative (RFC 3805 special values) or max is not positive.
 */
std::optional<int> tonerPercent(int64_t current, int64_t max);

/**
 * @brief Pairs marker supply rows by position.
 */
std::vector<TonerLevel> buildTonerLevels(const std::vector<SnmpVarBind>& descriptions,
                                         const std::vector<SnmpVarBind>& maxLevels,
                                         const std::vector<SnmpVarBind>& currentLevels);

/**
 * @brief First non-zero 6-byte ifPhysAddress in walk order.
 */
std::optional<std::string> firstMacAddress(const std::vector<SnmpVarBind>& physAddresses);

/**
 * @brief Interface table columns as walked from a switch.
 */
struct PortTableColumns {
    std::vector<SnmpVarBind> descr;
    std::vector<SnmpVarBind> alias;
    std::vector<SnmpVarBind> adminStatus;
    std::vector<SnmpVarBind> operStatus;
    std::vector<SnmpVarBind> speed;
    std::vector<SnmpVarBind> pvid;
    std::vector<SnmpVarBind> poeAdmin;
    std::vector<SnmpVarBind> poePower;
};

/**
 * @brief Correlates the columns by ifIndex into rows sorted by ifIndex.
 *
 * One row per ifDescr entry. Speed is reported in Mbps, PoE power in watts
 * rounded to two decimals.
 */
std::vector<PortState> assemblePortTable(const PortTableColumns& columns);

/**
 * @brief Resolves a port name to its ifIndex.
 *
 * Names are matched case-insensitively against the table; otherwise the
 * name is read as a plain ifIndex.
 * @throws ProbeError "Port 'X' not found" when neither applies.
 */
int resolveIfIndex(const std::vector<PortState>& ports, const std::string& portName);

} // namespace fleetwatch::core
