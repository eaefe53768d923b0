/**
 * @file CiscoOutput.hpp
 * @brief Parsers for Cisco IOS command output.
 *
 * All functions are pure so they can be exercised with captured transcripts.
 */

#pragma once

#include "core/types/PollTypes.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fleetwatch::core::cisco {

/**
 * @brief Identity fields taken from `show version`.
 */
struct VersionInfo {
    std::optional<std::string> hostname;
    std::optional<std::string> model;
    std::optional<std::string> version;
    std::optional<std::string> uptime;
};

/**
 * @brief PoE row from `show power inline`.
 */
struct PoeEntry {
    std::string status;
    std::string power; ///< Watts with a trailing "W"
};

VersionInfo parseShowVersion(const std::string& output);

/**
 * @brief Shortens interface names so vendor abbreviations compare equal.
 *
 * GigabitEthernet0/1 and Gi0/1 both become Gi0/1. Likewise Fa, Te and Twe.
 */
std::string normalizePortName(const std::string& port);

/**
 * @brief Access points from `show cdp neighbors detail`.
 *
 * Entries are split on runs of five or more dashes. An entry is an access
 * point if its platform matches a known AP family or its capabilities list
 * Trans-Bridge. MAC addresses are left empty for later enrichment.
 */
std::vector<AccessPointInfo> parseCdpAccessPoints(const std::string& output, int vlan);

/**
 * @brief Normalised port name to colon MAC from `show mac address-table`.
 */
std::map<std::string, std::string> parseMacAddressTable(const std::string& output);

/**
 * @brief Normalised port name to PoE row from `show power inline`.
 */
std::map<std::string, PoeEntry> parsePowerInline(const std::string& output);

/**
 * @brief Colon MAC to IP from `show ip arp`.
 */
std::map<std::string, std::string> parseIpArp(const std::string& output);

/**
 * @brief Fills MAC, PoE and IP fields of access points from the parsed tables.
 */
void enrichAccessPoints(std::vector<AccessPointInfo>& aps,
                        const std::map<std::string, std::string>& macByPort,
                        const std::map<std::string, PoeEntry>& poeByPort,
                        const std::map<std::string, std::string>& ipByMac);

/**
 * @brief Port rows from `show interfaces status`.
 *
 * Only oper status and description are known; "--" descriptions are dropped.
 */
std::vector<PortState> parseInterfacesStatus(const std::string& output);

} // namespace fleetwatch::core::cisco
