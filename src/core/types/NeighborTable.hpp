/**
 * @file NeighborTable.hpp
 * @brief IP to MAC mapping read from the operating system neighbor cache.
 */

#pragma once

#include <map>
#include <optional>
#include <string>

namespace fleetwatch::core {

/**
 * @brief Snapshot of the neighbor cache. MACs are lower-case colon separated.
 */
class NeighborTable {
public:
    NeighborTable() = default;
    explicit NeighborTable(std::map<std::string, std::string> entries);

    /**
     * @brief Parses /proc/net/arp content (header line, IP in column 1, MAC in column 4).
     */
    static NeighborTable fromProcNetArp(const std::string& content);

    /**
     * @brief Parses `ip neigh` output, taking lines of the form "IP dev X lladdr MAC ...".
     */
    static NeighborTable fromIpNeigh(const std::string& output);

    [[nodiscard]] std::optional<std::string> macFor(const std::string& ip) const;

    /**
     * @brief Reverse lookup; the first IP holding @p mac in address order.
     */
    [[nodiscard]] std::optional<std::string> ipFor(const std::string& mac) const;

    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] const std::map<std::string, std::string>& entries() const { return entries_; }

private:
    std::map<std::string, std::string> entries_;
};

/**
 * @brief Formats raw interface address bytes as "aa:bb:cc:dd:ee:ff".
 * @return std::nullopt unless exactly 6 bytes with at least one non-zero byte.
 */
std::optional<std::string> formatMacBytes(const std::string& octets);

/**
 * @brief Converts a Cisco "aaaa.bbbb.cccc" MAC to "aa:aa:bb:bb:cc:cc"; other input is returned unchanged.
 */
std::string ciscoMacToColon(const std::string& mac);

} // namespace fleetwatch::core
