#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fleetwatch::infra {

/**
 * @brief IPv4 network parsed in non-strict mode.
 */
struct Ipv4Network {
    uint32_t network{0}; ///< Host bits cleared
    int prefix{32};

    /**
     * @brief Usable host addresses in network order.
     *
     * Prefixes up to /30 exclude the network and broadcast addresses, /31
     * yields both addresses and /32 the single address.
     */
    [[nodiscard]] uint64_t hostCount() const;
    [[nodiscard]] uint32_t firstHost() const;
};

/**
 * @brief Turns configured subnet and port lists into scan inputs.
 */
class HostEnumerator {
public:
    /**
     * @brief Expands a comma-separated CIDR list into host addresses.
     *
     * Host bits are allowed ("10.0.0.7/24" is 10.0.0.0/24) and a bare address
     * is a /32. Duplicates across ranges are skipped; order is preserved.
     * Malformed fragments are logged and skipped.
     *
     * @throws core::SubnetLimitExceeded as soon as the list grows past max(maxHosts, 1).
     */
    static std::vector<std::string> parseSubnets(const std::string& list, int maxHosts);

    /**
     * @brief Parses a comma-separated port list.
     *
     * Non-numeric and out-of-range entries are logged and skipped, duplicates
     * dropped, order preserved.
     */
    static std::vector<uint16_t> parsePorts(const std::string& list);

    /**
     * @brief Parses one fragment; std::nullopt if it is not an IPv4 network.
     */
    static std::optional<Ipv4Network> parseNetwork(const std::string& fragment);
};

} // namespace fleetwatch::infra
