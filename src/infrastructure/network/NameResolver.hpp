#pragma once

#include "core/services/INetworkLookup.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fleetwatch::infra {

/**
 * @brief Reverse DNS through the system resolver and NetBIOS node status over UDP 137.
 */
class NameResolver : public core::INameResolver {
public:
    static constexpr uint16_t kNetbiosPort = 137;

    /**
     * @param netbiosTimeout Wait for a node status answer; the query gives up after it.
     */
    explicit NameResolver(std::chrono::milliseconds netbiosTimeout = std::chrono::milliseconds(1500),
                          uint16_t netbiosPort = kNetbiosPort);

    std::optional<std::string> reverseLookup(const std::string& address) override;

    std::optional<std::string> netbiosName(const std::string& address) override;

    /**
     * @brief Builds an NBSTAT query for the wildcard name "*".
     */
    static std::vector<uint8_t> buildNodeStatusRequest(uint16_t transactionId);

    /**
     * @brief Extracts the first unique workstation (suffix 0x00) name from a node status reply.
     */
    static std::optional<std::string> parseNodeStatusResponse(const std::vector<uint8_t>& reply,
                                                              uint16_t transactionId);

private:
    std::chrono::milliseconds netbiosTimeout_;
    uint16_t netbiosPort_;
};

} // namespace fleetwatch::infra
