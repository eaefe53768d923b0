#pragma once

#include "core/services/IHttpClient.hpp"
#include "core/services/ISnmpService.hpp"
#include "core/types/DeviceFingerprint.hpp"
#include "core/types/DiscoveryTypes.hpp"

#include <chrono>
#include <memory>

namespace fleetwatch::infra {

/**
 * @brief Kind-specific fingerprinting of hosts found by the port scan.
 *
 * Each identify call either fills device_kind (and whatever identity it
 * learned) and returns true, or leaves the device untouched and returns
 * false. Ambiguous identities are rejected rather than guessed. SNMP goes
 * through the shared, serialized SNMP client.
 */
class DeviceIdentifier {
public:
    DeviceIdentifier(std::shared_ptr<core::ISnmpService> snmp,
                     std::shared_ptr<core::IHttpClient> http);

    /**
     * @brief Whether @p device is worth fingerprinting as @p kind, judged by its open ports.
     */
    static bool isCandidate(core::DeviceKind kind, const core::DiscoveredDevice& device);

    /**
     * @brief Dispatches to the identifier of @p kind.
     */
    bool identify(core::DeviceKind kind, core::DiscoveredDevice& device);

    bool identifySwitch(core::DiscoveredDevice& device);
    bool identifyPrinter(core::DiscoveredDevice& device);
    bool identifyMediaPlayer(core::DiscoveredDevice& device);

    static constexpr uint16_t kMediaPlayerPort = 8081;
    static constexpr std::chrono::milliseconds kSnmpTimeout{2000};
    static constexpr std::chrono::milliseconds kHttpTimeout{2000};

private:
    core::SystemIdentity querySystemIdentity(const std::string& address, bool withObjectId);
    core::HttpResponse fetchPlayerPage(const std::string& address, const std::string& path);

    std::shared_ptr<core::ISnmpService> snmp_;
    std::shared_ptr<core::IHttpClient> http_;
};

} // namespace fleetwatch::infra
