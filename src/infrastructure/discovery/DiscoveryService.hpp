#pragma once

#include "core/services/INetworkLookup.hpp"
#include "core/services/IPortScanner.hpp"
#include "core/types/DiscoveryTypes.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/discovery/DeviceIdentifier.hpp"
#include "infrastructure/discovery/DiscoverySessionStore.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <future>
#include <memory>
#include <string>
#include <vector>

namespace fleetwatch::infra {

/**
 * @brief Parameters of one discovery scan.
 */
struct ScanRequest {
    core::DeviceKind kind{core::DeviceKind::Printer};
    std::string subnet;
    std::string ports;
    std::vector<core::KnownDevice> knownDevices;
};

/**
 * @brief Runs discovery scans: enumerate, port scan, identify, enrich, publish.
 *
 * At most one scan per kind runs at a time across every process sharing the
 * state store; the store lock is taken before anything else and always
 * released when the scan ends. Scans started with startScan() run on a
 * single dedicated worker thread.
 */
class DiscoveryService {
public:
    DiscoveryService(std::shared_ptr<DiscoverySessionStore> sessions,
                     std::shared_ptr<core::IPortScanner> scanner,
                     std::shared_ptr<DeviceIdentifier> identifier,
                     std::shared_ptr<core::INeighborTableSource> neighbors,
                     ScanSettings settings);
    ~DiscoveryService();

    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    /**
     * @brief Validates the request, takes the lock and queues the scan.
     *
     * @throws core::LockConflict if a scan of the same kind is running.
     * @throws core::ConfigurationError if the kind is not discoverable or no
     *         host or port survives parsing; the lock is released again.
     * @return Future with the published results, or the exception that failed the scan.
     */
    std::future<std::vector<core::DiscoveredDevice>> startScan(const ScanRequest& request);

    /**
     * @brief Runs a scan on the calling thread. Same contract as startScan().
     */
    std::vector<core::DiscoveredDevice> runScan(const ScanRequest& request);

    core::ScanProgress progress(core::DeviceKind kind);
    std::vector<core::DiscoveredDevice> results(core::DeviceKind kind);

    const ScanSettings& settings() const { return settings_; }

    /**
     * @brief Marks devices known by MAC when the neighbor table places them at a new IP.
     *
     * Devices without a MAC receive the one from @p table. Devices already
     * known by IP keep their correlation.
     */
    static void applyNeighborTable(std::vector<core::DiscoveredDevice>& devices,
                                   const core::NeighborTable& table,
                                   const std::vector<core::KnownDevice>& known);

private:
    struct PreparedScan {
        ScanRequest request;
        std::vector<std::string> hosts;
        std::vector<uint16_t> ports;
    };

    PreparedScan prepare(const ScanRequest& request);
    std::vector<core::DiscoveredDevice> execute(const PreparedScan& scan);
    void finish(core::DeviceKind kind);

    std::shared_ptr<DiscoverySessionStore> sessions_;
    std::shared_ptr<core::IPortScanner> scanner_;
    std::shared_ptr<DeviceIdentifier> identifier_;
    std::shared_ptr<core::INeighborTableSource> neighbors_;
    ScanSettings settings_;
    AsioContext worker_{1};
};

} // namespace fleetwatch::infra
