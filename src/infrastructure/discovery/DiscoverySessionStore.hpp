#pragma once

#include "core/services/IKeyValueStore.hpp"
#include "core/types/DiscoveryTypes.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace fleetwatch::infra {

/**
 * @brief Progress, results and the exclusive lock of discovery scans, per device kind.
 *
 * Keys are discover:{kind}:progress, discover:{kind}:results and
 * discover:{kind}:lock. Progress and results live for kSessionTtl, the lock
 * for kLockTtl so a crashed scan cannot block its kind forever. Store
 * failures propagate as core::StateStoreError.
 */
class DiscoverySessionStore {
public:
    static constexpr std::chrono::seconds kSessionTtl{600};
    static constexpr std::chrono::seconds kLockTtl{300};

    explicit DiscoverySessionStore(std::shared_ptr<core::IKeyValueStore> store);

    static std::string progressKey(core::DeviceKind kind);
    static std::string resultsKey(core::DeviceKind kind);
    static std::string lockKey(core::DeviceKind kind);

    /**
     * @brief Atomically takes the scan lock of @p kind.
     * @return False if another scan holds it.
     */
    bool tryLock(core::DeviceKind kind);
    void unlock(core::DeviceKind kind);
    bool isLocked(core::DeviceKind kind);

    void saveProgress(core::DeviceKind kind, const core::ScanProgress& progress);

    /**
     * @brief Latest progress; an idle record when nothing is stored.
     */
    core::ScanProgress progress(core::DeviceKind kind);

    void saveResults(core::DeviceKind kind, const std::vector<core::DiscoveredDevice>& devices);
    std::vector<core::DiscoveredDevice> results(core::DeviceKind kind);

private:
    std::shared_ptr<core::IKeyValueStore> store_;
};

} // namespace fleetwatch::infra
