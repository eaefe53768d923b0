#include "infrastructure/discovery/DiscoverySessionStore.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fleetwatch::infra {

DiscoverySessionStore::DiscoverySessionStore(std::shared_ptr<core::IKeyValueStore> store)
    : store_(std::move(store)) {}

std::string DiscoverySessionStore::progressKey(core::DeviceKind kind) {
    return "discover:" + core::deviceKindToString(kind) + ":progress";
}

std::string DiscoverySessionStore::resultsKey(core::DeviceKind kind) {
    return "discover:" + core::deviceKindToString(kind) + ":results";
}

std::string DiscoverySessionStore::lockKey(core::DeviceKind kind) {
    return "discover:" + core::deviceKindToString(kind) + ":lock";
}

bool DiscoverySessionStore::tryLock(core::DeviceKind kind) {
    return store_->setIfAbsent(lockKey(kind), "1", kLockTtl);
}

void DiscoverySessionStore::unlock(core::DeviceKind kind) {
    store_->remove(lockKey(kind));
}

bool DiscoverySessionStore::isLocked(core::DeviceKind kind) {
    return store_->exists(lockKey(kind));
}

void DiscoverySessionStore::saveProgress(core::DeviceKind kind,
                                         const core::ScanProgress& progress) {
    store_->setEx(progressKey(kind), progress.toJson().dump(), kSessionTtl);
}

core::ScanProgress DiscoverySessionStore::progress(core::DeviceKind kind) {
    auto raw = store_->get(progressKey(kind));
    if (!raw) {
        return core::ScanProgress{};
    }
    try {
        return core::ScanProgress::fromJson(nlohmann::json::parse(*raw));
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Discarding unreadable progress for {}: {}",
                     core::deviceKindToString(kind), e.what());
        return core::ScanProgress{};
    }
}

void DiscoverySessionStore::saveResults(core::DeviceKind kind,
                                        const std::vector<core::DiscoveredDevice>& devices) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& device : devices) {
        array.push_back(device.toJson());
    }
    store_->setEx(resultsKey(kind), array.dump(), kSessionTtl);
}

std::vector<core::DiscoveredDevice> DiscoverySessionStore::results(core::DeviceKind kind) {
    std::vector<core::DiscoveredDevice> devices;
    auto raw = store_->get(resultsKey(kind));
    if (!raw) {
        return devices;
    }
    try {
        auto array = nlohmann::json::parse(*raw);
        for (const auto& item : array) {
            devices.push_back(core::DiscoveredDevice::fromJson(item));
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Discarding unreadable results for {}: {}",
                     core::deviceKindToString(kind), e.what());
        devices.clear();
    }
    return devices;
}

} // namespace fleetwatch::infra
