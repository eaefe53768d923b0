#include "infrastructure/discovery/DiscoveryService.hpp"

#include "core/types/Errors.hpp"
#include "core/types/TextUtils.hpp"
#include "infrastructure/discovery/HostEnumerator.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cmath>
#include <map>

namespace fleetwatch::infra {

namespace {

constexpr size_t SCAN_BATCH_SIZE = 64;

void markFailed(DiscoverySessionStore& sessions, core::DeviceKind kind,
                const std::string& message) {
    core::ScanProgress progress;
    progress.status = core::ScanStatus::Error;
    progress.message = message;
    try {
        sessions.saveProgress(kind, progress);
    } catch (const core::StateStoreError& e) {
        spdlog::error("Cannot record failed {} scan: {}", core::deviceKindToString(kind),
                      e.what());
    }
}

} // namespace

DiscoveryService::DiscoveryService(std::shared_ptr<DiscoverySessionStore> sessions,
                                   std::shared_ptr<core::IPortScanner> scanner,
                                   std::shared_ptr<DeviceIdentifier> identifier,
                                   std::shared_ptr<core::INeighborTableSource> neighbors,
                                   ScanSettings settings)
    : sessions_(std::move(sessions)),
      scanner_(std::move(scanner)),
      identifier_(std::move(identifier)),
      neighbors_(std::move(neighbors)),
      settings_(std::move(settings)) {
    worker_.start();
}

DiscoveryService::~DiscoveryService() {
    worker_.stop();
}

DiscoveryService::PreparedScan DiscoveryService::prepare(const ScanRequest& request) {
    const auto kindName = core::deviceKindToString(request.kind);
    if (!core::isDiscoverable(request.kind)) {
        throw core::ConfigurationError("Unsupported discovery kind: " + kindName);
    }
    if (!sessions_->tryLock(request.kind)) {
        throw core::LockConflict("Discovery scan already in progress for " + kindName);
    }

    PreparedScan scan;
    scan.request = request;
    if (scan.request.subnet.empty()) {
        scan.request.subnet = settings_.subnet;
    }
    if (scan.request.ports.empty()) {
        scan.request.ports = settings_.ports;
    }

    try {
        scan.hosts = HostEnumerator::parseSubnets(scan.request.subnet, settings_.maxHosts);
        if (scan.hosts.empty()) {
            throw core::ConfigurationError("No valid IPs to scan");
        }
        scan.ports = HostEnumerator::parsePorts(scan.request.ports);
        if (scan.ports.empty()) {
            throw core::ConfigurationError("No valid ports configured");
        }

        core::ScanProgress progress;
        progress.status = core::ScanStatus::Running;
        progress.total = scan.hosts.size();
        sessions_->saveProgress(request.kind, progress);
    } catch (const std::exception& e) {
        spdlog::warn("Discovery scan '{}' rejected: {}", kindName, e.what());
        markFailed(*sessions_, request.kind, e.what());
        finish(request.kind);
        throw;
    }
    return scan;
}

std::future<std::vector<core::DiscoveredDevice>>
DiscoveryService::startScan(const ScanRequest& request) {
    auto scan = std::make_shared<PreparedScan>(prepare(request));
    auto promise = std::make_shared<std::promise<std::vector<core::DiscoveredDevice>>>();
    auto future = promise->get_future();

    worker_.post([this, scan, promise]() {
        try {
            promise->set_value(execute(*scan));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });
    return future;
}

std::vector<core::DiscoveredDevice> DiscoveryService::runScan(const ScanRequest& request) {
    return execute(prepare(request));
}

std::vector<core::DiscoveredDevice> DiscoveryService::execute(const PreparedScan& scan) {
    const auto kind = scan.request.kind;
    const auto kindName = core::deviceKindToString(kind);
    const auto started = std::chrono::steady_clock::now();
    const size_t total = scan.hosts.size();

    std::vector<core::DiscoveredDevice> devices;
    try {
        std::map<std::string, const core::KnownDevice*> knownByIp;
        for (const auto& known : scan.request.knownDevices) {
            if (!known.ipAddress.empty()) {
                knownByIp[known.ipAddress] = &known;
            }
        }

        core::ScanOptions options;
        options.timeout = std::chrono::milliseconds(
            static_cast<int64_t>(std::llround(settings_.tcpTimeoutSeconds * 1000.0)));
        options.retries = settings_.tcpRetries;
        options.maxConcurrency = settings_.tcpConcurrency;
        options.batchSize = SCAN_BATCH_SIZE;

        auto found = scanner_->scanHosts(
            scan.hosts, scan.ports, options, [this, kind](const core::BatchProgress& batch) {
                core::ScanProgress progress;
                progress.status = core::ScanStatus::Running;
                progress.scanned = batch.scanned;
                progress.total = batch.total;
                progress.found = batch.found;
                sessions_->saveProgress(kind, progress);
            });

        for (auto& host : found) {
            core::DiscoveredDevice device;
            device.ip = host.address;
            device.openPorts = std::move(host.openPorts);
            if (auto it = knownByIp.find(device.ip); it != knownByIp.end()) {
                device.isKnown = true;
                device.knownDeviceId = it->second->id;
            }
            devices.push_back(std::move(device));
        }

        if (!devices.empty()) {
            core::ScanProgress progress;
            progress.status = core::ScanStatus::Running;
            progress.scanned = total;
            progress.total = total;
            progress.found = devices.size();
            progress.message = "Identifying devices...";
            sessions_->saveProgress(kind, progress);

            size_t identified = 0;
            for (auto& device : devices) {
                if (identifier_->identify(kind, device)) {
                    ++identified;
                }
            }
            spdlog::info("Identified {} of {} responding hosts as {}", identified,
                         devices.size(), kindName);

            applyNeighborTable(devices, neighbors_->read(), scan.request.knownDevices);
        }

        std::erase_if(devices, [kind](const core::DiscoveredDevice& device) {
            return device.deviceKind != kind;
        });

        sessions_->saveResults(kind, devices);

        core::ScanProgress done;
        done.status = core::ScanStatus::Done;
        done.scanned = total;
        done.total = total;
        done.found = devices.size();
        sessions_->saveProgress(kind, done);
    } catch (const std::exception& e) {
        spdlog::error("Discovery scan '{}' failed: {}", kindName, e.what());
        markFailed(*sessions_, kind, e.what());
        finish(kind);
        throw;
    }

    finish(kind);
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started);
    spdlog::info("Discovery scan '{}' completed in {:.2f}s: {} devices", kindName,
                 elapsed.count(), devices.size());
    return devices;
}

void DiscoveryService::finish(core::DeviceKind kind) {
    try {
        sessions_->unlock(kind);
    } catch (const core::StateStoreError& e) {
        spdlog::error("Cannot release {} scan lock, it expires on its own: {}",
                      core::deviceKindToString(kind), e.what());
    }
}

void DiscoveryService::applyNeighborTable(std::vector<core::DiscoveredDevice>& devices,
                                          const core::NeighborTable& table,
                                          const std::vector<core::KnownDevice>& known) {
    std::map<std::string, const core::KnownDevice*> knownByMac;
    for (const auto& device : known) {
        if (device.macAddress && !device.macAddress->empty()) {
            knownByMac[core::text::toLower(*device.macAddress)] = &device;
        }
    }

    for (auto& device : devices) {
        if (!device.mac) {
            device.mac = table.macFor(device.ip);
        }
        if (!device.mac || device.isKnown) {
            continue;
        }
        auto it = knownByMac.find(core::text::toLower(*device.mac));
        if (it == knownByMac.end()) {
            continue;
        }
        device.isKnown = true;
        device.knownDeviceId = it->second->id;
        if (!it->second->ipAddress.empty() && it->second->ipAddress != device.ip) {
            device.ipChanged = true;
            device.oldIp = it->second->ipAddress;
            spdlog::info("Known device {} moved from {} to {}", it->second->id,
                         it->second->ipAddress, device.ip);
        }
    }
}

core::ScanProgress DiscoveryService::progress(core::DeviceKind kind) {
    return sessions_->progress(kind);
}

std::vector<core::DiscoveredDevice> DiscoveryService::results(core::DeviceKind kind) {
    return sessions_->results(kind);
}

} // namespace fleetwatch::infra
