#include "infrastructure/discovery/DeviceIdentifier.hpp"

#include "core/types/SnmpReadings.hpp"

#include <spdlog/spdlog.h>

namespace fleetwatch::infra {

namespace {

core::SnmpDeviceConfig discoverySnmpConfig() {
    core::SnmpDeviceConfig config;
    config.community = "public";
    config.timeoutMs = static_cast<int>(DeviceIdentifier::kSnmpTimeout.count());
    config.retries = 0;
    return config;
}

} // namespace

DeviceIdentifier::DeviceIdentifier(std::shared_ptr<core::ISnmpService> snmp,
                                   std::shared_ptr<core::IHttpClient> http)
    : snmp_(std::move(snmp)), http_(std::move(http)) {}

bool DeviceIdentifier::isCandidate(core::DeviceKind kind, const core::DiscoveredDevice& device) {
    switch (kind) {
    case core::DeviceKind::Printer:
        return device.hasAnyPort({9100, 631});
    case core::DeviceKind::MediaPlayer:
        return device.hasAnyPort({kMediaPlayerPort});
    case core::DeviceKind::Switch:
        return true;
    default:
        return false;
    }
}

bool DeviceIdentifier::identify(core::DeviceKind kind, core::DiscoveredDevice& device) {
    if (!isCandidate(kind, device)) {
        return false;
    }
    switch (kind) {
    case core::DeviceKind::Switch:
        return identifySwitch(device);
    case core::DeviceKind::Printer:
        return identifyPrinter(device);
    case core::DeviceKind::MediaPlayer:
        return identifyMediaPlayer(device);
    default:
        return false;
    }
}

core::SystemIdentity DeviceIdentifier::querySystemIdentity(const std::string& address,
                                                           bool withObjectId) {
    std::vector<std::string> oids = {core::SnmpOids::SYS_DESCR, core::SnmpOids::SYS_NAME};
    if (withObjectId) {
        oids.push_back(core::SnmpOids::SYS_OBJECT_ID);
    }

    core::SystemIdentity identity;
    auto result = snmp_->getAsync(address, oids, discoverySnmpConfig()).get();
    if (!result.success) {
        spdlog::debug("No SNMP identity from {}: {}", address, result.errorMessage);
        return identity;
    }

    auto nonEmpty = [&result](const char* oid) -> std::optional<std::string> {
        auto value = result.textOf(oid);
        if (value && value->empty()) {
            return std::nullopt;
        }
        return value;
    };
    identity.sysDescr = nonEmpty(core::SnmpOids::SYS_DESCR);
    identity.sysName = nonEmpty(core::SnmpOids::SYS_NAME);
    if (withObjectId) {
        identity.sysObjectId = nonEmpty(core::SnmpOids::SYS_OBJECT_ID);
    }
    return identity;
}

bool DeviceIdentifier::identifySwitch(core::DiscoveredDevice& device) {
    auto identity = querySystemIdentity(device.ip, true);
    if (identity.empty() || !core::fingerprint::isSwitchIdentity(identity)) {
        return false;
    }

    device.hostname = identity.sysName;
    device.modelInfo = identity.sysDescr;
    device.vendor = core::fingerprint::normalizeVendor(identity.sysDescr);
    device.deviceKind = core::DeviceKind::Switch;
    spdlog::debug("{} identified as switch ({})", device.ip, device.vendor.value_or("unknown"));
    return true;
}

bool DeviceIdentifier::identifyPrinter(core::DiscoveredDevice& device) {
    auto identity = querySystemIdentity(device.ip, false);
    if (!core::fingerprint::isPrinterIdentity(identity)) {
        spdlog::debug("{} answers on printer ports but identifies as a switch", device.ip);
        return false;
    }

    if (identity.sysDescr) {
        device.modelInfo = identity.sysDescr;
    }
    if (identity.sysName) {
        device.hostname = identity.sysName;
    }

    if (!identity.empty()) {
        auto physAddresses =
            snmp_->walkAsync(device.ip, core::SnmpOids::IF_PHYS_ADDRESS, discoverySnmpConfig()).get();
        if (auto mac = core::firstMacAddress(physAddresses)) {
            device.mac = mac;
        }
    }

    device.deviceKind = core::DeviceKind::Printer;
    return true;
}

core::HttpResponse DeviceIdentifier::fetchPlayerPage(const std::string& address,
                                                     const std::string& path) {
    core::HttpRequest request;
    request.host = address;
    request.port = kMediaPlayerPort;
    request.target = path;
    request.basicAuth = std::make_pair(std::string("admin"), std::string("admin"));
    request.timeout = kHttpTimeout;
    request.followRedirects = true;
    return http_->send(request);
}

bool DeviceIdentifier::identifyMediaPlayer(core::DiscoveredDevice& device) {
    auto main = fetchPlayerPage(device.ip, "/");
    if (main.status != 200) {
        return false;
    }

    bool matched = core::fingerprint::mainPageHasPlayerHints(main.body);
    if (!matched) {
        auto status = fetchPlayerPage(device.ip, "/status.xml");
        matched = status.status == 200 && core::fingerprint::isPlayerStatusXml(status.body);
    }
    if (!matched) {
        auto now = fetchPlayerPage(device.ip, "/now");
        matched = now.status == 200 && core::fingerprint::hasNowPlayingMarker(now.body);
    }
    if (!matched) {
        return false;
    }

    device.modelInfo = core::fingerprint::extractTitle(main.body).value_or("Iconbit");
    device.vendor = "iconbit";
    device.deviceKind = core::DeviceKind::MediaPlayer;
    return true;
}

} // namespace fleetwatch::infra
