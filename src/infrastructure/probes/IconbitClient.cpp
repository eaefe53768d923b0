#include "infrastructure/probes/IconbitClient.hpp"

#include "core/types/MediaPlayerPages.hpp"

#include <spdlog/spdlog.h>

namespace fleetwatch::infra {

namespace {

const std::pair<std::string, std::string> kCredentials{"admin", "admin"};

} // namespace

IconbitClient::IconbitClient(std::shared_ptr<core::IHttpClient> http) : http_(std::move(http)) {}

core::HttpResponse IconbitClient::get(const std::string& address, const std::string& target) {
    core::HttpRequest request;
    request.host = address;
    request.port = kPort;
    request.target = target;
    request.basicAuth = kCredentials;
    request.timeout = kTimeout;
    request.followRedirects = true;

    auto response = http_->send(request);
    if (!response.received()) {
        spdlog::warn("Iconbit GET http://{}:{}{} failed: {}", address, kPort, target, response.error);
    }
    return response;
}

core::HttpResponse IconbitClient::postFile(const std::string& address, const std::string& target,
                                           const std::string& fileName, const std::string& content) {
    core::HttpRequest request;
    request.method = "POST";
    request.host = address;
    request.port = kPort;
    request.target = target;
    request.basicAuth = kCredentials;
    request.timeout = kUploadTimeout;
    request.upload = core::MultipartFile{"file", fileName, content};

    auto response = http_->send(request);
    if (!response.received()) {
        spdlog::warn("Iconbit POST http://{}:{}{} failed: {}", address, kPort, target, response.error);
    }
    return response;
}

void IconbitClient::rememberFirmware(const std::string& address, IconbitFirmware firmware) {
    std::lock_guard lock(hintsMutex_);
    hints_[address] = firmware;
}

std::optional<IconbitFirmware> IconbitClient::firmwareHint(const std::string& address) const {
    std::lock_guard lock(hintsMutex_);
    auto it = hints_.find(address);
    if (it == hints_.end()) {
        return std::nullopt;
    }
    return it->second;
}

core::MediaPlayerStatus IconbitClient::status(const std::string& address) {
    core::MediaPlayerStatus status;

    auto main = get(address, "/");
    if (!main.received()) {
        return status;
    }
    if (main.status == 200) {
        status.files = core::mediaplayer::extractFileLinks(main.body);
        status.freeSpace = core::mediaplayer::parseFreeSpace(main.body);
    }

    if (firmwareHint(address) == IconbitFirmware::New) {
        if (!readNowPage(address, status)) {
            readStatusXml(address, status);
        }
    } else if (!readStatusXml(address, status)) {
        readNowPage(address, status);
    }
    return status;
}

bool IconbitClient::readStatusXml(const std::string& address, core::MediaPlayerStatus& status) {
    auto response = get(address, "/status.xml");
    if (response.status == 404) {
        rememberFirmware(address, IconbitFirmware::New);
        return false;
    }
    if (response.status != 200) {
        return false;
    }
    auto doc = core::mediaplayer::parseStatusXml(response.body);
    if (!doc) {
        return false;
    }

    rememberFirmware(address, IconbitFirmware::Old);
    status.state = doc->state;
    status.isPlaying = doc->state == "playing" || doc->state == "paused";
    if (!doc->file.empty()) {
        status.nowPlaying = doc->file;
    }
    status.position = doc->position;
    status.duration = doc->duration;
    return true;
}

bool IconbitClient::readNowPage(const std::string& address, core::MediaPlayerStatus& status) {
    auto response = get(address, "/now");
    if (response.status != 200) {
        return false;
    }

    rememberFirmware(address, IconbitFirmware::New);
    if (auto track = core::mediaplayer::parseNowHtml(response.body)) {
        status.nowPlaying = *track;
        status.isPlaying = true;
        status.state = "playing";
    }
    return true;
}

bool IconbitClient::play(const std::string& address) {
    return get(address, "/play").accepted();
}

bool IconbitClient::stop(const std::string& address) {
    return get(address, "/stop").accepted();
}

bool IconbitClient::playFile(const std::string& address, const std::string& fileName) {
    const auto encoded = core::urlEncode(fileName);
    if (get(address, "/play?file=" + encoded).accepted()) {
        return true;
    }
    return get(address, "/playlink?link=" + encoded).accepted();
}

bool IconbitClient::deleteFile(const std::string& address, const std::string& fileName) {
    return get(address, "/delete?file=" + core::urlEncode(fileName)).accepted();
}

bool IconbitClient::upload(const std::string& address, const std::string& fileName,
                           const std::string& content) {
    if (postFile(address, "/", fileName, content).accepted()) {
        return true;
    }
    return postFile(address, "/upload", fileName, content).accepted();
}

bool IconbitClient::deleteAll(const std::string& address) {
    bool ok = true;
    for (const auto& file : status(address).files) {
        if (!deleteFile(address, file)) {
            spdlog::warn("Iconbit {}: delete of '{}' was refused", address, file);
            ok = false;
        }
    }
    return ok;
}

} // namespace fleetwatch::infra
