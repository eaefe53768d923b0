#include "infrastructure/api/RestApiServer.hpp"

#include "core/types/Errors.hpp"
#include "core/types/TextUtils.hpp"
#include "infrastructure/crypto/SecretBox.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <sstream>

namespace fleetwatch::infra {

namespace {

constexpr size_t MAX_BODY_SIZE = 64 * 1024 * 1024;

nlohmann::json parseBody(const ApiRequest& req) {
    if (core::text::trim(req.body).empty()) {
        return nlohmann::json::object();
    }
    auto json = nlohmann::json::parse(req.body);
    if (!json.is_object()) {
        throw core::ConfigurationError("Request body must be a JSON object");
    }
    return json;
}

core::DeviceKind kindParam(const ApiRequest& req) {
    auto it = req.pathParams.find("kind");
    if (it == req.pathParams.end()) {
        throw core::ConfigurationError("Missing device kind");
    }
    return core::parseDeviceKind(it->second);
}

core::PollTarget targetField(const nlohmann::json& body, core::DeviceKind kind) {
    if (!body.contains("target") || !body["target"].is_object()) {
        throw core::ConfigurationError("Request requires a 'target' object");
    }
    return core::PollTarget::fromJson(body["target"], kind);
}

std::string stringOr(const nlohmann::json& body, const std::string& key, const std::string& fallback) {
    if (body.contains(key) && body[key].is_string()) {
        return body[key].get<std::string>();
    }
    return fallback;
}

nlohmann::json toJsonArray(const auto& items) {
    auto array = nlohmann::json::array();
    for (const auto& item : items) {
        array.push_back(item.toJson());
    }
    return array;
}

} // namespace

std::string statusTextFor(int code) {
    switch (code) {
    case 200:
        return "OK";
    case 202:
        return "Accepted";
    case 204:
        return "No Content";
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 404:
        return "Not Found";
    case 409:
        return "Conflict";
    case 413:
        return "Payload Too Large";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    default:
        return "Error";
    }
}

void ApiResponse::setJson(const nlohmann::json& json, int code) {
    statusCode = code;
    statusText = statusTextFor(code);
    body = json.dump();
    headers["Content-Type"] = "application/json";
}

void ApiResponse::setError(int code, const std::string& message) {
    setJson({{"detail", message}}, code);
}

std::string ApiResponse::toString() const {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << statusCode << " " << statusText << "\r\n";
    for (const auto& [key, value] : headers) {
        ss << key << ": " << value << "\r\n";
    }
    ss << "Content-Length: " << body.size() << "\r\n";
    ss << "Connection: close\r\n";
    ss << "\r\n";
    ss << body;
    return ss.str();
}

RestApiServer::RestApiServer(AsioContext& asioContext, ApiServices services, uint16_t port)
    : asioContext_(asioContext), services_(std::move(services)), port_(port) {
    registerRoutes();
}

RestApiServer::~RestApiServer() {
    stop();
}

void RestApiServer::registerRoutes() {
    routes_.push_back(
        {HttpMethod::GET, "/health", [this](auto& req, auto& res) { handleHealth(req, res); }, false});

    routes_.push_back({HttpMethod::POST, "/discover/:kind/scan",
                       [this](auto& req, auto& res) { handleStartScan(req, res); }});
    routes_.push_back({HttpMethod::GET, "/discover/:kind/status",
                       [this](auto& req, auto& res) { handleScanStatus(req, res); }});
    routes_.push_back({HttpMethod::GET, "/discover/:kind/results",
                       [this](auto& req, auto& res) { handleScanResults(req, res); }});

    routes_.push_back({HttpMethod::POST, "/poll/:kind",
                       [this](auto& req, auto& res) { handlePollCycle(req, res); }});
    routes_.push_back({HttpMethod::POST, "/devices/:kind/ports",
                       [this](auto& req, auto& res) { handlePortTable(req, res); }});
    routes_.push_back({HttpMethod::POST, "/devices/:kind/port-config",
                       [this](auto& req, auto& res) { handlePortConfig(req, res); }});
    routes_.push_back({HttpMethod::POST, "/switches/access-points",
                       [this](auto& req, auto& res) { handleAccessPoints(req, res); }});

    routes_.push_back({HttpMethod::POST, "/media-players/status",
                       [this](auto& req, auto& res) { handleMediaPlayerStatus(req, res); }});
    routes_.push_back({HttpMethod::POST, "/media-players/commands/:command",
                       [this](auto& req, auto& res) { handleMediaPlayerCommand(req, res); }});
}

void RestApiServer::start() {
    if (running_.load()) {
        return;
    }

    try {
        acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(
            asioContext_.getContext(), asio::ip::tcp::endpoint(asio::ip::tcp::v4(), port_));

        running_ = true;
        startAccept();
        spdlog::info("Control API listening on port {}", port_);
    } catch (const std::exception& e) {
        spdlog::error("Failed to start control API: {}", e.what());
        throw;
    }
}

void RestApiServer::stop() {
    if (!running_.load()) {
        return;
    }

    running_ = false;
    if (acceptor_) {
        asio::error_code ec;
        acceptor_->close(ec);
        acceptor_.reset();
    }
    spdlog::info("Control API stopped");
}

void RestApiServer::startAccept() {
    if (!running_.load()) {
        return;
    }

    auto socket = std::make_shared<asio::ip::tcp::socket>(asioContext_.getContext());
    auto self = shared_from_this();

    acceptor_->async_accept(*socket, [this, self, socket](const asio::error_code& ec) {
        if (!ec && running_.load()) {
            readRequest(socket);
        }
        if (running_.load()) {
            startAccept();
        }
    });
}

void RestApiServer::readRequest(std::shared_ptr<asio::ip::tcp::socket> socket) {
    auto buffer = std::make_shared<asio::streambuf>();
    auto self = shared_from_this();

    asio::async_read_until(
        *socket, *buffer, "\r\n\r\n",
        [this, self, socket, buffer](const asio::error_code& ec, std::size_t) {
            if (ec) {
                return;
            }

            std::string headerData((std::istreambuf_iterator<char>(&*buffer)),
                                   std::istreambuf_iterator<char>());

            size_t contentLength = 0;
            std::istringstream iss(headerData);
            std::string line;
            while (std::getline(iss, line) && line != "\r") {
                auto pos = line.find(':');
                if (pos == std::string::npos ||
                    !core::text::iequals(core::text::trim(line.substr(0, pos)), "content-length")) {
                    continue;
                }
                auto value = core::text::trim(line.substr(pos + 1));
                std::from_chars(value.data(), value.data() + value.size(), contentLength);
            }

            if (contentLength > MAX_BODY_SIZE) {
                ApiResponse response;
                response.setError(413, "Request body too large");
                sendResponse(socket, response);
                return;
            }

            auto headerEnd = headerData.find("\r\n\r\n");
            size_t bodyInBuffer =
                (headerEnd != std::string::npos) ? headerData.size() - headerEnd - 4 : 0;
            size_t remaining = contentLength > bodyInBuffer ? contentLength - bodyInBuffer : 0;

            if (remaining == 0) {
                processRequest(socket, headerData);
                return;
            }

            auto bodyBuffer = std::make_shared<std::vector<char>>(remaining);
            asio::async_read(*socket, asio::buffer(*bodyBuffer),
                             [this, self, socket, headerData, bodyBuffer](const asio::error_code& ec2,
                                                                          std::size_t) {
                                 if (!ec2) {
                                     processRequest(socket, headerData + std::string(bodyBuffer->begin(),
                                                                                     bodyBuffer->end()));
                                 }
                             });
        });
}

void RestApiServer::processRequest(std::shared_ptr<asio::ip::tcp::socket> socket,
                                   const std::string& rawRequest) {
    sendResponse(socket, dispatch(parseRequest(rawRequest)));
}

ApiResponse RestApiServer::dispatch(ApiRequest request) {
    ApiResponse response;

    for (auto& route : routes_) {
        if (route.method != request.method ||
            !matchRoute(route.pattern, request.path, request.pathParams)) {
            continue;
        }

        if (route.requiresAuth && !internalToken_.empty() && !validateToken(request)) {
            spdlog::warn("Rejected {} without a valid internal token", request.path);
            response.setError(401, "Invalid internal token");
            return response;
        }

        try {
            route.handler(request, response);
        } catch (const core::LockConflict& e) {
            response.setError(409, e.what());
        } catch (const core::ConfigurationError& e) {
            response.setError(400, e.what());
        } catch (const nlohmann::json::exception& e) {
            response.setError(400, std::string("Invalid JSON body: ") + e.what());
        } catch (const core::ProbeError& e) {
            response.setError(502, e.what());
        } catch (const core::StateStoreError& e) {
            spdlog::error("State store failure on {}: {}", request.path, e.what());
            response.setError(503, e.what());
        } catch (const std::exception& e) {
            spdlog::error("Control API error on {}: {}", request.path, e.what());
            response.setError(500, "Internal server error");
        }
        return response;
    }

    response.setError(404, "Endpoint not found");
    return response;
}

void RestApiServer::sendResponse(std::shared_ptr<asio::ip::tcp::socket> socket,
                                 const ApiResponse& response) {
    auto responseStr = std::make_shared<std::string>(response.toString());

    asio::async_write(*socket, asio::buffer(*responseStr),
                      [socket, responseStr](const asio::error_code&, std::size_t) {
                          asio::error_code shutdownEc;
                          socket->shutdown(asio::ip::tcp::socket::shutdown_both, shutdownEc);
                      });
}

ApiRequest RestApiServer::parseRequest(const std::string& rawRequest) {
    ApiRequest request;
    std::istringstream iss(rawRequest);
    std::string line;

    if (std::getline(iss, line)) {
        std::istringstream lineStream(core::text::trim(line));
        std::string method, path, version;
        lineStream >> method >> path >> version;

        request.method = parseMethod(method);

        auto queryPos = path.find('?');
        if (queryPos != std::string::npos) {
            request.queryParams = parseQueryString(path.substr(queryPos + 1));
            path = path.substr(0, queryPos);
        }
        request.path = path;
    }

    while (std::getline(iss, line) && line != "\r" && !line.empty()) {
        auto colonPos = line.find(':');
        if (colonPos != std::string::npos) {
            request.headers[core::text::toLower(core::text::trim(line.substr(0, colonPos)))] =
                core::text::trim(line.substr(colonPos + 1));
        }
    }

    auto bodyStart = rawRequest.find("\r\n\r\n");
    if (bodyStart != std::string::npos) {
        request.body = rawRequest.substr(bodyStart + 4);
    }

    return request;
}

HttpMethod RestApiServer::parseMethod(const std::string& method) {
    if (method == "GET")
        return HttpMethod::GET;
    if (method == "POST")
        return HttpMethod::POST;
    if (method == "PUT")
        return HttpMethod::PUT;
    if (method == "DELETE")
        return HttpMethod::DELETE;
    if (method == "OPTIONS")
        return HttpMethod::OPTIONS;
    return HttpMethod::UNKNOWN;
}

std::map<std::string, std::string> RestApiServer::parseQueryString(const std::string& queryString) {
    std::map<std::string, std::string> params;
    std::istringstream iss(queryString);
    std::string pair;

    while (std::getline(iss, pair, '&')) {
        auto eqPos = pair.find('=');
        if (eqPos != std::string::npos) {
            params[pair.substr(0, eqPos)] = pair.substr(eqPos + 1);
        }
    }

    return params;
}

bool RestApiServer::matchRoute(const std::string& pattern, const std::string& path,
                               std::map<std::string, std::string>& pathParams) {
    pathParams.clear();

    std::vector<std::string> patternParts, pathParts;
    std::istringstream patternStream(pattern), pathStream(path);
    std::string part;

    while (std::getline(patternStream, part, '/')) {
        if (!part.empty())
            patternParts.push_back(part);
    }
    while (std::getline(pathStream, part, '/')) {
        if (!part.empty())
            pathParts.push_back(part);
    }

    if (patternParts.size() != pathParts.size()) {
        return false;
    }

    for (size_t i = 0; i < patternParts.size(); ++i) {
        if (patternParts[i].front() == ':') {
            pathParams[patternParts[i].substr(1)] = pathParts[i];
        } else if (patternParts[i] != pathParts[i]) {
            pathParams.clear();
            return false;
        }
    }

    return true;
}

bool RestApiServer::validateToken(const ApiRequest& request) const {
    auto it = request.headers.find("x-internal-token");
    return it != request.headers.end() && constantTimeEquals(it->second, internalToken_);
}

void RestApiServer::handleHealth(const ApiRequest&, ApiResponse& res) {
    res.setJson({{"status", "ok"}});
}

void RestApiServer::handleStartScan(const ApiRequest& req, ApiResponse& res) {
    auto kind = kindParam(req);
    auto body = parseBody(req);

    ScanRequest scan;
    scan.kind = kind;
    scan.subnet = stringOr(body, "subnet", "");
    scan.ports = stringOr(body, "ports", "");
    if (body.contains("known_devices") && body["known_devices"].is_array()) {
        for (const auto& known : body["known_devices"]) {
            scan.knownDevices.push_back(core::KnownDevice::fromJson(known));
        }
    }

    services_.discovery->startScan(scan);
    spdlog::info("Discovery scan '{}' accepted", core::deviceKindToString(kind));

    core::ScanProgress started;
    started.status = core::ScanStatus::Running;
    res.setJson(started.toJson(), 202);
}

void RestApiServer::handleScanStatus(const ApiRequest& req, ApiResponse& res) {
    res.setJson(services_.discovery->progress(kindParam(req)).toJson());
}

void RestApiServer::handleScanResults(const ApiRequest& req, ApiResponse& res) {
    auto kind = kindParam(req);
    res.setJson({{"progress", services_.discovery->progress(kind).toJson()},
                 {"devices", toJsonArray(services_.discovery->results(kind))}});
}

void RestApiServer::handlePollCycle(const ApiRequest& req, ApiResponse& res) {
    auto kind = kindParam(req);
    auto body = parseBody(req);
    if (!body.contains("targets") || !body["targets"].is_array()) {
        throw core::ConfigurationError("Request requires a 'targets' array");
    }

    std::vector<core::PollTarget> targets;
    for (const auto& entry : body["targets"]) {
        targets.push_back(core::PollTarget::fromJson(entry, kind));
    }
    res.setJson(services_.poller->runCycle(kind, targets).toJson());
}

void RestApiServer::handlePortTable(const ApiRequest& req, ApiResponse& res) {
    auto target = targetField(parseBody(req), kindParam(req));
    auto ports = services_.probes->probeFor(target).getPortTable(target);
    res.setJson({{"ports", toJsonArray(ports)}});
}

void RestApiServer::handlePortConfig(const ApiRequest& req, ApiResponse& res) {
    auto body = parseBody(req);
    auto target = targetField(body, kindParam(req));
    if (!body.contains("change") || !body["change"].is_object()) {
        throw core::ConfigurationError("Request requires a 'change' object");
    }
    auto change = core::PortConfigChange::fromJson(body["change"]);

    services_.probes->probeFor(target).writePortConfig(target, change);
    res.setJson({{"status", "ok"}, {"port", change.port}});
}

void RestApiServer::handleAccessPoints(const ApiRequest& req, ApiResponse& res) {
    auto body = parseBody(req);
    auto target = targetField(body, core::DeviceKind::Switch);
    if (!body.contains("vlan") || !body["vlan"].is_number_integer()) {
        throw core::ConfigurationError("Request requires an integer 'vlan'");
    }

    auto aps = services_.probes->shellSwitch().accessPoints(target, body["vlan"].get<int>());
    res.setJson({{"access_points", toJsonArray(aps)}, {"count", aps.size()}});
}

void RestApiServer::handleMediaPlayerStatus(const ApiRequest& req, ApiResponse& res) {
    auto target = targetField(parseBody(req), core::DeviceKind::MediaPlayer);
    res.setJson(services_.probes->mediaPlayer().status(target).toJson());
}

void RestApiServer::handleMediaPlayerCommand(const ApiRequest& req, ApiResponse& res) {
    auto body = parseBody(req);
    auto target = targetField(body, core::DeviceKind::MediaPlayer);
    const auto& command = req.pathParams.at("command");
    auto& client = services_.probes->mediaPlayer().client();
    const auto file = stringOr(body, "file", "");

    auto requireFile = [&file, &command]() {
        if (file.empty()) {
            throw core::ConfigurationError("Command '" + command + "' requires 'file'");
        }
    };

    bool ok = false;
    if (command == "play") {
        ok = file.empty() ? client.play(target.address) : client.playFile(target.address, file);
    } else if (command == "stop") {
        ok = client.stop(target.address);
    } else if (command == "delete") {
        requireFile();
        ok = client.deleteFile(target.address, file);
    } else if (command == "delete-all") {
        ok = client.deleteAll(target.address);
    } else if (command == "upload") {
        requireFile();
        auto content = base64Decode(stringOr(body, "content_base64", ""));
        if (content.empty()) {
            throw core::ConfigurationError("Upload requires non-empty 'content_base64'");
        }
        ok = client.upload(target.address, file, std::string(content.begin(), content.end()));
    } else {
        res.setError(404, "Unknown media player command '" + command + "'");
        return;
    }

    spdlog::info("Media player {} command '{}': {}", target.address, command,
                 ok ? "accepted" : "refused");
    if (!ok) {
        res.setError(502, "Media player refused '" + command + "'");
        return;
    }
    res.setJson({{"status", "ok"}, {"command", command}});
}

} // namespace fleetwatch::infra
