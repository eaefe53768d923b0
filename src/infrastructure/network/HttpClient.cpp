#include "infrastructure/network/HttpClient.hpp"

#include "core/types/TextUtils.hpp"
#include "infrastructure/crypto/SecretBox.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <random>
#include <sstream>

namespace fleetwatch::infra {

namespace {

std::string makeBoundary() {
    static const char hex[] = "0123456789abcdef";
    std::random_device rd;
    std::string boundary = "----fleetwatch";
    for (int i = 0; i < 16; ++i) {
        boundary += hex[rd() % 16];
    }
    return boundary;
}

bool isRedirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

/**
 * @brief Applies a Location header to the request that produced it.
 * @return false if the location points somewhere this client cannot follow.
 */
bool applyLocation(core::HttpRequest& request, const std::string& location) {
    if (location.empty()) {
        return false;
    }
    if (location.front() == '/') {
        request.target = location;
        return true;
    }

    const std::string scheme = "http://";
    if (!core::text::startsWith(core::text::toLower(location), scheme)) {
        return false;
    }
    std::string rest = location.substr(scheme.size());
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    request.target = slash == std::string::npos ? "/" : rest.substr(slash);

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        try {
            request.port = static_cast<uint16_t>(std::stoi(authority.substr(colon + 1)));
        } catch (const std::exception&) {
            return false;
        }
        request.host = authority.substr(0, colon);
    } else {
        request.host = authority;
        request.port = 80;
    }
    return !request.host.empty();
}

} // namespace

core::HttpResponse HttpClient::send(const core::HttpRequest& request) {
    core::HttpRequest current = request;
    core::HttpResponse response = perform(current);

    for (int hop = 0; current.followRedirects && hop < kMaxRedirects; ++hop) {
        if (!isRedirect(response.status)) {
            break;
        }
        auto location = response.headers.find("location");
        if (location == response.headers.end() || !applyLocation(current, location->second)) {
            break;
        }
        if (response.status == 301 || response.status == 302 || response.status == 303) {
            if (current.method == "POST") {
                current.method = "GET";
                current.body.clear();
                current.upload.reset();
            }
        }
        spdlog::debug("HTTP {} redirect to {}:{}{}", response.status, current.host, current.port,
                      current.target);
        response = perform(current);
    }

    return response;
}

core::HttpResponse HttpClient::perform(const core::HttpRequest& request) {
    core::HttpResponse response;

    asio::io_context io;
    asio::ip::tcp::resolver resolver(io);
    asio::ip::tcp::socket socket(io);
    asio::steady_timer deadline(io);
    asio::streambuf buffer;

    const std::string payload = buildRequestText(request, makeBoundary());
    bool timedOut = false;
    asio::error_code failure;

    deadline.expires_after(request.timeout);
    deadline.async_wait([&](const asio::error_code& ec) {
        if (ec) {
            return;
        }
        timedOut = true;
        resolver.cancel();
        asio::error_code ignored;
        socket.close(ignored);
    });

    auto finish = [&](const asio::error_code& ec) {
        failure = ec;
        deadline.cancel();
    };

    resolver.async_resolve(
        request.host, std::to_string(request.port),
        [&](const asio::error_code& ec, asio::ip::tcp::resolver::results_type endpoints) {
            if (ec) {
                finish(ec);
                return;
            }
            asio::async_connect(
                socket, endpoints, [&](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
                    if (ec) {
                        finish(ec);
                        return;
                    }
                    asio::async_write(
                        socket, asio::buffer(payload), [&](const asio::error_code& ec, size_t) {
                            if (ec) {
                                finish(ec);
                                return;
                            }
                            asio::async_read(socket, buffer, asio::transfer_all(),
                                             [&](const asio::error_code& ec, size_t) {
                                                 finish(ec == asio::error::eof ? asio::error_code{}
                                                                               : ec);
                                             });
                        });
                });
        });

    io.run();

    if (timedOut) {
        response.error = "Request timed out";
        return response;
    }
    if (failure) {
        response.error = failure.message();
        return response;
    }

    std::string raw(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
    return parseResponse(raw);
}

std::string HttpClient::buildRequestText(const core::HttpRequest& request,
                                         const std::string& boundary) {
    std::string body = request.body;
    std::string contentType;

    if (request.upload) {
        const auto& file = *request.upload;
        std::ostringstream part;
        part << "--" << boundary << "\r\n"
             << "Content-Disposition: form-data; name=\"" << file.fieldName << "\"; filename=\""
             << file.fileName << "\"\r\n"
             << "Content-Type: application/octet-stream\r\n\r\n"
             << file.content << "\r\n"
             << "--" << boundary << "--\r\n";
        body = part.str();
        contentType = "multipart/form-data; boundary=" + boundary;
    }

    std::ostringstream out;
    out << request.method << " " << request.target << " HTTP/1.1\r\n";
    out << "Host: " << request.host;
    if (request.port != 80) {
        out << ":" << request.port;
    }
    out << "\r\n";
    out << "User-Agent: fleetwatch\r\n";
    out << "Accept: */*\r\n";
    out << "Connection: close\r\n";

    if (request.basicAuth) {
        out << "Authorization: Basic "
            << base64Encode(request.basicAuth->first + ":" + request.basicAuth->second) << "\r\n";
    }
    if (!contentType.empty()) {
        out << "Content-Type: " << contentType << "\r\n";
    }
    for (const auto& [name, value] : request.headers) {
        out << name << ": " << value << "\r\n";
    }
    if (!body.empty() || request.method == "POST" || request.method == "PUT") {
        out << "Content-Length: " << body.size() << "\r\n";
    }
    out << "\r\n" << body;
    return out.str();
}

core::HttpResponse HttpClient::parseResponse(const std::string& raw) {
    core::HttpResponse response;

    auto headerEnd = raw.find("\r\n\r\n");
    if (headerEnd == std::string::npos) {
        response.error = "Malformed response: no header terminator";
        return response;
    }

    std::istringstream head(raw.substr(0, headerEnd));
    std::string statusLine;
    std::getline(head, statusLine);
    if (!statusLine.empty() && statusLine.back() == '\r') {
        statusLine.pop_back();
    }

    std::istringstream statusStream(statusLine);
    std::string httpVersion;
    int status = 0;
    statusStream >> httpVersion >> status;
    if (!core::text::startsWith(httpVersion, "HTTP/") || status < 100 || status > 999) {
        response.error = "Malformed status line: " + statusLine;
        return response;
    }
    response.status = status;

    std::string line;
    while (std::getline(head, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        response.headers[core::text::toLower(core::text::trim(line.substr(0, colon)))] =
            core::text::trim(line.substr(colon + 1));
    }

    response.body = raw.substr(headerEnd + 4);

    auto encoding = response.headers.find("transfer-encoding");
    if (encoding != response.headers.end() &&
        core::text::toLower(encoding->second).find("chunked") != std::string::npos) {
        response.body = decodeChunked(response.body);
    } else if (auto length = response.headers.find("content-length");
               length != response.headers.end()) {
        try {
            auto expected = static_cast<size_t>(std::stoul(length->second));
            if (response.body.size() > expected) {
                response.body.resize(expected);
            }
        } catch (const std::exception&) {
            spdlog::debug("Ignoring malformed Content-Length '{}'", length->second);
        }
    }

    return response;
}

std::string HttpClient::decodeChunked(const std::string& body) {
    std::string decoded;
    size_t pos = 0;

    while (pos < body.size()) {
        auto lineEnd = body.find("\r\n", pos);
        if (lineEnd == std::string::npos) {
            break;
        }
        std::string sizeText = body.substr(pos, lineEnd - pos);
        auto extension = sizeText.find(';');
        if (extension != std::string::npos) {
            sizeText.resize(extension);
        }

        size_t chunkSize = 0;
        try {
            chunkSize = std::stoul(core::text::trim(sizeText), nullptr, 16);
        } catch (const std::exception&) {
            break;
        }
        if (chunkSize == 0) {
            break;
        }

        pos = lineEnd + 2;
        decoded.append(body, pos, std::min(chunkSize, body.size() - pos));
        pos += chunkSize + 2;
    }

    return decoded;
}

} // namespace fleetwatch::infra
