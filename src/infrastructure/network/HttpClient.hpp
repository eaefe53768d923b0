#pragma once

#include "core/services/IHttpClient.hpp"

#include <string>

namespace fleetwatch::infra {

/**
 * @brief Plain HTTP/1.1 client on asio.
 *
 * Every request uses its own connection ("Connection: close") and its own
 * io_context, with a single deadline covering resolve, connect, write and
 * read. Redirects are followed up to kMaxRedirects hops when the request asks
 * for it.
 */
class HttpClient : public core::IHttpClient {
public:
    core::HttpResponse send(const core::HttpRequest& request) override;

    /**
     * @brief Serializes @p request, including the multipart body if an upload is set.
     */
    static std::string buildRequestText(const core::HttpRequest& request,
                                        const std::string& boundary);

    /**
     * @brief Parses a complete response read until connection close.
     *
     * Handles chunked transfer encoding and trims the body to Content-Length.
     * A missing or malformed status line yields status 0 with an error.
     */
    static core::HttpResponse parseResponse(const std::string& raw);

    static std::string decodeChunked(const std::string& body);

    static constexpr int kMaxRedirects = 5;

private:
    core::HttpResponse perform(const core::HttpRequest& request);
};

} // namespace fleetwatch::infra
