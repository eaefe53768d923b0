/**
 * @file HttpTypes.hpp
 * @brief Outgoing HTTP request and response records.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace fleetwatch::core {

/**
 * @brief One file part of a multipart/form-data body.
 */
struct MultipartFile {
    std::string fieldName{"file"};
    std::string fileName;
    std::string content;
};

struct HttpRequest {
    std::string method{"GET"};
    std::string host;
    uint16_t port{80};
    std::string target{"/"};                       ///< Path plus query string
    std::map<std::string, std::string> headers;
    std::string body;
    std::optional<MultipartFile> upload;           ///< Sent as multipart/form-data when set
    std::optional<std::pair<std::string, std::string>> basicAuth;
    std::chrono::milliseconds timeout{8000};
    bool followRedirects{true};
};

/**
 * @brief Response of a request; status 0 means the exchange itself failed.
 */
struct HttpResponse {
    int status{0};
    std::map<std::string, std::string> headers; ///< Lower-case names
    std::string body;
    std::string error;

    [[nodiscard]] bool received() const { return status != 0; }

    /**
     * @brief Whether a device command was accepted (200 or 302).
     */
    [[nodiscard]] bool accepted() const { return status == 200 || status == 302; }
};

/**
 * @brief Percent-encodes a query parameter value.
 */
std::string urlEncode(const std::string& value);

} // namespace fleetwatch::core
