#pragma once

#include "core/types/HttpTypes.hpp"

namespace fleetwatch::core {

/**
 * @brief Blocking HTTP/1.1 client.
 *
 * Transport failures are reported through HttpResponse::error with status 0,
 * never thrown.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse send(const HttpRequest& request) = 0;
};

} // namespace fleetwatch::core
