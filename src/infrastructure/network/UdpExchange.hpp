#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace fleetwatch::infra {

/**
 * @brief Result of one datagram request/response exchange.
 */
struct DatagramReply {
    std::vector<uint8_t> data;
    asio::ip::udp::endpoint sender;
    bool timedOut{false};
    std::string error; ///< Socket error text; empty on success and on timeout

    [[nodiscard]] bool received() const { return !timedOut && error.empty(); }
};

/**
 * @brief Sends @p request to @p target and waits for the first datagram back.
 *
 * Runs on a private io_context with a steady_timer deadline, so the call
 * returns after at most @p timeout even when the peer never answers.
 */
DatagramReply exchangeDatagram(const asio::ip::udp::endpoint& target,
                               const std::vector<uint8_t>& request,
                               std::chrono::milliseconds timeout,
                               size_t maxReplySize = 65535);

} // namespace fleetwatch::infra
