#include "infrastructure/network/UdpExchange.hpp"

namespace fleetwatch::infra {

DatagramReply exchangeDatagram(const asio::ip::udp::endpoint& target,
                               const std::vector<uint8_t>& request,
                               std::chrono::milliseconds timeout, size_t maxReplySize) {
    DatagramReply reply;

    asio::io_context io;
    asio::ip::udp::socket socket(io);
    asio::error_code ec;
    socket.open(target.protocol(), ec);
    if (ec) {
        reply.error = ec.message();
        return reply;
    }

    asio::steady_timer deadline(io);
    std::vector<uint8_t> buffer(maxReplySize);
    bool completed = false;
    asio::error_code failure;

    deadline.expires_after(timeout);
    deadline.async_wait([&](const asio::error_code& ec) {
        if (ec || completed) {
            return;
        }
        completed = true;
        reply.timedOut = true;
        asio::error_code ignored;
        socket.close(ignored);
    });

    auto finish = [&](const asio::error_code& ec) {
        if (completed) {
            return;
        }
        completed = true;
        failure = ec;
        deadline.cancel();
    };

    socket.async_send_to(asio::buffer(request), target, [&](const asio::error_code& ec, size_t) {
        if (ec) {
            finish(ec);
            return;
        }
        socket.async_receive_from(asio::buffer(buffer), reply.sender,
                                  [&](const asio::error_code& ec, size_t received) {
                                      if (!ec) {
                                          buffer.resize(received);
                                      }
                                      finish(ec);
                                  });
    });

    io.run();

    if (reply.timedOut) {
        return reply;
    }
    if (failure) {
        reply.error = failure.message();
        return reply;
    }
    reply.data = std::move(buffer);
    return reply;
}

} // namespace fleetwatch::infra
