#include "infrastructure/network/NameResolver.hpp"

#include "core/types/TextUtils.hpp"
#include "infrastructure/network/UdpExchange.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <random>

namespace fleetwatch::infra {

namespace {

constexpr uint16_t NBSTAT_TYPE = 0x0021;
constexpr size_t NAME_ENTRY_SIZE = 18;

uint16_t readU16(const std::vector<uint8_t>& data, size_t offset) {
    return static_cast<uint16_t>((data[offset] << 8) | data[offset + 1]);
}

} // namespace

NameResolver::NameResolver(std::chrono::milliseconds netbiosTimeout, uint16_t netbiosPort)
    : netbiosTimeout_(netbiosTimeout), netbiosPort_(netbiosPort) {}

std::optional<std::string> NameResolver::reverseLookup(const std::string& address) {
    asio::error_code ec;
    auto ip = asio::ip::make_address(address, ec);
    if (ec) {
        return std::nullopt;
    }

    asio::io_context io;
    asio::ip::tcp::resolver resolver(io);
    auto results = resolver.resolve(asio::ip::tcp::endpoint(ip, 0), ec);
    if (ec || results.empty()) {
        return std::nullopt;
    }

    std::string name = results.begin()->host_name();
    if (name.empty() || name == address) {
        return std::nullopt;
    }
    return name;
}

std::optional<std::string> NameResolver::netbiosName(const std::string& address) {
    asio::error_code ec;
    auto ip = asio::ip::make_address_v4(address, ec);
    if (ec) {
        return std::nullopt;
    }

    std::random_device rd;
    auto transactionId = static_cast<uint16_t>(rd() & 0xFFFF);

    auto reply = exchangeDatagram(asio::ip::udp::endpoint(ip, netbiosPort_),
                                  buildNodeStatusRequest(transactionId), netbiosTimeout_, 1024);
    if (!reply.received()) {
        spdlog::debug("NetBIOS query to {} failed: {}", address,
                      reply.timedOut ? std::string("timed out") : reply.error);
        return std::nullopt;
    }
    return parseNodeStatusResponse(reply.data, transactionId);
}

std::vector<uint8_t> NameResolver::buildNodeStatusRequest(uint16_t transactionId) {
    std::vector<uint8_t> packet{
        static_cast<uint8_t>(transactionId >> 8), static_cast<uint8_t>(transactionId & 0xFF),
        0x00, 0x00, // flags
        0x00, 0x01, // questions
        0x00, 0x00, // answers
        0x00, 0x00, // authority
        0x00, 0x00, // additional
    };

    // "*" padded with NULs to 16 bytes, first-level encoded into 32 characters.
    std::array<uint8_t, 16> name{};
    name[0] = '*';
    packet.push_back(0x20);
    for (uint8_t byte : name) {
        packet.push_back(static_cast<uint8_t>('A' + (byte >> 4)));
        packet.push_back(static_cast<uint8_t>('A' + (byte & 0x0F)));
    }
    packet.push_back(0x00);

    packet.push_back(static_cast<uint8_t>(NBSTAT_TYPE >> 8));
    packet.push_back(static_cast<uint8_t>(NBSTAT_TYPE & 0xFF));
    packet.push_back(0x00); // class IN
    packet.push_back(0x01);
    return packet;
}

std::optional<std::string> NameResolver::parseNodeStatusResponse(const std::vector<uint8_t>& reply,
                                                                 uint16_t transactionId) {
    if (reply.size() < 12 || readU16(reply, 0) != transactionId) {
        return std::nullopt;
    }
    if ((reply[2] & 0x80) == 0 || readU16(reply, 6) == 0) {
        return std::nullopt;
    }

    size_t offset = 12;
    if (offset < reply.size() && (reply[offset] & 0xC0) == 0xC0) {
        offset += 2;
    } else {
        while (offset < reply.size() && reply[offset] != 0) {
            offset += reply[offset] + 1u;
        }
        offset += 1;
    }

    // type, class, ttl, rdlength
    if (offset + 10 > reply.size() || readU16(reply, offset) != NBSTAT_TYPE) {
        return std::nullopt;
    }
    offset += 10;

    if (offset >= reply.size()) {
        return std::nullopt;
    }
    size_t count = reply[offset++];

    for (size_t i = 0; i < count && offset + NAME_ENTRY_SIZE <= reply.size();
         ++i, offset += NAME_ENTRY_SIZE) {
        uint8_t suffix = reply[offset + 15];
        bool group = (reply[offset + 16] & 0x80) != 0;
        if (suffix != 0x00 || group) {
            continue;
        }
        std::string name(reinterpret_cast<const char*>(&reply[offset]), 15);
        name = core::text::trim(name);
        if (!name.empty()) {
            return name;
        }
    }
    return std::nullopt;
}

} // namespace fleetwatch::infra
