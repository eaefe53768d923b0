#include "infrastructure/discovery/HostEnumerator.hpp"

#include "core/types/Errors.hpp"
#include "core/types/TextUtils.hpp"

#include <asio/ip/address_v4.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <unordered_set>

namespace fleetwatch::infra {

namespace {

std::optional<int> parseNumber(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<uint32_t> parseAddress(const std::string& text) {
    asio::error_code ec;
    auto address = asio::ip::make_address_v4(text, ec);
    if (ec) {
        return std::nullopt;
    }
    return address.to_uint();
}

/// Prefix length of a dotted netmask; std::nullopt if the bits are not contiguous.
std::optional<int> prefixFromNetmask(uint32_t mask) {
    int prefix = 0;
    while (prefix < 32 && (mask & (0x80000000u >> prefix)) != 0) {
        ++prefix;
    }
    uint32_t expected = prefix == 0 ? 0 : 0xFFFFFFFFu << (32 - prefix);
    if (mask != expected) {
        return std::nullopt;
    }
    return prefix;
}

uint32_t maskFor(int prefix) {
    return prefix == 0 ? 0 : 0xFFFFFFFFu << (32 - prefix);
}

} // namespace

uint64_t Ipv4Network::hostCount() const {
    uint64_t size = uint64_t{1} << (32 - prefix);
    return prefix >= 31 ? size : size - 2;
}

uint32_t Ipv4Network::firstHost() const {
    return prefix >= 31 ? network : network + 1;
}

std::optional<Ipv4Network> HostEnumerator::parseNetwork(const std::string& fragment) {
    auto slash = fragment.find('/');
    auto address = parseAddress(fragment.substr(0, slash));
    if (!address) {
        return std::nullopt;
    }

    int prefix = 32;
    if (slash != std::string::npos) {
        auto suffix = fragment.substr(slash + 1);
        if (suffix.find('.') != std::string::npos) {
            auto mask = parseAddress(suffix);
            auto fromMask = mask ? prefixFromNetmask(*mask) : std::nullopt;
            if (!fromMask) {
                return std::nullopt;
            }
            prefix = *fromMask;
        } else {
            auto parsed = parseNumber(suffix);
            if (!parsed || *parsed < 0 || *parsed > 32) {
                return std::nullopt;
            }
            prefix = *parsed;
        }
    }

    Ipv4Network net;
    net.prefix = prefix;
    net.network = *address & maskFor(prefix);
    return net;
}

std::vector<std::string> HostEnumerator::parseSubnets(const std::string& list, int maxHosts) {
    const size_t limit = static_cast<size_t>(std::max(maxHosts, 1));
    std::vector<std::string> hosts;
    std::unordered_set<uint32_t> seen;

    for (const auto& fragment : core::text::splitTrimmed(list, ',')) {
        auto net = parseNetwork(fragment);
        if (!net) {
            spdlog::warn("Invalid discovery subnet: {}", fragment);
            continue;
        }

        const uint32_t first = net->firstHost();
        const uint64_t count = net->hostCount();
        for (uint64_t i = 0; i < count; ++i) {
            uint32_t value = first + static_cast<uint32_t>(i);
            if (!seen.insert(value).second) {
                continue;
            }
            hosts.push_back(asio::ip::address_v4(value).to_string());
            if (hosts.size() > limit) {
                throw core::SubnetLimitExceeded(hosts.size(), limit);
            }
        }
    }
    return hosts;
}

std::vector<uint16_t> HostEnumerator::parsePorts(const std::string& list) {
    std::vector<uint16_t> ports;
    for (const auto& raw : core::text::splitTrimmed(list, ',')) {
        auto port = parseNumber(raw);
        if (!port) {
            spdlog::warn("Invalid discovery port: {}", raw);
            continue;
        }
        if (*port < 1 || *port > 65535) {
            spdlog::warn("Discovery port out of range: {}", raw);
            continue;
        }
        auto value = static_cast<uint16_t>(*port);
        if (std::find(ports.begin(), ports.end(), value) == ports.end()) {
            ports.push_back(value);
        }
    }
    return ports;
}

} // namespace fleetwatch::infra
