#include "core/types/NeighborTable.hpp"

#include "core/types/TextUtils.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>
#include <vector>

namespace fleetwatch::core {

namespace {

constexpr const char* ZERO_MAC = "00:00:00:00:00:00";

std::vector<std::string> columns(const std::string& line) {
    std::vector<std::string> parts;
    std::istringstream stream(line);
    std::string part;
    while (stream >> part) {
        parts.push_back(part);
    }
    return parts;
}

} // namespace

NeighborTable::NeighborTable(std::map<std::string, std::string> entries)
    : entries_(std::move(entries)) {}

NeighborTable NeighborTable::fromProcNetArp(const std::string& content) {
    std::map<std::string, std::string> entries;
    std::istringstream stream(content);
    std::string line;
    bool header = true;
    while (std::getline(stream, line)) {
        if (header) {
            header = false;
            continue;
        }
        auto parts = columns(line);
        if (parts.size() >= 4 && parts[3] != ZERO_MAC) {
            entries[parts[0]] = text::toLower(parts[3]);
        }
    }
    return NeighborTable(std::move(entries));
}

NeighborTable NeighborTable::fromIpNeigh(const std::string& output) {
    std::map<std::string, std::string> entries;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        auto parts = columns(line);
        if (parts.size() >= 5 && parts[3] == "lladdr") {
            entries[parts[0]] = text::toLower(parts[4]);
        }
    }
    return NeighborTable(std::move(entries));
}

std::optional<std::string> NeighborTable::macFor(const std::string& ip) const {
    auto it = entries_.find(ip);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> NeighborTable::ipFor(const std::string& mac) const {
    auto wanted = text::toLower(mac);
    for (const auto& [ip, entryMac] : entries_) {
        if (entryMac == wanted) {
            return ip;
        }
    }
    return std::nullopt;
}

std::optional<std::string> formatMacBytes(const std::string& octets) {
    if (octets.size() != 6) {
        return std::nullopt;
    }
    bool allZero = std::all_of(octets.begin(), octets.end(), [](char c) { return c == 0; });
    if (allZero) {
        return std::nullopt;
    }
    std::string mac;
    char buffer[4];
    for (size_t i = 0; i < octets.size(); ++i) {
        std::snprintf(buffer, sizeof(buffer), "%02x", static_cast<unsigned char>(octets[i]));
        if (i > 0) {
            mac += ':';
        }
        mac += buffer;
    }
    return mac;
}

std::string ciscoMacToColon(const std::string& mac) {
    std::string hex;
    for (char c : mac) {
        if (c != '.') {
            hex += c;
        }
    }
    hex = text::toLower(hex);
    if (hex.size() != 12) {
        return mac;
    }
    std::string result;
    for (size_t i = 0; i < hex.size(); i += 2) {
        if (!result.empty()) {
            result += ':';
        }
        result += hex.substr(i, 2);
    }
    return result;
}

} // namespace fleetwatch::core
