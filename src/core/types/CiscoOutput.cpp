#include "core/types/CiscoOutput.hpp"

#include "core/types/NeighborTable.hpp"
#include "core/types/TextUtils.hpp"

#include <cctype>
#include <regex>
#include <sstream>

namespace fleetwatch::core::cisco {

namespace {

const std::string MAC_PATTERN = R"([0-9a-fA-F]{4}\.[0-9a-fA-F]{4}\.[0-9a-fA-F]{4})";

std::vector<std::string> lines(const std::string& output) {
    std::vector<std::string> result;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        result.push_back(line);
    }
    return result;
}

/// First capture of @p pattern on any single line.
std::optional<std::string> searchLines(const std::string& output, const std::regex& pattern) {
    std::smatch match;
    for (const auto& line : lines(output)) {
        if (std::regex_search(line, match, pattern)) {
            return match[1].str();
        }
    }
    return std::nullopt;
}

std::vector<std::string> splitEntries(const std::string& output) {
    static const std::regex separator(R"(-{5,})");
    std::vector<std::string> entries;
    std::sregex_token_iterator it(output.begin(), output.end(), separator, -1);
    for (std::sregex_token_iterator end; it != end; ++it) {
        entries.push_back(it->str());
    }
    return entries;
}

} // namespace

VersionInfo parseShowVersion(const std::string& output) {
    static const std::regex hostnameRe(R"(^(\S+)\s+uptime)");
    static const std::regex uptimeRe(R"(uptime is (.+))");
    static const std::regex iosVersionRe(R"(Cisco IOS Software.*?Version\s+(\S+))", std::regex::icase);
    static const std::regex versionRe(R"(Version\s+(\S+))");
    static const std::regex modelNumberRe(R"([Mm]odel\s+[Nn]umber\s*:\s*(\S+))");
    static const std::regex modelFamilyRe(R"(cisco\s+(WS-\S+|C\d+\S*))", std::regex::icase);
    static const std::regex modelLineRe(R"(^[Cc]isco\s+(\S+)\s+\()");

    VersionInfo info;
    info.hostname = searchLines(output, hostnameRe);
    if (auto uptime = searchLines(output, uptimeRe)) {
        info.uptime = text::trim(*uptime);
    }

    auto version = searchLines(output, iosVersionRe);
    if (!version) {
        version = searchLines(output, versionRe);
    }
    if (version) {
        while (!version->empty() && version->back() == ',') {
            version->pop_back();
        }
        info.version = version;
    }

    auto model = searchLines(output, modelNumberRe);
    if (!model) {
        model = searchLines(output, modelFamilyRe);
    }
    if (!model) {
        model = searchLines(output, modelLineRe);
    }
    info.model = model;
    return info;
}

std::string normalizePortName(const std::string& port) {
    static const std::vector<std::pair<std::string, std::string>> replacements = {
        {"GigabitEthernet", "Gi"},
        {"FastEthernet", "Fa"},
        {"TenGigabitEthernet", "Te"},
        {"TwentyFiveGigE", "Twe"},
    };
    auto name = text::trim(port);
    for (const auto& [longForm, shortForm] : replacements) {
        if (text::startsWith(name, longForm)) {
            name = shortForm + name.substr(longForm.size());
        }
    }
    return name;
}

std::vector<AccessPointInfo> parseCdpAccessPoints(const std::string& output, int vlan) {
    static const std::regex platformRe(R"(Platform:\s*(.+?)(?:,|$))");
    static const std::regex capabilitiesRe(R"(Capabilities:\s*(.+))");
    static const std::regex apPlatformRe(
        R"(AIR-|[Aa]ironet|[Cc]9120|[Cc]9130|[Cc]9115|[Cc]9105|[Cc]1560|[Cc]isco\s+AP|[Ww]ireless|Trans-Bridge)");
    static const std::regex interfaceRe(R"(Interface:\s*(\S+),)");
    static const std::regex deviceIdRe(R"(Device ID:\s*(.+))");
    static const std::regex ipRe(R"(IP address:\s*(\d+\.\d+\.\d+\.\d+))");

    std::vector<AccessPointInfo> aps;
    for (const auto& entry : splitEntries(output)) {
        bool isAp = false;
        std::string platform;
        if (auto value = searchLines(entry, platformRe)) {
            platform = text::trim(*value);
            isAp = std::regex_search(platform, apPlatformRe);
        }
        if (auto caps = searchLines(entry, capabilitiesRe)) {
            if (caps->find("Trans-Bridge") != std::string::npos) {
                isAp = true;
            }
        }
        if (!isAp) {
            continue;
        }

        AccessPointInfo ap;
        ap.vlan = vlan;
        ap.port = text::trim(searchLines(entry, interfaceRe).value_or(""));
        if (auto name = searchLines(entry, deviceIdRe)) {
            ap.cdpName = text::trim(*name);
        }
        ap.ipAddress = searchLines(entry, ipRe);
        ap.cdpPlatform = platform;
        aps.push_back(std::move(ap));
    }
    return aps;
}

std::map<std::string, std::string> parseMacAddressTable(const std::string& output) {
    static const std::regex rowRe("\\s*\\d+\\s+(" + MAC_PATTERN + ")\\s+\\S+\\s+(\\S+)");
    std::map<std::string, std::string> macByPort;
    std::smatch match;
    for (const auto& line : lines(output)) {
        if (std::regex_search(line, match, rowRe, std::regex_constants::match_continuous)) {
            macByPort[normalizePortName(match[2].str())] =
                ciscoMacToColon(text::toLower(match[1].str()));
        }
    }
    return macByPort;
}

std::map<std::string, PoeEntry> parsePowerInline(const std::string& output) {
    static const std::regex rowRe(R"(\s*(\S+)\s+\S+\s+(\S+)\s+([\d.]+)\s+)");
    std::map<std::string, PoeEntry> poeByPort;
    std::smatch match;
    for (const auto& line : lines(output)) {
        if (std::regex_search(line, match, rowRe, std::regex_constants::match_continuous)) {
            poeByPort[normalizePortName(match[1].str())] = PoeEntry{match[2].str(), match[3].str() + "W"};
        }
    }
    return poeByPort;
}

std::map<std::string, std::string> parseIpArp(const std::string& output) {
    static const std::regex rowRe("(\\d+\\.\\d+\\.\\d+\\.\\d+)\\s+\\S+\\s+(" + MAC_PATTERN + ")");
    std::map<std::string, std::string> ipByMac;
    std::smatch match;
    for (const auto& line : lines(output)) {
        if (std::regex_search(line, match, rowRe)) {
            ipByMac[ciscoMacToColon(text::toLower(match[2].str()))] = match[1].str();
        }
    }
    return ipByMac;
}

void enrichAccessPoints(std::vector<AccessPointInfo>& aps,
                        const std::map<std::string, std::string>& macByPort,
                        const std::map<std::string, PoeEntry>& poeByPort,
                        const std::map<std::string, std::string>& ipByMac) {
    for (auto& ap : aps) {
        auto key = normalizePortName(ap.port);
        if (auto it = macByPort.find(key); it != macByPort.end()) {
            ap.macAddress = it->second;
        }
        if (auto it = poeByPort.find(key); it != poeByPort.end()) {
            ap.poeStatus = it->second.status;
            ap.poePower = it->second.power;
        }
        if (auto it = ipByMac.find(ap.macAddress); it != ipByMac.end()) {
            ap.ipAddress = it->second;
        }
    }
}

std::vector<PortState> parseInterfacesStatus(const std::string& output) {
    static const std::regex rowRe(R"(^(\S+)\s+(.+?)\s+(connected|notconnect|disabled|err-disabled)\s+)");
    std::vector<PortState> ports;
    std::smatch match;
    for (auto line : lines(output)) {
        while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
            line.pop_back();
        }
        if (line.empty() || text::startsWith(text::toLower(line), "port ") ||
            text::startsWith(line, "---")) {
            continue;
        }
        if (!std::regex_search(line, match, rowRe)) {
            continue;
        }
        PortState state;
        state.port = match[1].str();
        auto description = text::trim(match[2].str());
        if (description != "--") {
            state.description = description;
        }
        state.operStatus = match[3].str() == "connected" ? "up" : "down";
        ports.push_back(std::move(state));
    }
    return ports;
}

} // namespace fleetwatch::core::cisco
