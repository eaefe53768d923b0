#include "core/types/SnmpReadings.hpp"

#include "core/types/Errors.hpp"
#include "core/types/NeighborTable.hpp"
#include "core/types/TextUtils.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <map>
#include <utility>

namespace fleetwatch::core {

namespace {

constexpr std::array<std::pair<const char*, const char*>, 6> COLOR_KEYWORDS = {{
    {"black", "black"},
    {"cyan", "cyan"},
    {"magenta", "magenta"},
    {"yellow", "yellow"},
    {"schwarz", "black"},
    {"noir", "black"},
}};

std::optional<int64_t> parseInteger(const std::string& value) {
    auto trimmed = text::trim(value);
    int64_t result = 0;
    auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), result);
    if (ec != std::errc() || ptr != trimmed.data() + trimmed.size()) {
        return std::nullopt;
    }
    return result;
}

std::optional<int64_t> numericValue(const SnmpVarBind& vb) {
    if (auto n = vb.numeric()) {
        return n;
    }
    return parseInteger(vb.value);
}

std::map<int, SnmpVarBind> byIndex(const std::vector<SnmpVarBind>& rows) {
    std::map<int, SnmpVarBind> out;
    for (const auto& row : rows) {
        if (auto idx = oidIndex(row.oid)) {
            out[*idx] = row;
        }
    }
    return out;
}

struct UptimeParts {
    int64_t days;
    int64_t hours;
    int64_t minutes;
};

UptimeParts splitTicks(int64_t ticks) {
    int64_t seconds = std::max<int64_t>(ticks, 0) / 100;
    return {seconds / 86400, (seconds % 86400) / 3600, (seconds % 3600) / 60};
}

} // namespace

std::optional<int> oidIndex(const std::string& oid) {
    auto pos = oid.rfind('.');
    auto arc = pos == std::string::npos ? oid : oid.substr(pos + 1);
    auto value = parseInteger(arc);
    if (!value) {
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

std::string formatUptimeCompact(int64_t ticks) {
    auto parts = splitTicks(ticks);
    std::string result;
    if (parts.days) {
        result += std::to_string(parts.days) + "d ";
    }
    if (parts.hours) {
        result += std::to_string(parts.hours) + "h ";
    }
    result += std::to_string(parts.minutes) + "m";
    return result;
}

std::string formatUptimeFull(int64_t ticks) {
    auto parts = splitTicks(ticks);
    return std::to_string(parts.days) + "d " + std::to_string(parts.hours) + "h " +
           std::to_string(parts.minutes) + "m";
}

std::string printerStatusFromCode(int64_t code) {
    switch (code) {
    case 1:
        return "other";
    case 2:
        return "unknown";
    case 3:
        return "idle";
    case 4:
        return "printing";
    case 5:
        return "warmup";
    default:
        return "unknown";
    }
}

std::optional<std::string> tonerColor(const std::string& description) {
    auto lower = text::toLower(description);
    for (const auto& [keyword, color] : COLOR_KEYWORDS) {
        if (lower.find(keyword) != std::string::npos) {
            return std::string(color);
        }
    }
    return std::nullopt;
}

std::optional<int> tonerPercent(int64_t current, int64_t max) {
    if (current < 0 || max <= 0) {
        return std::nullopt;
    }
    auto pct = std::lround(static_cast<double>(current) / static_cast<double>(max) * 100.0);
    return static_cast<int>(std::clamp<long>(pct, 0, 100));
}

std::vector<TonerLevel> buildTonerLevels(const std::vector<SnmpVarBind>& descriptions,
                                         const std::vector<SnmpVarBind>& maxLevels,
                                         const std::vector<SnmpVarBind>& currentLevels) {
    std::vector<TonerLevel> toners;
    toners.reserve(descriptions.size());
    for (size_t i = 0; i < descriptions.size(); ++i) {
        TonerLevel toner;
        toner.description = descriptions[i].value;
        toner.maxCapacity = i < maxLevels.size() ? numericValue(maxLevels[i]).value_or(0) : 0;
        toner.currentLevel =
            i < currentLevels.size() ? numericValue(currentLevels[i]).value_or(0) : 0;
        toner.levelPct = tonerPercent(toner.currentLevel, toner.maxCapacity);
        toner.color = tonerColor(toner.description);
        toners.push_back(std::move(toner));
    }
    return toners;
}

std::optional<std::string> firstMacAddress(const std::vector<SnmpVarBind>& physAddresses) {
    for (const auto& vb : physAddresses) {
        if (vb.type != SnmpDataType::OctetString) {
            continue;
        }
        if (auto mac = formatMacBytes(vb.value)) {
            return mac;
        }
    }
    return std::nullopt;
}

std::vector<PortState> assemblePortTable(const PortTableColumns& columns) {
    auto alias = byIndex(columns.alias);
    auto admin = byIndex(columns.adminStatus);
    auto oper = byIndex(columns.operStatus);
    auto speed = byIndex(columns.speed);
    auto pvid = byIndex(columns.pvid);
    auto poeAdmin = byIndex(columns.poeAdmin);
    auto poePower = byIndex(columns.poePower);

    static const std::map<int64_t, std::string> adminNames = {
        {1, "up"}, {2, "down"}, {3, "testing"}};
    static const std::map<int64_t, std::string> operNames = {
        {1, "up"},      {2, "down"},       {3, "testing"},       {4, "unknown"},
        {5, "dormant"}, {6, "notPresent"}, {7, "lowerLayerDown"}};

    std::vector<PortState> ports;
    for (const auto& row : columns.descr) {
        auto idx = oidIndex(row.oid);
        if (!idx) {
            continue;
        }

        PortState port;
        port.port = row.value;
        port.ifIndex = *idx;

        if (auto it = alias.find(*idx); it != alias.end()) {
            port.description = it->second.value;
        }
        if (auto it = admin.find(*idx); it != admin.end()) {
            if (auto code = numericValue(it->second); code && adminNames.count(*code)) {
                port.adminStatus = adminNames.at(*code);
            }
        }
        if (auto it = oper.find(*idx); it != oper.end()) {
            if (auto code = numericValue(it->second); code && operNames.count(*code)) {
                port.operStatus = operNames.at(*code);
            }
        }
        if (auto it = speed.find(*idx); it != speed.end()) {
            if (auto bps = numericValue(it->second)) {
                port.speedMbps = *bps / 1000000;
            }
        }
        if (auto it = pvid.find(*idx); it != pvid.end()) {
            if (auto vlan = numericValue(it->second)) {
                port.vlan = static_cast<int>(*vlan);
            }
        }
        if (auto it = poeAdmin.find(*idx); it != poeAdmin.end()) {
            port.poeEnabled = numericValue(it->second) == std::optional<int64_t>(1);
        }
        if (auto it = poePower.find(*idx); it != poePower.end()) {
            if (auto milliwatts = numericValue(it->second)) {
                port.poePowerW = std::round(static_cast<double>(*milliwatts) / 10.0) / 100.0;
            }
        }
        ports.push_back(std::move(port));
    }

    std::sort(ports.begin(), ports.end(),
              [](const PortState& a, const PortState& b) { return a.ifIndex < b.ifIndex; });
    return ports;
}

int resolveIfIndex(const std::vector<PortState>& ports, const std::string& portName) {
    auto wanted = text::trim(portName);
    for (const auto& port : ports) {
        if (text::iequals(text::trim(port.port), wanted)) {
            return port.ifIndex;
        }
    }
    if (auto idx = parseInteger(wanted)) {
        return static_cast<int>(*idx);
    }
    throw ProbeError("Port '" + portName + "' not found");
}

} // namespace fleetwatch::core
