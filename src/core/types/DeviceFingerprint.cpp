#include "core/types/DeviceFingerprint.hpp"

#include "core/types/TextUtils.hpp"

#include <algorithm>
#include <array>
#include <regex>
#include <string_view>

namespace fleetwatch::core {

namespace {

constexpr std::array<std::string_view, 9> PRINTER_HINTS = {
    "printer", "laserjet", "jetdirect", "mfp", "ricoh", "kyocera", "xerox", "zebra", "toner"};

constexpr std::array<std::string_view, 10> SWITCH_HINTS = {
    "switch",   "catalyst", "cisco ios", "d-link",   "procurve",
    "aruba",    "mikrotik", "routeros",  "ethernet", "vlan"};

constexpr size_t MAIN_PAGE_SCAN_LIMIT = 5000;

template <size_t N>
bool containsAny(const std::string& text, const std::array<std::string_view, N>& words) {
    return std::any_of(words.begin(), words.end(), [&text](std::string_view word) {
        return text.find(word) != std::string::npos;
    });
}

} // namespace

std::string SystemIdentity::searchText() const {
    std::string text;
    for (const auto* field : {&sysDescr, &sysName, &sysObjectId}) {
        if (*field) {
            if (!text.empty()) {
                text += ' ';
            }
            text += **field;
        }
    }
    return text::toLower(text);
}

namespace fingerprint {

bool hasPrinterHints(const std::string& lowerText) {
    return containsAny(lowerText, PRINTER_HINTS);
}

bool hasSwitchHints(const std::string& lowerText) {
    return containsAny(lowerText, SWITCH_HINTS);
}

bool isSwitchIdentity(const SystemIdentity& identity) {
    auto text = identity.searchText();
    return hasSwitchHints(text) && !hasPrinterHints(text);
}

bool isPrinterIdentity(const SystemIdentity& identity) {
    auto text = identity.searchText();
    if (hasPrinterHints(text)) {
        return true;
    }
    return !hasSwitchHints(text);
}

std::optional<std::string> normalizeVendor(const std::optional<std::string>& text) {
    if (!text || text->empty()) {
        return std::nullopt;
    }
    auto low = text::toLower(*text);
    auto has = [&low](std::string_view word) { return low.find(word) != std::string::npos; };

    if (has("cisco") || has("ios") || has("catalyst")) {
        return "cisco";
    }
    if (has("d-link") || has("dlink")) {
        return "dlink";
    }
    if (has("mikrotik")) {
        return "mikrotik";
    }
    if (has("hp") || has("aruba")) {
        return "aruba";
    }
    return "generic";
}

bool mainPageHasPlayerHints(const std::string& body) {
    auto head = body.substr(0, std::min(body.size(), MAIN_PAGE_SCAN_LIMIT));
    if (head.find("status.xml") != std::string::npos || head.find("/now") != std::string::npos ||
        head.find("delete?file=") != std::string::npos) {
        return true;
    }
    return text::toLower(head).find("iconbit") != std::string::npos;
}

bool isPlayerStatusXml(const std::string& body) {
    for (const char* tag : {"<state>", "<file>", "<position>", "<duration>"}) {
        if (body.find(tag) == std::string::npos) {
            return false;
        }
    }
    return true;
}

bool hasNowPlayingMarker(const std::string& body) {
    static const std::regex marker(R"(<b>[\s\S]*?</b>)", std::regex::icase);
    return std::regex_search(body, marker);
}

std::optional<std::string> extractTitle(const std::string& html) {
    static const std::regex title(R"(<title>([^<]+)</title>)", std::regex::icase);
    std::smatch match;
    if (!std::regex_search(html, match, title)) {
        return std::nullopt;
    }
    auto value = text::trim(match[1].str());
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace fingerprint

} // namespace fleetwatch::core
