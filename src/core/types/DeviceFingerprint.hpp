/**
 * @file DeviceFingerprint.hpp
 * @brief Classification of device identities from SNMP and HTTP responses.
 */

#pragma once

#include "core/types/DeviceKind.hpp"

#include <optional>
#include <string>

namespace fleetwatch::core {

/**
 * @brief SNMP system identity of one host.
 */
struct SystemIdentity {
    std::optional<std::string> sysDescr;
    std::optional<std::string> sysName;
    std::optional<std::string> sysObjectId;

    [[nodiscard]] bool empty() const { return !sysDescr && !sysName && !sysObjectId; }

    /**
     * @brief All present fields joined by spaces, lower-cased.
     */
    [[nodiscard]] std::string searchText() const;
};

namespace fingerprint {

bool hasPrinterHints(const std::string& lowerText);
bool hasSwitchHints(const std::string& lowerText);

/**
 * @brief Accepts a switch only when switch hints are present and printer hints absent.
 */
bool isSwitchIdentity(const SystemIdentity& identity);

/**
 * @brief Printer candidates are accepted unless they look like a switch.
 */
bool isPrinterIdentity(const SystemIdentity& identity);

/**
 * @brief Maps free-form identity text to "cisco", "dlink", "mikrotik", "aruba" or "generic".
 * @return std::nullopt for empty input.
 */
std::optional<std::string> normalizeVendor(const std::optional<std::string>& text);

/**
 * @brief Signature markers on the media player main page (first 5000 characters).
 */
bool mainPageHasPlayerHints(const std::string& body);

/**
 * @brief A status document carrying every one of state, file, position and duration tags.
 */
bool isPlayerStatusXml(const std::string& body);

/**
 * @brief A now-playing page carrying a bold now-playing marker.
 */
bool hasNowPlayingMarker(const std::string& body);

/**
 * @brief Trimmed content of the first <title> element.
 */
std::optional<std::string> extractTitle(const std::string& html);

} // namespace fingerprint

} // namespace fleetwatch::core
