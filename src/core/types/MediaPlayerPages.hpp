/**
 * @file MediaPlayerPages.hpp
 * @brief Parsers for the pages served by Iconbit media players.
 *
 * Two firmware generations exist: old firmware serves /status.xml, new
 * firmware serves an HTML /now page and answers 404 on /status.xml.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace fleetwatch::core::mediaplayer {

struct StatusDocument {
    std::string state; ///< Lower-cased, e.g. "playing", "paused", "idle"
    std::string file;
    int position{0};
    int duration{0};
};

/**
 * @brief File names linked as delete?file=... on the main page.
 */
std::vector<std::string> extractFileLinks(const std::string& html);

/**
 * @brief Free space text, "used / total" or "N XB".
 */
std::optional<std::string> parseFreeSpace(const std::string& html);

/**
 * @brief Parses /status.xml; std::nullopt when the document is not a status document.
 */
std::optional<StatusDocument> parseStatusXml(const std::string& body);

/**
 * @brief Track name from the /now page; std::nullopt when nothing plays.
 */
std::optional<std::string> parseNowHtml(const std::string& body);

} // namespace fleetwatch::core::mediaplayer
