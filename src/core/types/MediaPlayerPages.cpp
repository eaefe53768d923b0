#include "core/types/MediaPlayerPages.hpp"

#include "core/types/TextUtils.hpp"

#include <charconv>
#include <regex>

namespace fleetwatch::core::mediaplayer {

namespace {

const std::string SIZE_PATTERN = R"((\d+[\.,]?\d*\s*[GMKT]B))";

bool isEmptyMarker(const std::string& lowerValue, bool includeNothing) {
    if (lowerValue.empty() || lowerValue == "none" || lowerValue == "\xD0\xBD\xD0\xB5\xD1\x82") {
        return true;
    }
    return includeNothing && (lowerValue == "nothing" || lowerValue == "-");
}

std::optional<std::string> tagText(const std::string& body, const std::string& tag) {
    std::regex pattern("<" + tag + R"(>([\s\S]*?)</)" + tag + ">");
    std::smatch match;
    if (!std::regex_search(body, match, pattern)) {
        return std::nullopt;
    }
    return text::trim(match[1].str());
}

std::optional<int> parseIntTag(const std::optional<std::string>& value) {
    if (!value || value->empty()) {
        return 0;
    }
    int result = 0;
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), result);
    if (ec != std::errc() || ptr != value->data() + value->size()) {
        return std::nullopt;
    }
    return result;
}

} // namespace

std::vector<std::string> extractFileLinks(const std::string& html) {
    static const std::regex link(R"(delete\?file=([^"&']+))", std::regex::icase);
    std::vector<std::string> files;
    for (std::sregex_iterator it(html.begin(), html.end(), link), end; it != end; ++it) {
        auto name = text::trim((*it)[1].str());
        if (!name.empty()) {
            files.push_back(std::move(name));
        }
    }
    return files;
}

std::optional<std::string> parseFreeSpace(const std::string& html) {
    // "Доступно" with either capitalisation, matched as UTF-8 bytes
    static const std::regex available(
        "(?:\xD0\x94|\xD0\xB4)\xD0\xBE\xD1\x81\xD1\x82\xD1\x83\xD0\xBF\xD0\xBD\xD0\xBE\\s+" +
            SIZE_PATTERN + R"(\s*/\s*)" + SIZE_PATTERN,
        std::regex::icase);
    static const std::regex usedTotal(SIZE_PATTERN + R"(\s*/\s*)" + SIZE_PATTERN, std::regex::icase);
    static const std::regex englishAvailable(SIZE_PATTERN + R"(\s+available)", std::regex::icase);

    std::smatch match;
    if (std::regex_search(html, match, available) || std::regex_search(html, match, usedTotal)) {
        return match[1].str() + " / " + match[2].str();
    }
    if (std::regex_search(html, match, englishAvailable)) {
        return match[1].str();
    }
    return std::nullopt;
}

std::optional<StatusDocument> parseStatusXml(const std::string& body) {
    auto state = tagText(body, "state");
    auto file = tagText(body, "file");
    auto position = tagText(body, "position");
    auto duration = tagText(body, "duration");
    if (!state && !file && !position && !duration) {
        return std::nullopt;
    }

    auto positionValue = parseIntTag(position);
    auto durationValue = parseIntTag(duration);
    if (!positionValue || !durationValue) {
        return std::nullopt;
    }

    StatusDocument doc;
    doc.state = text::toLower(state.value_or(""));
    doc.file = file.value_or("");
    doc.position = *positionValue;
    doc.duration = *durationValue;
    return doc;
}

std::optional<std::string> parseNowHtml(const std::string& body) {
    static const std::regex bold(R"(<b>([\s\S]*?)</b>)", std::regex::icase);
    static const std::regex tags(R"(<[^>]+>)");

    std::smatch match;
    if (std::regex_search(body, match, bold)) {
        auto track = text::trim(match[1].str());
        if (!isEmptyMarker(text::toLower(track), true)) {
            return track;
        }
    }

    auto clean = text::trim(std::regex_replace(body, tags, ""));
    if (!clean.empty() && clean.size() < 200 && !isEmptyMarker(text::toLower(clean), false)) {
        return clean;
    }
    return std::nullopt;
}

} // namespace fleetwatch::core::mediaplayer
