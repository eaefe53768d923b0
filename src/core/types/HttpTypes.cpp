#include "core/types/HttpTypes.hpp"

#include <cctype>
#include <cstdio>

namespace fleetwatch::core {

std::string urlEncode(const std::string& value) {
    std::string encoded;
    encoded.reserve(value.size() * 3);
    char buffer[4];
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded += static_cast<char>(c);
        } else {
            std::snprintf(buffer, sizeof(buffer), "%%%02X", c);
            encoded += buffer;
        }
    }
    return encoded;
}

} // namespace fleetwatch::core
