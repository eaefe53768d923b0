#pragma once

#include <string>
#include <vector>

namespace fleetwatch::core::text {

std::string toLower(std::string value);
std::string trim(const std::string& value);

/**
 * @brief Splits on a delimiter and trims each piece; empty pieces are dropped.
 */
std::vector<std::string> splitTrimmed(const std::string& value, char delimiter);

bool iequals(const std::string& a, const std::string& b);
bool startsWith(const std::string& value, const std::string& prefix);

} // namespace fleetwatch::core::text
