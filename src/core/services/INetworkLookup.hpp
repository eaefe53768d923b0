#pragma once

#include "core/types/NeighborTable.hpp"

#include <optional>
#include <string>

namespace fleetwatch::core {

/**
 * @brief Source of the operating system neighbor cache.
 */
class INeighborTableSource {
public:
    virtual ~INeighborTableSource() = default;

    /**
     * @brief Best-effort snapshot; empty when the table cannot be read.
     */
    virtual NeighborTable read() = 0;
};

/**
 * @brief Host name lookups for generic devices.
 */
class INameResolver {
public:
    virtual ~INameResolver() = default;

    virtual std::optional<std::string> reverseLookup(const std::string& address) = 0;

    /**
     * @brief NetBIOS node status query for the workstation name.
     */
    virtual std::optional<std::string> netbiosName(const std::string& address) = 0;
};

} // namespace fleetwatch::core
