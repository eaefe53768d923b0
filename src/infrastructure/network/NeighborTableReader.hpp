#pragma once

#include "core/services/INetworkLookup.hpp"

#include <filesystem>
#include <string>

namespace fleetwatch::infra {

/**
 * @brief Reads the kernel neighbor cache, falling back to `ip neigh`.
 */
class NeighborTableReader : public core::INeighborTableSource {
public:
    explicit NeighborTableReader(std::filesystem::path arpPath = "/proc/net/arp",
                                 std::string fallbackCommand = "ip neigh");

    core::NeighborTable read() override;

private:
    std::filesystem::path arpPath_;
    std::string fallbackCommand_;
};

} // namespace fleetwatch::infra
