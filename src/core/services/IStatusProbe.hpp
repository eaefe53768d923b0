/**
 * @file IStatusProbe.hpp
 * @brief Capability interface shared by all status probe strategies.
 */

#pragma once

#include "core/types/PollTypes.hpp"

#include <vector>

namespace fleetwatch::core {

/**
 * @brief One way of checking a device.
 *
 * poll() reports a transport failure through PollOutcome::probedError where
 * it can; exceptions escaping poll() are treated as errors by the caller.
 * A failed attribute fetch never aborts the probe.
 */
class IStatusProbe {
public:
    virtual ~IStatusProbe() = default;

    virtual PollOutcome poll(const PollTarget& target) = 0;

    /**
     * @brief Port table of a switch; empty for devices without one.
     */
    virtual std::vector<PortState> getPortTable(const PollTarget& target) = 0;

    /**
     * @brief Applies one port configuration change.
     * @throws ConfigurationError if the device or its credentials cannot take writes.
     * @throws ProbeError if the device rejected or did not answer the write.
     */
    virtual void writePortConfig(const PollTarget& target, const PortConfigChange& change) = 0;
};

} // namespace fleetwatch::core
