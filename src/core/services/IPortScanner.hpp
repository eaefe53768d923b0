/**
 * @file IPortScanner.hpp
 * @brief Interface for TCP connect scanning.
 */

#pragma once

#include "core/types/PortScanResult.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <string>
#include <vector>

namespace fleetwatch::core {

/**
 * @brief TCP connect scanner used by discovery and by the liveness probes.
 */
class IPortScanner {
public:
    /**
     * @brief Called after every completed batch, before the next batch starts.
     */
    using BatchCallback = std::function<void(const BatchProgress&)>;

    virtual ~IPortScanner() = default;

    /**
     * @brief Scans every host for the given ports, batch by batch.
     *
     * Blocks until all batches are done. Must not be called from an I/O thread
     * of the scanner itself.
     *
     * @param hosts Hosts in enumeration order.
     * @param ports Ports to try on each host.
     * @param options Timeout, retries, concurrency ceiling and batch size.
     * @param onBatch Progress callback; may be empty.
     * @return One entry per host that has at least one open port, in host order.
     */
    virtual std::vector<HostScanResult> scanHosts(const std::vector<std::string>& hosts,
                                                  const std::vector<uint16_t>& ports,
                                                  const ScanOptions& options,
                                                  BatchCallback onBatch) = 0;

    /**
     * @brief Tries all ports of one host concurrently, single attempt each.
     * @return Future with the open ports in ascending order.
     */
    virtual std::future<std::vector<uint16_t>> checkPorts(const std::string& address,
                                                          const std::vector<uint16_t>& ports,
                                                          std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Single connect attempt against one port.
     */
    virtual std::future<bool> isPortOpen(const std::string& address, uint16_t port,
                                         std::chrono::milliseconds timeout) = 0;
};

} // namespace fleetwatch::core
