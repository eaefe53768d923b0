#pragma once

#include "core/services/IPortScanner.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <semaphore>

namespace fleetwatch::infra {

/**
 * @brief Asynchronous TCP connect scanner.
 *
 * Each (host, port) pair is an async_connect raced against a steady_timer.
 * Retries follow linear backoff. During scanHosts() a counting semaphore
 * sized to ScanOptions::maxConcurrency bounds the pairs in flight across the
 * whole scan; a pair keeps its slot through its retries.
 */
class PortScanner : public core::IPortScanner {
public:
    explicit PortScanner(AsioContext& context);

    std::vector<core::HostScanResult> scanHosts(const std::vector<std::string>& hosts,
                                                const std::vector<uint16_t>& ports,
                                                const core::ScanOptions& options,
                                                BatchCallback onBatch) override;

    std::future<std::vector<uint16_t>> checkPorts(const std::string& address,
                                                  const std::vector<uint16_t>& ports,
                                                  std::chrono::milliseconds timeout) override;

    std::future<bool> isPortOpen(const std::string& address, uint16_t port,
                                 std::chrono::milliseconds timeout) override;

    /**
     * @brief Full attempt chain for one pair, outside any scan's concurrency limit.
     *
     * Makes up to @p retries + 1 attempts with the scan backoff between them
     * and reports how many were made.
     */
    std::future<core::PortProbeResult> connectWithRetries(const std::string& address, uint16_t port,
                                                          std::chrono::milliseconds timeout,
                                                          int retries);

    /**
     * @brief Most pairs the last scanHosts() call had in flight at once.
     */
    size_t peakInFlight() const { return peakInFlight_.load(); }

private:
    using ProbeCallback = std::function<void(const core::PortProbeResult&)>;

    struct ProbeTask {
        core::PortProbeResult result;
        asio::ip::tcp::endpoint endpoint;
        std::chrono::milliseconds timeout{1000};
        int retries{0};
        ProbeCallback onDone;
    };

    /**
     * @brief Starts the attempt chain for one pair; @p onDone runs exactly once.
     */
    void probeAsync(const std::string& address, uint16_t port, std::chrono::milliseconds timeout,
                    int retries, ProbeCallback onDone);

    void attemptConnect(std::shared_ptr<ProbeTask> task);
    void onAttemptFinished(std::shared_ptr<ProbeTask> task, core::ConnectState state);

    std::vector<core::HostScanResult> scanBatch(const std::vector<std::string>& batch,
                                                const std::vector<uint16_t>& ports,
                                                const core::ScanOptions& options,
                                                std::counting_semaphore<>& limiter);

    void trackStarted();

    AsioContext& context_;
    std::atomic<size_t> inFlight_{0};
    std::atomic<size_t> peakInFlight_{0};
};

} // namespace fleetwatch::infra
