#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace fleetwatch::core {

/**
 * @brief Final state of a TCP connect probe after all attempts.
 */
enum class ConnectState {
    Open,     ///< Connection accepted
    Closed,   ///< Connection refused or unreachable
    TimedOut  ///< No answer within the attempt timeout
};

/**
 * @brief Outcome of probing one (address, port) pair.
 */
struct PortProbeResult {
    std::string address;
    uint16_t port{0};
    ConnectState state{ConnectState::Closed};
    int attempts{0};   ///< Connect attempts actually made

    [[nodiscard]] bool isOpen() const { return state == ConnectState::Open; }

    std::string stateToString() const;
};

/**
 * @brief Tuning for a TCP connect scan.
 */
struct ScanOptions {
    std::chrono::milliseconds timeout{1000}; ///< Per-attempt timeout
    int retries{1};                          ///< Extra attempts after the first
    int maxConcurrency{256};                 ///< Connect attempts in flight across the whole scan
    size_t batchSize{64};                    ///< Hosts per batch

    /**
     * @brief Timeout actually applied, never below 100 ms.
     */
    [[nodiscard]] std::chrono::milliseconds effectiveTimeout() const;

    /**
     * @brief Retry count actually applied, never negative.
     */
    [[nodiscard]] int effectiveRetries() const;

    /**
     * @brief Delay before the retry that follows attempt @p attempt (0-based).
     *
     * Linear: 50 ms * (attempt + 1).
     */
    [[nodiscard]] static std::chrono::milliseconds backoffAfter(int attempt);
};

/**
 * @brief Open ports found on one host, in the order they were requested.
 */
struct HostScanResult {
    std::string address;
    std::vector<uint16_t> openPorts;

    [[nodiscard]] bool found() const { return !openPorts.empty(); }

    [[nodiscard]] bool hasPort(uint16_t port) const;
};

/**
 * @brief Counters published after each scanned batch.
 */
struct BatchProgress {
    size_t scanned{0};
    size_t total{0};
    size_t found{0};
};

} // namespace fleetwatch::core
