#include "core/types/PortScanResult.hpp"

#include <algorithm>

namespace fleetwatch::core {

std::string PortProbeResult::stateToString() const {
    switch (state) {
    case ConnectState::Open:
        return "open";
    case ConnectState::Closed:
        return "closed";
    case ConnectState::TimedOut:
        return "timeout";
    }
    return "closed";
}

std::chrono::milliseconds ScanOptions::effectiveTimeout() const {
    return std::max(timeout, std::chrono::milliseconds(100));
}

int ScanOptions::effectiveRetries() const {
    return std::max(retries, 0);
}

std::chrono::milliseconds ScanOptions::backoffAfter(int attempt) {
    return std::chrono::milliseconds(50 * (attempt + 1));
}

bool HostScanResult::hasPort(uint16_t port) const {
    return std::find(openPorts.begin(), openPorts.end(), port) != openPorts.end();
}

} // namespace fleetwatch::core
