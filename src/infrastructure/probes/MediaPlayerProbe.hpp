#pragma once

#include "infrastructure/probes/IconbitClient.hpp"
#include "infrastructure/probes/TcpLivenessProbe.hpp"

#include <memory>

namespace fleetwatch::infra {

/**
 * @brief Iconbit media players.
 *
 * Bulk polls only check the control port; status() reads the player pages.
 */
class MediaPlayerProbe : public TcpLivenessProbe {
public:
    static constexpr std::chrono::milliseconds kLivenessTimeout{2500};

    MediaPlayerProbe(std::shared_ptr<core::IPortScanner> scanner,
                     std::shared_ptr<IconbitClient> client);

    /**
     * @brief Liveness plus playback state and file list.
     */
    core::PollOutcome status(const core::PollTarget& target);

    IconbitClient& client() { return *client_; }

private:
    std::shared_ptr<IconbitClient> client_;
};

} // namespace fleetwatch::infra
