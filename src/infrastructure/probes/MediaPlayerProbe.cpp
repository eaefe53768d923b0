#include "infrastructure/probes/MediaPlayerProbe.hpp"

namespace fleetwatch::infra {

MediaPlayerProbe::MediaPlayerProbe(std::shared_ptr<core::IPortScanner> scanner,
                                   std::shared_ptr<IconbitClient> client)
    : TcpLivenessProbe(std::move(scanner), IconbitClient::kPort, kLivenessTimeout),
      client_(std::move(client)) {}

core::PollOutcome MediaPlayerProbe::status(const core::PollTarget& target) {
    auto outcome = poll(target);
    if (outcome.probedOnline) {
        outcome.mediaPlayer = client_->status(target.address);
    }
    return outcome;
}

} // namespace fleetwatch::infra
