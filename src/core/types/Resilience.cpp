#include "core/types/Resilience.hpp"

#include <algorithm>

namespace fleetwatch::core {

std::string resilienceEventToString(ResilienceEvent event) {
    switch (event) {
    case ResilienceEvent::Online:
        return "online";
    case ResilienceEvent::Recovered:
        return "recovered";
    case ResilienceEvent::OfflinePendingConfirmation:
        return "offline_pending_confirmation";
    case ResilienceEvent::OfflineConfirmed:
        return "offline_confirmed";
    case ResilienceEvent::CircuitOpened:
        return "circuit_opened";
    }
    return "online";
}

ResilienceDecision decide(const ResilienceState& state, bool probedOnline, bool probedError,
                          const ResiliencePolicy& policy) {
    const int confirmations = std::max(policy.offlineConfirmations, 1);
    const int threshold = std::max(policy.circuitFailureThreshold, 1);

    ResilienceDecision decision;
    decision.state = state;

    if (probedOnline) {
        bool hadFailures = state.failures > 0 || state.circuitFailures > 0;
        decision.state.effectiveOnline = true;
        decision.state.failures = 0;
        decision.state.circuitFailures = 0;
        decision.event = hadFailures ? ResilienceEvent::Recovered : ResilienceEvent::Online;
        return decision;
    }

    decision.state.failures = state.failures + 1;
    decision.state.circuitFailures =
        probedError ? state.circuitFailures + 1 : std::max(state.circuitFailures - 1, 0);

    if (state.effectiveOnline && decision.state.failures < confirmations) {
        decision.state.effectiveOnline = true;
        decision.event = ResilienceEvent::OfflinePendingConfirmation;
        return decision;
    }

    decision.state.effectiveOnline = false;
    decision.event = decision.state.circuitFailures >= threshold ? ResilienceEvent::CircuitOpened
                                                                 : ResilienceEvent::OfflineConfirmed;
    return decision;
}

} // namespace fleetwatch::core
