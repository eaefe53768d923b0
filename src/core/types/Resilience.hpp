/**
 * @file Resilience.hpp
 * @brief Hysteresis and circuit-breaker decision for poll outcomes.
 *
 * decide() is pure: it turns the persisted counters of one entity and one raw
 * probe result into the next counters plus an event. Persistence and the
 * circuit-open deadline are handled by the poll resilience tracker.
 */

#pragma once

#include <cstdint>
#include <string>

namespace fleetwatch::core {

/**
 * @brief What a single decision did to the effective state.
 */
enum class ResilienceEvent {
    Online,                     ///< Probed online, no prior failures
    Recovered,                  ///< Probed online after at least one failure
    OfflinePendingConfirmation, ///< Missed probe absorbed by the confirmation window
    OfflineConfirmed,           ///< Effective state is offline
    CircuitOpened               ///< Offline and the circuit-failure threshold was reached
};

std::string resilienceEventToString(ResilienceEvent event);

/**
 * @brief Persisted per-entity counters.
 */
struct ResilienceState {
    bool effectiveOnline{false};
    int failures{0};        ///< Consecutive non-online probes
    int circuitFailures{0}; ///< Consecutive error probes, decremented by clean misses
    int64_t circuitOpenUntil{0}; ///< Unix seconds; probing skipped while in the future

    bool operator==(const ResilienceState& other) const = default;
};

/**
 * @brief Thresholds that shape the state machine. Values below 1 act as 1.
 */
struct ResiliencePolicy {
    int offlineConfirmations{2};
    int circuitFailureThreshold{4};
};

struct ResilienceDecision {
    ResilienceState state;
    ResilienceEvent event{ResilienceEvent::Online};
};

/**
 * @brief Computes the next state for one probe result.
 *
 * @param state Counters before this probe; circuitOpenUntil is carried over untouched.
 * @param probedOnline Raw probe verdict.
 * @param probedError Whether the probe failed with a transport or protocol error.
 * @param policy Confirmation window and circuit threshold.
 */
ResilienceDecision decide(const ResilienceState& state, bool probedOnline, bool probedError,
                          const ResiliencePolicy& policy);

} // namespace fleetwatch::core
