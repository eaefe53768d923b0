#pragma once

#include "core/services/IKeyValueStore.hpp"
#include "core/types/DeviceKind.hpp"
#include "core/types/Resilience.hpp"
#include "infrastructure/config/ConfigManager.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>

namespace fleetwatch::infra {

/**
 * @brief Persists hysteresis and circuit-breaker counters per polled entity.
 *
 * State lives in one hash per entity, `poll:resilience:{kind}:{id}`, refreshed
 * with the configured TTL on every update. Store failures never fail a poll:
 * counters read as zero, nothing is written and circuits read as closed.
 */
class ResilienceTracker {
public:
    /// Returns the current time in unix seconds.
    using Clock = std::function<int64_t()>;

    static constexpr int kMinStateTtlSeconds = 300;
    static constexpr int kMinCircuitOpenSeconds = 5;

    ResilienceTracker(std::shared_ptr<core::IKeyValueStore> store, PollSettings settings,
                      Clock clock = {});

    static std::string stateKey(core::DeviceKind kind, const std::string& id);

    /**
     * @brief Feeds one probe result through the state machine and stores the result.
     * @param previousEffectiveOnline Effective state as known before this probe.
     */
    core::ResilienceDecision applyOutcome(core::DeviceKind kind, const std::string& id,
                                          bool previousEffectiveOnline, bool probedOnline,
                                          bool probedError);

    /**
     * @brief True while the circuit-open deadline lies in the future.
     */
    bool isCircuitOpen(core::DeviceKind kind, const std::string& id);

    /**
     * @brief Uniform random delay in [0, jitterMaxMs].
     */
    std::chrono::milliseconds jitterDelay();

    /**
     * @brief Sleeps for jitterDelay().
     */
    void jitter();

    const PollSettings& settings() const { return settings_; }

private:
    int64_t now() const;

    std::shared_ptr<core::IKeyValueStore> store_;
    PollSettings settings_;
    Clock clock_;
    std::mutex rngMutex_;
    std::mt19937 rng_{std::random_device{}()};
};

} // namespace fleetwatch::infra
