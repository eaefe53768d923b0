#include "infrastructure/polling/ResilienceTracker.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <thread>

namespace fleetwatch::infra {

namespace {

int64_t fieldOr(const std::map<std::string, std::string>& fields, const std::string& name,
                int64_t fallback) {
    auto it = fields.find(name);
    if (it == fields.end()) {
        return fallback;
    }
    int64_t value = fallback;
    const auto& text = it->second;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return fallback;
    }
    return value;
}

} // namespace

ResilienceTracker::ResilienceTracker(std::shared_ptr<core::IKeyValueStore> store,
                                     PollSettings settings, Clock clock)
    : store_(std::move(store)), settings_(settings), clock_(std::move(clock)) {}

std::string ResilienceTracker::stateKey(core::DeviceKind kind, const std::string& id) {
    return "poll:resilience:" + core::deviceKindToString(kind) + ":" + id;
}

int64_t ResilienceTracker::now() const {
    if (clock_) {
        return clock_();
    }
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

core::ResilienceDecision ResilienceTracker::applyOutcome(core::DeviceKind kind,
                                                         const std::string& id,
                                                         bool previousEffectiveOnline,
                                                         bool probedOnline, bool probedError) {
    const auto key = stateKey(kind, id);
    const int64_t nowTs = now();

    core::ResilienceState state;
    state.effectiveOnline = previousEffectiveOnline;
    bool persist = true;
    try {
        auto fields = store_->hashGetAll(key);
        state.failures = static_cast<int>(fieldOr(fields, "failures", 0));
        state.circuitFailures = static_cast<int>(fieldOr(fields, "circuit_failures", 0));
        state.circuitOpenUntil = fieldOr(fields, "circuit_open_until", 0);
    } catch (const core::StateStoreError& e) {
        spdlog::warn("Resilience state for {} unavailable: {}", key, e.what());
        persist = false;
    }

    core::ResiliencePolicy policy{settings_.offlineConfirmations, settings_.circuitFailureThreshold};
    auto decision = core::decide(state, probedOnline, probedError, policy);

    std::map<std::string, std::string> fields = {
        {"failures", std::to_string(decision.state.failures)},
        {"circuit_failures", std::to_string(decision.state.circuitFailures)},
        {"effective_online", decision.state.effectiveOnline ? "1" : "0"},
        {"updated_at", std::to_string(nowTs)},
    };
    if (decision.event == core::ResilienceEvent::CircuitOpened) {
        const int64_t openUntil =
            nowTs + std::max(settings_.circuitOpenSeconds, kMinCircuitOpenSeconds);
        decision.state.circuitOpenUntil = std::max(openUntil, state.circuitOpenUntil);
        fields["circuit_open_until"] = std::to_string(decision.state.circuitOpenUntil);
        spdlog::warn("Circuit opened for {} until {}", key, decision.state.circuitOpenUntil);
    } else if (probedOnline) {
        decision.state.circuitOpenUntil = 0;
        fields["circuit_open_until"] = "0";
    }

    if (!persist) {
        return decision;
    }
    try {
        store_->hashSet(key, fields);
        store_->expire(key, std::chrono::seconds(
                                std::max(settings_.resilienceStateTtlSeconds, kMinStateTtlSeconds)));
    } catch (const core::StateStoreError& e) {
        spdlog::warn("Cannot persist resilience state for {}: {}", key, e.what());
    }
    return decision;
}

bool ResilienceTracker::isCircuitOpen(core::DeviceKind kind, const std::string& id) {
    const auto key = stateKey(kind, id);
    try {
        auto fields = store_->hashGetAll(key);
        return fieldOr(fields, "circuit_open_until", 0) > now();
    } catch (const core::StateStoreError& e) {
        spdlog::warn("Circuit state for {} unavailable: {}", key, e.what());
        return false;
    }
}

std::chrono::milliseconds ResilienceTracker::jitterDelay() {
    const int maxMs = std::max(settings_.jitterMaxMs, 0);
    if (maxMs == 0) {
        return std::chrono::milliseconds(0);
    }
    std::uniform_int_distribution<int> distribution(0, maxMs);
    std::lock_guard lock(rngMutex_);
    return std::chrono::milliseconds(distribution(rng_));
}

void ResilienceTracker::jitter() {
    auto delay = jitterDelay();
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
}

} // namespace fleetwatch::infra
