#include "infrastructure/polling/PollCycleRunner.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <future>
#include <map>
#include <optional>

namespace fleetwatch::infra {

nlohmann::json PollResult::toJson() const {
    nlohmann::json j = outcome.toJson();
    j["id"] = id;
    j["address"] = address;
    j["probe"] = probeVariantToString(probe);
    j["effective_online"] = effectiveOnline;
    j["event"] = core::resilienceEventToString(event);
    return j;
}

nlohmann::json DeviceMove::toJson() const {
    return {{"id", id}, {"old_ip", oldIp}, {"new_ip", newIp}};
}

nlohmann::json PollSummary::toJson() const {
    auto movedArray = nlohmann::json::array();
    for (const auto& move : moved) {
        movedArray.push_back(move.toJson());
    }
    auto resultArray = nlohmann::json::array();
    for (const auto& result : results) {
        resultArray.push_back(result.toJson());
    }
    return {{"kind", core::deviceKindToString(kind)},
            {"total", total},
            {"online", online},
            {"offline", offline},
            {"skipped", skipped},
            {"errors", errors},
            {"moved", movedArray},
            {"results", resultArray}};
}

PollCycleRunner::PollCycleRunner(std::shared_ptr<ProbeSet> probes,
                                 std::shared_ptr<ResilienceTracker> resilience,
                                 std::shared_ptr<core::INeighborTableSource> neighbors,
                                 size_t maxWorkers)
    : probes_(std::move(probes)),
      resilience_(std::move(resilience)),
      neighbors_(std::move(neighbors)),
      pool_(maxWorkers) {}

core::PollOutcome PollCycleRunner::probeOnce(const core::PollTarget& target) {
    try {
        return probes_->probeFor(target).poll(target);
    } catch (const std::exception& e) {
        spdlog::warn("Poll of {} ({}) failed: {}", target.id, target.address, e.what());
        return core::PollOutcome::error(e.what());
    }
}

PollSummary PollCycleRunner::runCycle(core::DeviceKind kind,
                                      const std::vector<core::PollTarget>& targets) {
    const auto started = std::chrono::steady_clock::now();

    PollSummary summary;
    summary.kind = kind;
    summary.total = targets.size();

    std::vector<const core::PollTarget*> pending;
    std::vector<std::future<core::PollOutcome>> futures;
    for (const auto& target : targets) {
        if (resilience_->isCircuitOpen(kind, target.id)) {
            spdlog::debug("Circuit open for {} {}, skipping", core::deviceKindToString(kind), target.id);
            ++summary.skipped;
            continue;
        }
        pending.push_back(&target);
        futures.push_back(pool_.submit([this, target]() {
            resilience_->jitter();
            return probeOnce(target);
        }));
    }

    for (size_t i = 0; i < pending.size(); ++i) {
        const auto& target = *pending[i];

        core::PollOutcome outcome;
        try {
            outcome = futures[i].get();
        } catch (const std::exception& e) {
            outcome = core::PollOutcome::error(e.what());
        }

        auto decision = resilience_->applyOutcome(kind, target.id, target.lastOnline,
                                                  outcome.probedOnline, outcome.probedError);

        PollResult result;
        result.id = target.id;
        result.address = target.address;
        result.probe = ProbeSet::resolve(target);
        result.effectiveOnline = decision.state.effectiveOnline;
        result.event = decision.event;
        result.outcome = std::move(outcome);

        if (result.outcome.probedError) {
            ++summary.errors;
        }
        summary.results.push_back(std::move(result));
    }

    relocateOffline(targets, summary);

    for (const auto& result : summary.results) {
        if (result.effectiveOnline) {
            ++summary.online;
        } else {
            ++summary.offline;
        }
    }

    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started);
    spdlog::info("Poll cycle '{}': {} online, {} offline, {} skipped, {} errors, {} moved in {:.2f}s",
                 core::deviceKindToString(kind), summary.online, summary.offline, summary.skipped,
                 summary.errors, summary.moved.size(), elapsed.count());
    return summary;
}

void PollCycleRunner::relocateOffline(const std::vector<core::PollTarget>& targets,
                                      PollSummary& summary) {
    std::map<std::string, const core::PollTarget*> byId;
    std::map<std::string, std::string> idByAddress;
    for (const auto& target : targets) {
        byId[target.id] = &target;
        idByAddress[target.address] = target.id;
    }

    std::optional<core::NeighborTable> table;
    for (auto& result : summary.results) {
        auto it = byId.find(result.id);
        if (result.effectiveOnline || it == byId.end() || !it->second->macAddress) {
            continue;
        }
        const auto* target = it->second;
        if (target->macAddress->empty()) {
            continue;
        }
        if (!table) {
            table = neighbors_->read();
        }

        auto newIp = table->ipFor(*target->macAddress);
        if (!newIp || *newIp == target->address) {
            continue;
        }
        if (auto owner = idByAddress.find(*newIp);
            owner != idByAddress.end() && owner->second != target->id) {
            spdlog::debug("{} seen at {}, but that address belongs to {}", target->id, *newIp,
                          owner->second);
            continue;
        }

        auto moved = *target;
        moved.address = *newIp;
        auto outcome = probeOnce(moved);
        if (!outcome.probedOnline) {
            continue;
        }

        spdlog::info("Relocated {}: {} -> {} (MAC {})", target->id, target->address, *newIp,
                     *target->macAddress);
        summary.moved.push_back(DeviceMove{target->id, target->address, *newIp});

        // The answer at the new address resets the counters of this entity.
        auto decision = resilience_->applyOutcome(summary.kind, target->id,
                                                  result.effectiveOnline, true, false);
        result.address = *newIp;
        result.outcome = std::move(outcome);
        result.effectiveOnline = decision.state.effectiveOnline;
        result.event = decision.event;
    }
}

} // namespace fleetwatch::infra
