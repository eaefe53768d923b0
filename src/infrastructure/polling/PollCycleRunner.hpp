#pragma once

#include "core/services/INetworkLookup.hpp"
#include "core/types/PollTypes.hpp"
#include "core/types/Resilience.hpp"
#include "infrastructure/polling/ResilienceTracker.hpp"
#include "infrastructure/polling/WorkerPool.hpp"
#include "infrastructure/probes/ProbeSet.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace fleetwatch::infra {

/**
 * @brief Outcome of one target within a cycle.
 */
struct PollResult {
    std::string id;
    std::string address;
    ProbeVariant probe{ProbeVariant::Generic};
    core::PollOutcome outcome;
    bool effectiveOnline{false};
    core::ResilienceEvent event{core::ResilienceEvent::Online};

    nlohmann::json toJson() const;
};

/**
 * @brief A target found at a new address through its MAC.
 */
struct DeviceMove {
    std::string id;
    std::string oldIp;
    std::string newIp;

    nlohmann::json toJson() const;
};

struct PollSummary {
    core::DeviceKind kind{core::DeviceKind::Generic};
    size_t total{0};
    size_t online{0};
    size_t offline{0};
    size_t skipped{0};
    size_t errors{0};
    std::vector<DeviceMove> moved;
    std::vector<PollResult> results;

    nlohmann::json toJson() const;
};

/**
 * @brief Polls a batch of targets of one kind through the resilience layer.
 *
 * Targets with an open circuit are skipped. The rest are probed on the
 * worker pool, each after a random jitter delay. Targets that end up
 * offline and carry a MAC are looked up once in the neighbor table and,
 * if found elsewhere and answering there, reported as moved.
 */
class PollCycleRunner {
public:
    PollCycleRunner(std::shared_ptr<ProbeSet> probes,
                    std::shared_ptr<ResilienceTracker> resilience,
                    std::shared_ptr<core::INeighborTableSource> neighbors,
                    size_t maxWorkers);

    PollSummary runCycle(core::DeviceKind kind, const std::vector<core::PollTarget>& targets);

private:
    core::PollOutcome probeOnce(const core::PollTarget& target);
    void relocateOffline(const std::vector<core::PollTarget>& targets, PollSummary& summary);

    std::shared_ptr<ProbeSet> probes_;
    std::shared_ptr<ResilienceTracker> resilience_;
    std::shared_ptr<core::INeighborTableSource> neighbors_;
    WorkerPool pool_;
};

} // namespace fleetwatch::infra
