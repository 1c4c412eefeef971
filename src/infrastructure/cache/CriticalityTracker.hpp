#pragma once

#include "core/types/Criticality.hpp"
#include "infrastructure/cache/HostStateCache.hpp"
#include "infrastructure/events/EventBus.hpp"

#include <map>
#include <mutex>
#include <string>

namespace hostkeeper::infra {

/**
 * @brief Publishes monitor_state_changed when a host's aggregate criticality changes.
 *
 * The aggregate is read from the cache on every observation, so the last
 * published value always matches what the cache holds once the writers are
 * done. Observing the same aggregate again publishes nothing, so replayed or
 * repeated results never produce duplicate change events.
 */
class CriticalityTracker {
public:
    CriticalityTracker(const HostStateCache& cache, EventBus& eventBus);

    /**
     * @brief Compares the host's current aggregate against the last one published.
     *
     * Called after every write to the host's monitor data. The comparison and
     * the publication happen under one lock, so change events leave in the
     * order the changes were decided.
     *
     * @param hostId Host whose monitor data was written.
     * @param monitorId Monitor reported as the cause of a change.
     * @return True if a change was observed and published.
     */
    bool observe(const std::string& hostId, const std::string& monitorId);

    core::Criticality lastAggregate(const std::string& hostId) const;

    /**
     * @brief Forgets a host so its next observation starts from NoData.
     */
    void reset(const std::string& hostId);

private:
    const HostStateCache& cache_;
    EventBus& eventBus_;
    mutable std::mutex mutex_;
    std::map<std::string, core::Criticality> aggregates_;
};

} // namespace hostkeeper::infra
