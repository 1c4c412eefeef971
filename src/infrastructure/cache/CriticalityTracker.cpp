#include "infrastructure/cache/CriticalityTracker.hpp"

#include <spdlog/spdlog.h>

namespace hostkeeper::infra {

CriticalityTracker::CriticalityTracker(const HostStateCache& cache, EventBus& eventBus)
    : cache_(cache), eventBus_(eventBus) {}

bool CriticalityTracker::observe(const std::string& hostId, const std::string& monitorId) {
    std::lock_guard lock(mutex_);
    const auto aggregate = cache_.aggregate(hostId);

    auto it = aggregates_.find(hostId);
    const auto previous = it == aggregates_.end() ? core::Criticality::NoData : it->second;
    if (previous == aggregate) {
        return false;
    }
    aggregates_[hostId] = aggregate;

    spdlog::info("[{}] Criticality {} -> {} (monitor {})", hostId, core::criticalityToString(previous),
                 core::criticalityToString(aggregate), monitorId);

    auto event = core::EngineEvent::forHost(core::EventType::MonitorStateChanged, hostId);
    event.moduleId = monitorId;
    event.criticality = aggregate;
    eventBus_.publish(std::move(event));
    return true;
}

core::Criticality CriticalityTracker::lastAggregate(const std::string& hostId) const {
    std::lock_guard lock(mutex_);
    auto it = aggregates_.find(hostId);
    return it == aggregates_.end() ? core::Criticality::NoData : it->second;
}

void CriticalityTracker::reset(const std::string& hostId) {
    std::lock_guard lock(mutex_);
    aggregates_.erase(hostId);
}

} // namespace hostkeeper::infra
