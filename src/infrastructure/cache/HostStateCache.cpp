#include "infrastructure/cache/HostStateCache.hpp"

#include <spdlog/spdlog.h>

#include <mutex>

namespace hostkeeper::infra {

HostStateCache::HostStateCache(std::shared_ptr<HostCacheRepository> repository)
    : repository_(std::move(repository)) {}

void HostStateCache::setPersistenceEnabled(bool enabled) {
    std::unique_lock lock(mutex_);
    persistenceEnabled_ = enabled;
}

bool HostStateCache::persistenceEnabled() const {
    std::shared_lock lock(mutex_);
    return persistenceEnabled_ && repository_ != nullptr;
}

core::HostState& HostStateCache::entry(const std::string& hostId) {
    auto [it, inserted] = hosts_.try_emplace(hostId);
    if (inserted) {
        it->second.hostId = hostId;
        it->second.summaryExcluded = summaryExcluded_;
    }
    return it->second;
}

void HostStateCache::setHostInfo(const std::string& hostId, const std::string& address,
                                 const std::string& fqdn) {
    std::unique_lock lock(mutex_);
    auto& state = entry(hostId);
    state.address = address;
    state.fqdn = fqdn;
}

void HostStateCache::setCriticalMonitors(const std::string& hostId, std::set<std::string> monitorIds) {
    std::unique_lock lock(mutex_);
    entry(hostId).criticalMonitors = std::move(monitorIds);
}

void HostStateCache::setSummaryExcludedMonitors(std::set<std::string> monitorIds) {
    std::unique_lock lock(mutex_);
    summaryExcluded_ = std::move(monitorIds);
    for (auto& [hostId, state] : hosts_) {
        state.summaryExcluded = summaryExcluded_;
        state.aggregate = state.computeAggregate();
    }
}

void HostStateCache::setStatus(const std::string& hostId, core::HostStatus status) {
    std::unique_lock lock(mutex_);
    auto& state = entry(hostId);
    if (state.status != status) {
        spdlog::debug("[{}] Status {} -> {}", hostId, core::hostStatusToString(state.status),
                      core::hostStatusToString(status));
        state.status = status;
    }
}

void HostStateCache::setFacts(const std::string& hostId, const core::HostFacts& facts) {
    std::unique_lock lock(mutex_);
    entry(hostId).facts = facts;
}

core::Criticality HostStateCache::recordMonitorData(const std::string& hostId,
                                                    const std::string& monitorId,
                                                    const core::MonitorDataPoint& data) {
    std::unique_lock lock(mutex_);
    auto& state = entry(hostId);
    state.monitorData.insert_or_assign(monitorId, data);
    state.aggregate = state.computeAggregate();
    state.updatedAt = std::chrono::system_clock::now();
    return state.aggregate;
}

void HostStateCache::recordCommandResult(const std::string& hostId, const std::string& moduleId,
                                         const core::CommandResult& result) {
    std::unique_lock lock(mutex_);
    auto& state = entry(hostId);
    state.commandResults.insert_or_assign(moduleId, result);
    state.updatedAt = std::chrono::system_clock::now();
}

void HostStateCache::removeHost(const std::string& hostId) {
    {
        std::unique_lock lock(mutex_);
        hosts_.erase(hostId);
    }

    if (!persistenceEnabled()) {
        return;
    }
    try {
        repository_->remove(hostId);
    } catch (const std::exception& e) {
        spdlog::error("[{}] Failed to remove cache entry: {}", hostId, e.what());
    }
}

std::optional<core::HostState> HostStateCache::snapshot(const std::string& hostId) const {
    std::shared_lock lock(mutex_);
    auto it = hosts_.find(hostId);
    if (it == hosts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> HostStateCache::hostIds() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(hosts_.size());
    for (const auto& [hostId, state] : hosts_) {
        ids.push_back(hostId);
    }
    return ids;
}

std::optional<core::MonitorDataPoint> HostStateCache::monitorData(const std::string& hostId,
                                                                  const std::string& monitorId) const {
    std::shared_lock lock(mutex_);
    auto it = hosts_.find(hostId);
    if (it == hosts_.end()) {
        return std::nullopt;
    }
    auto dataIt = it->second.monitorData.find(monitorId);
    if (dataIt == it->second.monitorData.end()) {
        return std::nullopt;
    }
    return dataIt->second;
}

core::HostStatus HostStateCache::status(const std::string& hostId) const {
    std::shared_lock lock(mutex_);
    auto it = hosts_.find(hostId);
    return it == hosts_.end() ? core::HostStatus::Uninitialized : it->second.status;
}

core::Criticality HostStateCache::aggregate(const std::string& hostId) const {
    std::shared_lock lock(mutex_);
    auto it = hosts_.find(hostId);
    return it == hosts_.end() ? core::Criticality::NoData : it->second.aggregate;
}

bool HostStateCache::hasCachedData(const std::string& hostId, std::chrono::seconds maxAge) const {
    std::shared_lock lock(mutex_);
    auto it = hosts_.find(hostId);
    if (it == hosts_.end()) {
        return false;
    }

    auto now = std::chrono::system_clock::now();
    auto isFresh = [&](std::chrono::system_clock::time_point timestamp) {
        return maxAge == std::chrono::seconds::max() || now - timestamp <= maxAge;
    };

    for (const auto& [monitorId, point] : it->second.monitorData) {
        if (isFresh(point.timestamp)) {
            return true;
        }
    }
    for (const auto& [moduleId, result] : it->second.commandResults) {
        if (isFresh(result.timestamp())) {
            return true;
        }
    }
    return false;
}

bool HostStateCache::save() {
    if (!persistenceEnabled()) {
        return true;
    }

    std::vector<core::HostState> states;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [hostId, state] : hosts_) {
            if (state.hasData()) {
                states.push_back(state);
            }
        }
    }

    try {
        repository_->upsertAll(states);
        spdlog::info("Saved state cache for {} hosts", states.size());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save state cache: {}", e.what());
        return false;
    }
}

bool HostStateCache::load() {
    if (!persistenceEnabled()) {
        return true;
    }

    std::vector<core::HostState> states;
    try {
        states = repository_->findAll();
    } catch (const std::exception& e) {
        spdlog::error("Failed to load state cache: {}", e.what());
        return false;
    }

    std::unique_lock lock(mutex_);
    for (auto& state : states) {
        state.status = core::HostStatus::Uninitialized;
        auto& current = entry(state.hostId);
        state.criticalMonitors = current.criticalMonitors;
        state.summaryExcluded = summaryExcluded_;
        state.aggregate = state.computeAggregate();
        current = std::move(state);
    }
    spdlog::info("Loaded state cache for {} hosts", states.size());
    return true;
}

} // namespace hostkeeper::infra
