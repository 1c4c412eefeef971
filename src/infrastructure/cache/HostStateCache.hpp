#pragma once

#include "core/types/HostState.hpp"
#include "infrastructure/database/HostCacheRepository.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace hostkeeper::infra {

/**
 * @brief Latest known state of every host.
 *
 * The dispatcher writes through recordMonitorData() and recordCommandResult(),
 * everyone else reads copies through snapshot(). Persistence to the
 * host_cache table is optional and only active with a repository and
 * enableCache set.
 */
class HostStateCache {
public:
    /**
     * @param repository Storage for save()/load(), may be null for a memory-only cache.
     */
    explicit HostStateCache(std::shared_ptr<HostCacheRepository> repository = nullptr);

    void setPersistenceEnabled(bool enabled);
    bool persistenceEnabled() const;

    /**
     * @brief Creates the host entry if needed and updates its address info.
     */
    void setHostInfo(const std::string& hostId, const std::string& address, const std::string& fqdn);
    void setCriticalMonitors(const std::string& hostId, std::set<std::string> monitorIds);

    /**
     * @brief Monitors left out of every host's aggregate. Recomputes existing aggregates.
     */
    void setSummaryExcludedMonitors(std::set<std::string> monitorIds);
    void setStatus(const std::string& hostId, core::HostStatus status);
    void setFacts(const std::string& hostId, const core::HostFacts& facts);

    /**
     * @brief Stores a monitor value, replacing the previous one.
     * @return The host's aggregate criticality after the update.
     */
    core::Criticality recordMonitorData(const std::string& hostId, const std::string& monitorId,
                                        const core::MonitorDataPoint& data);

    /**
     * @brief Stores a command result, replacing the previous one for the module.
     */
    void recordCommandResult(const std::string& hostId, const std::string& moduleId,
                             const core::CommandResult& result);

    /**
     * @brief Drops a host from memory and from storage.
     */
    void removeHost(const std::string& hostId);

    std::optional<core::HostState> snapshot(const std::string& hostId) const;
    std::vector<std::string> hostIds() const;

    std::optional<core::MonitorDataPoint> monitorData(const std::string& hostId,
                                                      const std::string& monitorId) const;
    core::HostStatus status(const std::string& hostId) const;
    core::Criticality aggregate(const std::string& hostId) const;

    /**
     * @brief Checks for monitor data or command results younger than maxAge.
     */
    bool hasCachedData(const std::string& hostId,
                       std::chrono::seconds maxAge = std::chrono::seconds::max()) const;

    /**
     * @brief Writes every host to storage in one transaction.
     * @return True if saved (or persistence is disabled), false on error.
     */
    bool save();

    /**
     * @brief Reads stored hosts, replacing entries already in memory.
     *
     * Loaded hosts start Uninitialized and their entries are marked as cached.
     * @return True if loaded (or persistence is disabled), false on error.
     */
    bool load();

private:
    core::HostState& entry(const std::string& hostId);

    std::shared_ptr<HostCacheRepository> repository_;
    bool persistenceEnabled_{true};
    std::set<std::string> summaryExcluded_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, core::HostState> hosts_;
};

} // namespace hostkeeper::infra
