/**
 * @file HostState.hpp
 * @brief Latest known state of a host as kept by the state cache.
 */

#pragma once

#include "core/types/CommandResult.hpp"
#include "core/types/Criticality.hpp"
#include "core/types/HostFacts.hpp"
#include "core/types/MonitorDataPoint.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <set>
#include <string>

namespace hostkeeper::core {

/**
 * @brief Initialization and reachability status of a host.
 */
enum class HostStatus : int {
    Uninitialized = 0,        ///< Nothing known yet
    InitializingLive = 1,     ///< First live refresh in progress, no cached data shown
    InitializedFromCache = 2, ///< Showing cached data while the live refresh runs
    Initialized = 3,          ///< Live refresh completed
    Unreachable = 4           ///< Connector failed after retry
};

[[nodiscard]] std::string hostStatusToString(HostStatus status);
[[nodiscard]] HostStatus hostStatusFromString(const std::string& str);

/**
 * @brief Snapshot of everything the engine knows about one host.
 */
struct HostState {
    std::string hostId;
    std::string address;
    std::string fqdn;
    HostFacts facts;
    HostStatus status{HostStatus::Uninitialized};
    std::map<std::string, MonitorDataPoint> monitorData;  ///< Last value per monitor id
    std::map<std::string, CommandResult> commandResults;  ///< Last result per module id
    std::set<std::string> criticalMonitors;               ///< Monitors configured is_critical
    std::set<std::string> summaryExcluded;                ///< Monitors left out of the aggregate
    Criticality aggregate{Criticality::NoData};
    std::chrono::system_clock::time_point updatedAt{};

    /**
     * @brief Maximum severity over all non-Ignore monitor entries, NoData when none.
     *
     * Monitors in summaryExcluded are skipped.
     */
    [[nodiscard]] Criticality computeAggregate() const;

    /**
     * @brief Id of the monitor that determines the aggregate, empty when there is none.
     */
    [[nodiscard]] std::string mostSevereMonitor() const;

    /**
     * @brief True when a monitor configured as critical reports Critical.
     */
    [[nodiscard]] bool isDown() const;

    [[nodiscard]] bool hasData() const { return !monitorData.empty() || !commandResults.empty(); }

    /**
     * @brief Serializes the state for the persisted cache.
     */
    [[nodiscard]] nlohmann::json toJson() const;
    static HostState fromJson(const nlohmann::json& j);
};

} // namespace hostkeeper::core
