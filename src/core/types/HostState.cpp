#include "core/types/HostState.hpp"

namespace hostkeeper::core {

std::string hostStatusToString(HostStatus status) {
    switch (status) {
    case HostStatus::Uninitialized:
        return "Uninitialized";
    case HostStatus::InitializingLive:
        return "InitializingLive";
    case HostStatus::InitializedFromCache:
        return "InitializedFromCache";
    case HostStatus::Initialized:
        return "Initialized";
    case HostStatus::Unreachable:
        return "Unreachable";
    }
    return "Uninitialized";
}

HostStatus hostStatusFromString(const std::string& str) {
    if (str == "InitializingLive")
        return HostStatus::InitializingLive;
    if (str == "InitializedFromCache")
        return HostStatus::InitializedFromCache;
    if (str == "Initialized")
        return HostStatus::Initialized;
    if (str == "Unreachable")
        return HostStatus::Unreachable;
    return HostStatus::Uninitialized;
}

Criticality HostState::computeAggregate() const {
    Criticality result = Criticality::NoData;
    for (const auto& [monitorId, point] : monitorData) {
        if (!summaryExcluded.contains(monitorId)) {
            result = mostSevere(result, point.worstCriticality());
        }
    }
    return result;
}

std::string HostState::mostSevereMonitor() const {
    std::string result;
    int rank = -1;
    for (const auto& [monitorId, point] : monitorData) {
        if (summaryExcluded.contains(monitorId)) {
            continue;
        }
        int current = severityRank(point.worstCriticality());
        if (current > rank) {
            rank = current;
            result = monitorId;
        }
    }
    return result;
}

bool HostState::isDown() const {
    for (const auto& monitorId : criticalMonitors) {
        auto it = monitorData.find(monitorId);
        if (it != monitorData.end() && it->second.worstCriticality() == Criticality::Critical) {
            return true;
        }
    }
    return false;
}

nlohmann::json HostState::toJson() const {
    nlohmann::json j;
    j["host_id"] = hostId;
    j["address"] = address;
    j["fqdn"] = fqdn;
    j["facts"] = facts.toJson();
    j["status"] = hostStatusToString(status);
    j["updated_at"] =
        std::chrono::duration_cast<std::chrono::milliseconds>(updatedAt.time_since_epoch()).count();

    j["monitors"] = nlohmann::json::object();
    for (const auto& [monitorId, point] : monitorData) {
        j["monitors"][monitorId] = point.toJson();
    }

    j["commands"] = nlohmann::json::object();
    for (const auto& [commandId, result] : commandResults) {
        j["commands"][commandId] = result.toJson();
    }
    return j;
}

HostState HostState::fromJson(const nlohmann::json& j) {
    HostState state;
    state.hostId = j.value("host_id", "");
    state.address = j.value("address", "");
    state.fqdn = j.value("fqdn", "");
    if (j.contains("facts")) {
        state.facts = HostFacts::fromJson(j["facts"]);
    }
    state.status = hostStatusFromString(j.value("status", "Uninitialized"));
    state.updatedAt = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(j.value("updated_at", int64_t{0})));

    if (j.contains("monitors") && j["monitors"].is_object()) {
        for (const auto& [monitorId, point] : j["monitors"].items()) {
            auto restored = MonitorDataPoint::fromJson(point);
            restored.fromCache = true;
            state.monitorData.emplace(monitorId, std::move(restored));
        }
    }

    if (j.contains("commands") && j["commands"].is_object()) {
        for (const auto& [commandId, result] : j["commands"].items()) {
            state.commandResults.emplace(commandId, CommandResult::fromJson(result).markedFromCache());
        }
    }

    state.aggregate = state.computeAggregate();
    return state;
}

} // namespace hostkeeper::core
