#include "core/types/MonitorDataPoint.hpp"

namespace hostkeeper::core {

namespace {

int64_t toEpochMs(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpochMs(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

} // namespace

MonitorDataPoint MonitorDataPoint::noData(const std::string& description) {
    MonitorDataPoint point;
    point.criticality = Criticality::NoData;
    point.description = description;
    return point;
}

MonitorDataPoint MonitorDataPoint::withValue(std::string value, Criticality criticality) {
    MonitorDataPoint point;
    point.value = std::move(value);
    point.criticality = criticality;
    return point;
}

MonitorDataPoint MonitorDataPoint::labeled(std::string label, std::string value,
                                           Criticality criticality) {
    MonitorDataPoint point;
    point.label = std::move(label);
    point.value = std::move(value);
    point.criticality = criticality;
    return point;
}

Criticality MonitorDataPoint::worstCriticality() const {
    Criticality worst = criticality;
    for (const auto& child : children) {
        worst = mostSevere(worst, child.worstCriticality());
    }
    return worst;
}

nlohmann::json MonitorDataPoint::toJson() const {
    nlohmann::json j;
    j["label"] = label;
    j["value"] = value;
    j["unit"] = unit;
    j["description"] = description;
    j["criticality"] = criticalityToString(criticality);
    j["command_params"] = commandParams;
    j["tags"] = tags;
    j["timestamp"] = toEpochMs(timestamp);

    j["children"] = nlohmann::json::array();
    for (const auto& child : children) {
        j["children"].push_back(child.toJson());
    }
    return j;
}

MonitorDataPoint MonitorDataPoint::fromJson(const nlohmann::json& j) {
    MonitorDataPoint point;
    point.label = j.value("label", "");
    point.value = j.value("value", "");
    point.unit = j.value("unit", "");
    point.description = j.value("description", "");
    point.criticality = criticalityFromString(j.value("criticality", "NoData"));
    point.commandParams = j.value("command_params", std::vector<std::string>{});
    point.tags = j.value("tags", std::vector<std::string>{});
    point.timestamp = fromEpochMs(j.value("timestamp", int64_t{0}));

    if (j.contains("children") && j["children"].is_array()) {
        for (const auto& child : j["children"]) {
            point.children.push_back(fromJson(child));
        }
    }
    return point;
}

} // namespace hostkeeper::core
