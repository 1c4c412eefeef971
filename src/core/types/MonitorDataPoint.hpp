/**
 * @file MonitorDataPoint.hpp
 * @brief Value produced by a monitor refresh, optionally a tree of child values.
 */

#pragma once

#include "core/types/Criticality.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace hostkeeper::core {

/**
 * @brief One monitored value.
 *
 * Multivalue monitors (services, containers, volumes) return a root point whose
 * children carry their own label, criticality and drill-down command params.
 */
struct MonitorDataPoint {
    std::string label;        ///< Child label, e.g. a service name
    std::string value;        ///< Display value
    std::string unit;         ///< Unit of the value, may be empty
    std::string description;
    Criticality criticality{Criticality::Normal};
    std::vector<std::string> commandParams; ///< Parameters for child commands
    std::vector<std::string> tags;          ///< Tags child commands can depend on
    std::vector<MonitorDataPoint> children;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
    bool fromCache{false};

    /**
     * @brief Data point meaning "nothing received yet" or "refresh failed".
     */
    static MonitorDataPoint noData(const std::string& description = {});

    static MonitorDataPoint withValue(std::string value, Criticality criticality = Criticality::Normal);

    static MonitorDataPoint labeled(std::string label, std::string value,
                                    Criticality criticality = Criticality::Normal);

    [[nodiscard]] bool isMultivalue() const { return !children.empty(); }

    /**
     * @brief Most severe criticality among this point and all descendants.
     */
    [[nodiscard]] Criticality worstCriticality() const;

    [[nodiscard]] nlohmann::json toJson() const;
    static MonitorDataPoint fromJson(const nlohmann::json& j);

    bool operator==(const MonitorDataPoint& other) const = default;
};

} // namespace hostkeeper::core
