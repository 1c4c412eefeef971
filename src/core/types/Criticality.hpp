/**
 * @file Criticality.hpp
 * @brief Severity levels shared by monitor data and command results.
 */

#pragma once

#include <string>

namespace hostkeeper::core {

/**
 * @brief Severity of a monitored value or command outcome.
 *
 * Ordered by severity from NoData to Critical. Ignore sits outside the
 * ordering and never contributes to an aggregate.
 */
enum class Criticality : int {
    NoData = 0,   ///< No value has been received yet
    Normal = 1,   ///< Value is within expected bounds
    Info = 2,     ///< Informational, nothing to act on
    Warning = 3,  ///< Degraded but functional
    Error = 4,    ///< Failed
    Critical = 5, ///< Failed in a way that needs immediate attention
    Ignore = 6    ///< Excluded from aggregation
};

/**
 * @brief Converts a criticality to its canonical name (e.g. "Warning").
 */
[[nodiscard]] std::string criticalityToString(Criticality criticality);

/**
 * @brief Parses a criticality name. Unknown names map to NoData.
 */
[[nodiscard]] Criticality criticalityFromString(const std::string& str);

/**
 * @brief Returns the severity rank of a criticality, or -1 for Ignore.
 */
[[nodiscard]] int severityRank(Criticality criticality);

/**
 * @brief Returns the more severe of two criticalities, skipping Ignore.
 *
 * If both are Ignore the result is NoData.
 */
[[nodiscard]] Criticality mostSevere(Criticality a, Criticality b);

} // namespace hostkeeper::core
