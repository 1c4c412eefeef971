/**
 * @file HostFacts.hpp
 * @brief Platform facts discovered on a host during initialization.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <set>
#include <string>

namespace hostkeeper::core {

/**
 * @brief Operating system and subsystem facts used for module applicability.
 */
struct HostFacts {
    std::string osFamily;        ///< "linux", "freebsd", ... empty until discovered
    std::string distribution;    ///< os-release ID, e.g. "debian"
    std::string version;         ///< os-release VERSION_ID
    std::string architecture;    ///< uname -m
    std::set<std::string> subsystems; ///< Available tooling, e.g. "systemd", "docker"

    /**
     * @brief True once platform information has been collected.
     */
    [[nodiscard]] bool isKnown() const { return !osFamily.empty(); }

    [[nodiscard]] bool isLinux() const { return osFamily == "linux"; }

    [[nodiscard]] bool hasSubsystem(const std::string& name) const {
        return subsystems.contains(name);
    }

    /**
     * @brief True for the given distribution at or above a major version.
     *
     * The major version is the leading number of VERSION_ID ("23.11" is 23).
     */
    [[nodiscard]] bool isDistributionAtLeast(const std::string& name, int majorVersion) const;

    [[nodiscard]] nlohmann::json toJson() const;
    static HostFacts fromJson(const nlohmann::json& j);

    bool operator==(const HostFacts& other) const = default;
};

} // namespace hostkeeper::core
