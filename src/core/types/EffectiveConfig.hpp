/**
 * @file EffectiveConfig.hpp
 * @brief Resolved per-host configuration and the transport parameters derived from it.
 */

#pragma once

#include "core/types/Definitions.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace hostkeeper::core {

/**
 * @brief Host configuration after folding templates, groups and host overrides.
 */
struct EffectiveConfig {
    std::string hostId;
    std::string address;
    std::string fqdn;
    std::vector<std::string> groups;
    SettingsLayer settings;

    /**
     * @brief Checks whether a host flag (e.g. "use_sudo") is set.
     */
    [[nodiscard]] bool hasHostSetting(const std::string& flag) const;

    /**
     * @brief Returns the monitor settings, or nullptr when the monitor is not configured.
     */
    [[nodiscard]] const ModuleConfig* monitor(const std::string& id) const;

    /**
     * @brief Returns the command settings, or nullptr when the command is not configured.
     */
    [[nodiscard]] const ModuleConfig* command(const std::string& id) const;

    /**
     * @brief Returns the connector settings, or nullptr when the connector is not configured.
     */
    [[nodiscard]] const ModuleConfig* connector(const std::string& id) const;

    /**
     * @brief Address used for connecting (fqdn preferred).
     */
    [[nodiscard]] std::string connectAddress() const { return fqdn.empty() ? address : fqdn; }

    bool operator==(const EffectiveConfig& other) const = default;
};

/**
 * @brief Transport parameters for reaching one host through one connector.
 */
struct ConnectorConfig {
    std::string connectorId{"ssh"};
    std::string hostId;
    std::string address;
    uint16_t port{22};
    std::string username;
    std::string identityFile;   ///< Credentials reference: private key path, empty for agent
    int connectTimeoutSeconds{10};
    std::map<std::string, std::string> options; ///< Remaining connector settings

    /**
     * @brief Derives the connector parameters from a host's effective configuration.
     *
     * Missing settings fall back to the defaults above.
     */
    static ConnectorConfig fromEffective(const EffectiveConfig& config,
                                         const std::string& connectorId = "ssh");

    bool operator==(const ConnectorConfig& other) const = default;
};

} // namespace hostkeeper::core
