/**
 * @file Definitions.hpp
 * @brief Template, group and host definitions as loaded from the configuration directory.
 *
 * Every definition carries a SettingsLayer. A host's effective configuration
 * is the fold of the layers of its templates, its groups and its own overrides.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hostkeeper::core {

/**
 * @brief Settings for one monitor, command or connector module.
 *
 * Unset optionals mean "inherit from an earlier layer or use the module default".
 */
struct ModuleConfig {
    std::optional<std::string> version;            ///< Requested module version ("latest" when unset)
    std::optional<bool> enabled;                   ///< Whether the module runs on the host
    std::optional<bool> isCritical;                ///< Critical value marks the host down
    std::map<std::string, std::string> settings;   ///< Module-specific key/value settings

    /**
     * @brief Returns the effective enabled flag (true when unset).
     */
    [[nodiscard]] bool isEnabled() const { return enabled.value_or(true); }

    /**
     * @brief Returns the effective version string.
     */
    [[nodiscard]] std::string effectiveVersion() const { return version.value_or("latest"); }

    /**
     * @brief Returns a setting or the given fallback when the key is absent.
     */
    [[nodiscard]] std::string setting(const std::string& key, const std::string& fallback = {}) const;

    bool operator==(const ModuleConfig& other) const = default;
};

using ModuleConfigMap = std::map<std::string, ModuleConfig>;

/**
 * @brief One layer of configuration in the template/group/host hierarchy.
 */
struct SettingsLayer {
    ModuleConfigMap monitors;              ///< Monitor id to settings
    ModuleConfigMap commands;              ///< Command id to settings
    ModuleConfigMap connectors;            ///< Connector id to settings
    std::vector<std::string> hostSettings; ///< Host flags such as "use_sudo"

    [[nodiscard]] bool empty() const {
        return monitors.empty() && commands.empty() && connectors.empty() && hostSettings.empty();
    }

    bool operator==(const SettingsLayer& other) const = default;
};

/**
 * @brief Named reusable bundle of module settings.
 */
struct TemplateDefinition {
    std::string name;
    SettingsLayer settings;

    bool operator==(const TemplateDefinition& other) const = default;
};

/**
 * @brief Named bundle of module settings plus references to templates.
 *
 * Groups cannot reference other groups.
 */
struct GroupDefinition {
    std::string name;
    std::vector<std::string> templates; ///< Applied before the group's own settings, in order
    SettingsLayer settings;

    bool operator==(const GroupDefinition& other) const = default;
};

/**
 * @brief A managed host as declared by the operator.
 */
struct HostDefinition {
    std::string id;                  ///< Unique host identifier
    std::string address;             ///< IP address (default "0.0.0.0" when only fqdn is used)
    std::string fqdn;                ///< Fully qualified domain name, preferred when set
    std::vector<std::string> groups; ///< Group names, applied in list order
    SettingsLayer overrides;         ///< Host-level settings, always applied last

    /**
     * @brief Validates the definition.
     * @return True if the host has an id and some way to reach it. An address or
     *         fqdn starting with '-' is rejected.
     */
    [[nodiscard]] bool isValid() const;

    /**
     * @brief Returns the address used to connect (fqdn if set, otherwise address).
     */
    [[nodiscard]] std::string connectAddress() const;

    bool operator==(const HostDefinition& other) const = default;
};

/**
 * @brief Everything loaded from the definition files.
 */
struct Definitions {
    std::map<std::string, TemplateDefinition> templates;
    std::map<std::string, GroupDefinition> groups;
    std::map<std::string, HostDefinition> hosts;

    bool operator==(const Definitions& other) const = default;
};

} // namespace hostkeeper::core
