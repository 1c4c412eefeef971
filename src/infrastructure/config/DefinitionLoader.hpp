#pragma once

#include "core/types/Definitions.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>

namespace hostkeeper::infra {

/**
 * @brief Reads template, group and host definitions from the configuration directory.
 *
 * Files: templates.json ({"templates": {name: layer}}), groups.json
 * ({"groups": {name: {"templates": [...], ...layer}}}) and hosts.json
 * ({"hosts": {id: {"address", "fqdn", "groups", ...layer}}}). A layer has the
 * optional keys "monitors", "commands", "connectors" and "host_settings".
 * A missing file means no definitions of that kind.
 */
class DefinitionLoader {
public:
    explicit DefinitionLoader(std::filesystem::path configDir);

    /**
     * @brief Loads all definition files.
     * @throws core::ConfigError if a file is malformed or a group nests groups.
     */
    core::Definitions load() const;

    static core::SettingsLayer layerFromJson(const nlohmann::json& j, const std::string& owner);
    static core::ModuleConfig moduleFromJson(const nlohmann::json& j, const std::string& owner);

    static constexpr const char* TemplatesFile = "templates.json";
    static constexpr const char* GroupsFile = "groups.json";
    static constexpr const char* HostsFile = "hosts.json";

private:
    core::Definitions loadDefinitions() const;
    nlohmann::json readFile(const char* name, const char* rootKey) const;

    std::filesystem::path configDir_;
};

} // namespace hostkeeper::infra
