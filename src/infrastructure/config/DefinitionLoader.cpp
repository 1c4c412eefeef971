#include "infrastructure/config/DefinitionLoader.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace hostkeeper::infra {

using core::ConfigError;

namespace {

std::string scalarToString(const nlohmann::json& value, const std::string& owner,
                           const std::string& key) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<int64_t>());
    }
    if (value.is_number()) {
        return value.dump();
    }
    throw ConfigError(owner + ": setting \"" + key + "\" must be a scalar value");
}

core::ModuleConfigMap modulesFromJson(const nlohmann::json& j, const std::string& owner) {
    core::ModuleConfigMap modules;
    if (j.is_null()) {
        return modules;
    }
    if (!j.is_object()) {
        throw ConfigError(owner + ": module section must be an object");
    }
    for (const auto& [moduleId, moduleJson] : j.items()) {
        modules.emplace(moduleId, DefinitionLoader::moduleFromJson(moduleJson, owner + "/" + moduleId));
    }
    return modules;
}

} // namespace

DefinitionLoader::DefinitionLoader(std::filesystem::path configDir)
    : configDir_(std::move(configDir)) {}

core::Definitions DefinitionLoader::load() const {
    try {
        return loadDefinitions();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Malformed definitions: ") + e.what());
    }
}

core::Definitions DefinitionLoader::loadDefinitions() const {
    core::Definitions definitions;

    auto templates = readFile(TemplatesFile, "templates");
    for (const auto& [name, j] : templates.items()) {
        core::TemplateDefinition tmpl;
        tmpl.name = name;
        tmpl.settings = layerFromJson(j, "template " + name);
        definitions.templates.emplace(name, std::move(tmpl));
    }

    auto groups = readFile(GroupsFile, "groups");
    for (const auto& [name, j] : groups.items()) {
        if (!j.is_object()) {
            throw ConfigError("group " + name + " must be an object");
        }
        if (j.contains("groups")) {
            throw ConfigError("group " + name + " references other groups, which is not allowed");
        }
        core::GroupDefinition group;
        group.name = name;
        group.templates = j.value("templates", std::vector<std::string>{});
        group.settings = layerFromJson(j, "group " + name);
        definitions.groups.emplace(name, std::move(group));
    }

    auto hosts = readFile(HostsFile, "hosts");
    for (const auto& [id, j] : hosts.items()) {
        if (!j.is_object()) {
            throw ConfigError("host " + id + " must be an object");
        }
        core::HostDefinition host;
        host.id = id;
        host.address = j.value("address", "0.0.0.0");
        host.fqdn = j.value("fqdn", "");
        host.groups = j.value("groups", std::vector<std::string>{});
        host.overrides = layerFromJson(j, "host " + id);
        if (!host.isValid()) {
            throw ConfigError("host " + id + " needs a valid address or fqdn");
        }
        definitions.hosts.emplace(id, std::move(host));
    }

    spdlog::debug("Loaded {} templates, {} groups, {} hosts from {}", definitions.templates.size(),
                  definitions.groups.size(), definitions.hosts.size(), configDir_.string());
    return definitions;
}

core::SettingsLayer DefinitionLoader::layerFromJson(const nlohmann::json& j, const std::string& owner) {
    core::SettingsLayer layer;
    if (!j.is_object()) {
        throw ConfigError(owner + " must be an object");
    }
    if (j.contains("monitors")) {
        layer.monitors = modulesFromJson(j["monitors"], owner);
    }
    if (j.contains("commands")) {
        layer.commands = modulesFromJson(j["commands"], owner);
    }
    if (j.contains("connectors")) {
        layer.connectors = modulesFromJson(j["connectors"], owner);
    }
    if (j.contains("host_settings")) {
        if (!j["host_settings"].is_array()) {
            throw ConfigError(owner + ": host_settings must be a list");
        }
        layer.hostSettings = j["host_settings"].get<std::vector<std::string>>();
    }
    return layer;
}

core::ModuleConfig DefinitionLoader::moduleFromJson(const nlohmann::json& j, const std::string& owner) {
    core::ModuleConfig config;
    if (j.is_null()) {
        return config;
    }
    if (!j.is_object()) {
        throw ConfigError(owner + " must be an object");
    }
    if (j.contains("version")) {
        config.version = j["version"].get<std::string>();
    }
    if (j.contains("enabled")) {
        config.enabled = j["enabled"].get<bool>();
    }
    if (j.contains("is_critical")) {
        config.isCritical = j["is_critical"].get<bool>();
    }
    if (j.contains("settings")) {
        const auto& settings = j["settings"];
        if (!settings.is_object()) {
            throw ConfigError(owner + ": settings must be an object");
        }
        for (const auto& [key, value] : settings.items()) {
            config.settings[key] = scalarToString(value, owner, key);
        }
    }
    return config;
}

nlohmann::json DefinitionLoader::readFile(const char* name, const char* rootKey) const {
    auto path = configDir_ / name;
    if (!std::filesystem::exists(path)) {
        spdlog::debug("Definition file {} not found, skipping", path.string());
        return nlohmann::json::object();
    }

    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Failed to open " + path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Failed to parse " + path.string() + ": " + e.what());
    }

    if (!j.is_object()) {
        throw ConfigError(path.string() + " must contain an object");
    }
    if (!j.contains(rootKey)) {
        return nlohmann::json::object();
    }
    if (!j[rootKey].is_object()) {
        throw ConfigError(path.string() + ": \"" + rootKey + "\" must be an object");
    }
    return j[rootKey];
}

} // namespace hostkeeper::infra
