#include "infrastructure/config/ConfigResolver.hpp"

#include "core/types/Errors.hpp"
#include "core/types/InputSpec.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace hostkeeper::infra {

using core::ConfigError;

namespace {

void mergeModule(core::ModuleConfig& base, const core::ModuleConfig& overlay) {
    if (overlay.version) {
        base.version = overlay.version;
    }
    if (overlay.enabled) {
        base.enabled = overlay.enabled;
    }
    if (overlay.isCritical) {
        base.isCritical = overlay.isCritical;
    }
    for (const auto& [key, value] : overlay.settings) {
        base.settings[key] = value;
    }
}

void mergeModules(core::ModuleConfigMap& base, const core::ModuleConfigMap& overlay) {
    for (const auto& [moduleId, config] : overlay) {
        mergeModule(base[moduleId], config);
    }
}

void validateValidators(const core::SettingsLayer& layer, const std::string& owner) {
    for (const auto& [commandId, config] : layer.commands) {
        auto it = config.settings.find("validator");
        if (it != config.settings.end() && !core::InputSpec::isValidPattern(it->second)) {
            throw ConfigError(owner + ": command " + commandId + " has a malformed validator pattern: " +
                              it->second);
        }
    }
}

} // namespace

GroupMergeOrder groupMergeOrderFromString(const std::string& str) {
    if (str == "first_wins") {
        return GroupMergeOrder::FirstWins;
    }
    return GroupMergeOrder::LastWins;
}

ConfigResolver::ConfigResolver(DefinitionSource source, GroupMergeOrder order)
    : source_(std::move(source)), order_(order), snapshot_(std::make_shared<ConfigSnapshot>()) {}

std::vector<std::string> ConfigResolver::reloadAll() {
    auto definitions = source_();
    validate(definitions);

    auto next = std::make_shared<ConfigSnapshot>();
    auto order = mergeOrder();
    for (const auto& [hostId, host] : definitions.hosts) {
        next->hosts.emplace(hostId, resolveHost(definitions, host, order));
    }
    next->definitions = std::move(definitions);

    std::vector<std::string> changed;
    {
        std::lock_guard lock(mutex_);
        const auto& previous = snapshot_->hosts;
        for (const auto& [hostId, config] : next->hosts) {
            auto it = previous.find(hostId);
            if (it == previous.end() || !(it->second == config)) {
                changed.push_back(hostId);
            }
        }
        for (const auto& [hostId, config] : previous) {
            if (!next->hosts.contains(hostId)) {
                changed.push_back(hostId);
            }
        }
        next->generation = snapshot_->generation + 1;
        snapshot_ = next;
    }

    spdlog::info("Configuration reloaded: {} hosts, {} changed", next->hosts.size(), changed.size());

    if (!changed.empty()) {
        notifyListeners(changed);
    }
    return changed;
}

core::EffectiveConfig ConfigResolver::resolve(const std::string& hostId) const {
    auto current = snapshot();
    auto it = current->hosts.find(hostId);
    if (it == current->hosts.end()) {
        throw ConfigError("Unknown host: " + hostId);
    }
    return it->second;
}

std::vector<std::string> ConfigResolver::hostIds() const {
    auto current = snapshot();
    std::vector<std::string> ids;
    ids.reserve(current->hosts.size());
    for (const auto& [hostId, config] : current->hosts) {
        ids.push_back(hostId);
    }
    return ids;
}

std::shared_ptr<const ConfigSnapshot> ConfigResolver::snapshot() const {
    std::lock_guard lock(mutex_);
    return snapshot_;
}

void ConfigResolver::setMergeOrder(GroupMergeOrder order) {
    std::lock_guard lock(mutex_);
    order_ = order;
}

GroupMergeOrder ConfigResolver::mergeOrder() const {
    std::lock_guard lock(mutex_);
    return order_;
}

int ConfigResolver::addChangeListener(ChangeListener listener) {
    std::lock_guard lock(listenersMutex_);
    int id = nextListenerId_++;
    listeners_[id] = std::move(listener);
    return id;
}

void ConfigResolver::removeChangeListener(int id) {
    std::lock_guard lock(listenersMutex_);
    listeners_.erase(id);
}

void ConfigResolver::notifyListeners(const std::vector<std::string>& changedHosts) {
    std::vector<ChangeListener> listeners;
    {
        std::lock_guard lock(listenersMutex_);
        for (const auto& [id, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }

    for (const auto& listener : listeners) {
        try {
            listener(changedHosts);
        } catch (const std::exception& e) {
            spdlog::error("Configuration change listener threw: {}", e.what());
        }
    }
}

core::SettingsLayer ConfigResolver::mergeLayers(const core::SettingsLayer& base,
                                                const core::SettingsLayer& overlay) {
    core::SettingsLayer result = base;
    mergeModules(result.monitors, overlay.monitors);
    mergeModules(result.commands, overlay.commands);
    mergeModules(result.connectors, overlay.connectors);

    for (const auto& flag : overlay.hostSettings) {
        if (std::find(result.hostSettings.begin(), result.hostSettings.end(), flag) ==
            result.hostSettings.end()) {
            result.hostSettings.push_back(flag);
        }
    }
    return result;
}

core::EffectiveConfig ConfigResolver::resolveHost(const core::Definitions& definitions,
                                                  const core::HostDefinition& host,
                                                  GroupMergeOrder order) {
    std::vector<const core::GroupDefinition*> groups;
    for (const auto& groupName : host.groups) {
        auto it = definitions.groups.find(groupName);
        if (it != definitions.groups.end()) {
            groups.push_back(&it->second);
        }
    }
    if (order == GroupMergeOrder::FirstWins) {
        std::reverse(groups.begin(), groups.end());
    }

    core::SettingsLayer merged;
    for (const auto* group : groups) {
        for (const auto& templateName : group->templates) {
            auto it = definitions.templates.find(templateName);
            if (it != definitions.templates.end()) {
                merged = mergeLayers(merged, it->second.settings);
            }
        }
    }
    for (const auto* group : groups) {
        merged = mergeLayers(merged, group->settings);
    }
    merged = mergeLayers(merged, host.overrides);

    core::EffectiveConfig config;
    config.hostId = host.id;
    config.address = host.address;
    config.fqdn = host.fqdn;
    config.groups = host.groups;
    config.settings = std::move(merged);
    return config;
}

void ConfigResolver::validate(const core::Definitions& definitions) {
    for (const auto& [name, tmpl] : definitions.templates) {
        validateValidators(tmpl.settings, "template " + name);
    }

    for (const auto& [name, group] : definitions.groups) {
        for (const auto& templateName : group.templates) {
            if (!definitions.templates.contains(templateName)) {
                throw ConfigError("group " + name + " references unknown template " + templateName);
            }
        }
        validateValidators(group.settings, "group " + name);
    }

    std::set<std::string> invalidGroups;
    for (const auto& [hostId, host] : definitions.hosts) {
        if (!host.isValid()) {
            throw ConfigError("host " + hostId + " needs a valid address or fqdn");
        }
        for (const auto& groupName : host.groups) {
            if (!definitions.groups.contains(groupName)) {
                invalidGroups.insert(groupName);
            }
        }
        validateValidators(host.overrides, "host " + hostId);
    }

    if (!invalidGroups.empty()) {
        std::string names;
        for (const auto& name : invalidGroups) {
            names += names.empty() ? name : ", " + name;
        }
        throw ConfigError("Invalid group references: " + names);
    }
}

} // namespace hostkeeper::infra
