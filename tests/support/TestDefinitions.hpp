#pragma once

#include "core/types/Definitions.hpp"
#include "infrastructure/config/ConfigResolver.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hostkeeper::testing {

inline core::ModuleConfig moduleConfig(std::map<std::string, std::string> settings = {}) {
    core::ModuleConfig config;
    config.settings = std::move(settings);
    return config;
}

inline core::HostDefinition hostDefinition(const std::string& id, const std::string& address,
                                           std::vector<std::string> groups = {},
                                           core::SettingsLayer overrides = {}) {
    core::HostDefinition host;
    host.id = id;
    host.address = address;
    host.groups = std::move(groups);
    host.overrides = std::move(overrides);
    return host;
}

/**
 * @brief Layer enabling the given monitors and commands with default settings.
 */
inline core::SettingsLayer enabling(const std::vector<std::string>& monitors,
                                    const std::vector<std::string>& commands = {}) {
    core::SettingsLayer layer;
    for (const auto& id : monitors) {
        layer.monitors[id] = moduleConfig();
    }
    for (const auto& id : commands) {
        layer.commands[id] = moduleConfig();
    }
    return layer;
}

/**
 * @brief Mutable definitions handed to a ConfigResolver as its source.
 */
class DefinitionStore {
public:
    void set(core::Definitions definitions) {
        std::lock_guard lock(state_->mutex);
        state_->definitions = std::move(definitions);
    }

    void addHost(core::HostDefinition host) {
        std::lock_guard lock(state_->mutex);
        auto id = host.id;
        state_->definitions.hosts[id] = std::move(host);
    }

    void removeHost(const std::string& id) {
        std::lock_guard lock(state_->mutex);
        state_->definitions.hosts.erase(id);
    }

    infra::ConfigResolver::DefinitionSource source() const {
        return [state = state_] {
            std::lock_guard lock(state->mutex);
            return state->definitions;
        };
    }

private:
    struct State {
        std::mutex mutex;
        core::Definitions definitions;
    };

    std::shared_ptr<State> state_ = std::make_shared<State>();
};

} // namespace hostkeeper::testing
