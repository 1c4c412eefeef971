#include "core/types/EffectiveConfig.hpp"

#include <algorithm>

namespace hostkeeper::core {

namespace {

const ModuleConfig* find(const ModuleConfigMap& map, const std::string& id) {
    auto it = map.find(id);
    return it != map.end() ? &it->second : nullptr;
}

int parseIntOr(const std::string& value, int fallback) {
    try {
        return value.empty() ? fallback : std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

} // namespace

bool EffectiveConfig::hasHostSetting(const std::string& flag) const {
    return std::find(settings.hostSettings.begin(), settings.hostSettings.end(), flag) !=
           settings.hostSettings.end();
}

const ModuleConfig* EffectiveConfig::monitor(const std::string& id) const {
    return find(settings.monitors, id);
}

const ModuleConfig* EffectiveConfig::command(const std::string& id) const {
    return find(settings.commands, id);
}

const ModuleConfig* EffectiveConfig::connector(const std::string& id) const {
    return find(settings.connectors, id);
}

ConnectorConfig ConnectorConfig::fromEffective(const EffectiveConfig& config,
                                               const std::string& connectorId) {
    ConnectorConfig result;
    result.connectorId = connectorId;
    result.hostId = config.hostId;
    result.address = config.connectAddress();

    const auto* module = config.connector(connectorId);
    if (!module) {
        return result;
    }

    for (const auto& [key, value] : module->settings) {
        if (key == "port") {
            int port = parseIntOr(value, 22);
            result.port = static_cast<uint16_t>(port > 0 && port <= 65535 ? port : 22);
        } else if (key == "username") {
            result.username = value;
        } else if (key == "private_key_path") {
            result.identityFile = value;
        } else if (key == "connection_timeout") {
            result.connectTimeoutSeconds = std::max(1, parseIntOr(value, 10));
        } else {
            result.options[key] = value;
        }
    }
    return result;
}

} // namespace hostkeeper::core
