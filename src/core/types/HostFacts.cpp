#include "core/types/HostFacts.hpp"

#include <stdexcept>

namespace hostkeeper::core {

bool HostFacts::isDistributionAtLeast(const std::string& name, int majorVersion) const {
    if (distribution != name) {
        return false;
    }
    try {
        return std::stoi(version) >= majorVersion;
    } catch (const std::logic_error&) {
        return false;
    }
}

nlohmann::json HostFacts::toJson() const {
    nlohmann::json j;
    j["os_family"] = osFamily;
    j["distribution"] = distribution;
    j["version"] = version;
    j["architecture"] = architecture;
    j["subsystems"] = subsystems;
    return j;
}

HostFacts HostFacts::fromJson(const nlohmann::json& j) {
    HostFacts facts;
    facts.osFamily = j.value("os_family", "");
    facts.distribution = j.value("distribution", "");
    facts.version = j.value("version", "");
    facts.architecture = j.value("architecture", "");
    if (j.contains("subsystems") && j["subsystems"].is_array()) {
        for (const auto& subsystem : j["subsystems"]) {
            facts.subsystems.insert(subsystem.get<std::string>());
        }
    }
    return facts;
}

} // namespace hostkeeper::core
