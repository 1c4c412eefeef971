#include "core/types/Definitions.hpp"

namespace hostkeeper::core {

std::string ModuleConfig::setting(const std::string& key, const std::string& fallback) const {
    auto it = settings.find(key);
    return it != settings.end() ? it->second : fallback;
}

bool HostDefinition::isValid() const {
    // Both are handed to ssh as a command line argument.
    if (address.rfind('-', 0) == 0 || fqdn.rfind('-', 0) == 0) {
        return false;
    }
    return !id.empty() && (!fqdn.empty() || (!address.empty() && address != "0.0.0.0"));
}

std::string HostDefinition::connectAddress() const {
    return fqdn.empty() ? address : fqdn;
}

} // namespace hostkeeper::core
