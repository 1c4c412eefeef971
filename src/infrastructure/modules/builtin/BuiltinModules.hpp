#pragma once

namespace hostkeeper::infra {

class ModuleRegistry;

/**
 * @brief Registers every monitor and command shipped with HostKeeper.
 */
void registerBuiltinModules(ModuleRegistry& registry);

} // namespace hostkeeper::infra
