#pragma once

#include "core/modules/Module.hpp"

namespace hostkeeper::infra::builtin {

/**
 * @brief NixOS system generations, newest first, the active one tagged "Current".
 *
 * Needs NixOS 20 or newer for `nixos-rebuild list-generations --json`. Not
 * counted toward the host aggregate.
 */
class NixosRebuildGenerationsMonitor : public core::MonitorModule {
public:
    static constexpr int MinimumMajorVersion = 20;

    NixosRebuildGenerationsMonitor();

    bool appliesTo(const core::HostFacts& facts) const override;

    /**
     * @throws core::ValidationError on hosts known not to run a supported NixOS.
     */
    std::string buildCommand(const core::ModuleContext& context) const override;
    core::MonitorDataPoint parse(const core::ExecutionOutput& output,
                                 const core::ModuleContext& context) const override;
};

} // namespace hostkeeper::infra::builtin
