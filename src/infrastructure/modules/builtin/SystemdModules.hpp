#pragma once

#include "core/modules/Module.hpp"

namespace hostkeeper::infra::builtin {

/**
 * @brief Lists systemd services, one child per unit.
 *
 * Children carry the active state and "masked" as tags so that the child
 * commands below can be offered only where they make sense. The optional
 * "services" setting restricts the list to a comma separated set of units.
 */
class SystemdServiceMonitor : public core::MonitorModule {
public:
    SystemdServiceMonitor();

    std::string buildCommand(const core::ModuleContext& context) const override;
    core::MonitorDataPoint parse(const core::ExecutionOutput& output,
                                 const core::ModuleContext& context) const override;
};

/**
 * @brief start/stop/restart/mask/unmask of a single unit, param 0 is the unit name.
 */
class SystemdServiceCommand : public core::CommandModule {
public:
    enum class Action { Start, Stop, Restart, Mask, Unmask };

    explicit SystemdServiceCommand(Action action);

    std::string buildCommand(const core::ModuleContext& context) const override;
    core::CommandResult parse(const core::ExecutionOutput& output,
                              const core::ModuleContext& context) const override;

    /**
     * @brief Unit names may contain alphanumerics and "-_.@\" and must not start with a dash.
     */
    static bool isValidUnitName(const std::string& unit);

private:
    Action action_;
};

} // namespace hostkeeper::infra::builtin
