#include "infrastructure/modules/builtin/BuiltinModules.hpp"

#include "infrastructure/modules/ModuleRegistry.hpp"
#include "infrastructure/modules/builtin/DockerComposeModules.hpp"
#include "infrastructure/modules/builtin/HostCommands.hpp"
#include "infrastructure/modules/builtin/HostMonitors.hpp"
#include "infrastructure/modules/builtin/NixosModules.hpp"
#include "infrastructure/modules/builtin/SystemdModules.hpp"

#include <spdlog/spdlog.h>

namespace hostkeeper::infra {

using namespace builtin;

void registerBuiltinModules(ModuleRegistry& registry) {
    std::vector<std::shared_ptr<const core::MonitorModule>> monitors = {
        std::make_shared<PlatformInfoMonitor>(),
        std::make_shared<UptimeMonitor>(),
        std::make_shared<LoadMonitor>(),
        std::make_shared<MemoryMonitor>(),
        std::make_shared<FilesystemMonitor>(),
        std::make_shared<LvmPhysicalVolumeMonitor>(),
        std::make_shared<NixosRebuildGenerationsMonitor>(),
        std::make_shared<SystemdServiceMonitor>(),
        std::make_shared<DockerComposeMonitor>(),
    };

    std::vector<std::shared_ptr<const core::CommandModule>> commands = {
        std::make_shared<PowerCommand>(PowerCommand::Action::Shutdown),
        std::make_shared<PowerCommand>(PowerCommand::Action::Reboot),
        std::make_shared<LogsCommand>(),
        std::make_shared<PackagesUpdateCommand>(),
        std::make_shared<SetHostnameCommand>(),
        std::make_shared<SystemdServiceCommand>(SystemdServiceCommand::Action::Start),
        std::make_shared<SystemdServiceCommand>(SystemdServiceCommand::Action::Stop),
        std::make_shared<SystemdServiceCommand>(SystemdServiceCommand::Action::Restart),
        std::make_shared<SystemdServiceCommand>(SystemdServiceCommand::Action::Mask),
        std::make_shared<SystemdServiceCommand>(SystemdServiceCommand::Action::Unmask),
        std::make_shared<DockerComposeCommand>(DockerComposeCommand::Action::Up),
        std::make_shared<DockerComposeCommand>(DockerComposeCommand::Action::Restart),
        std::make_shared<DockerComposeCommand>(DockerComposeCommand::Action::Logs),
    };

    for (auto& monitor : monitors) {
        if (!registry.registerMonitor(monitor)) {
            spdlog::warn("Monitor {} registered twice", monitor->id());
        }
    }
    for (auto& command : commands) {
        if (!registry.registerCommand(command)) {
            spdlog::warn("Command {} registered twice", command->id());
        }
    }

    spdlog::debug("Registered {} monitors and {} commands", monitors.size(), commands.size());
}

} // namespace hostkeeper::infra
