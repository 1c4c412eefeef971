#pragma once

#include "core/modules/Module.hpp"

namespace hostkeeper::infra::builtin {

/**
 * @brief Compose projects and their services, read from the Docker engine API.
 *
 * Two levels: projects (command params: compose file, project) and their
 * services (command params: compose file, service).
 *
 * Settings:
 * - compose_file_name: file name inside the working directory, default "docker-compose.yml"
 * - main_dir: base directory used when a container lacks the working_dir label
 */
class DockerComposeMonitor : public core::MonitorModule {
public:
    DockerComposeMonitor();

    std::string buildCommand(const core::ModuleContext& context) const override;
    core::MonitorDataPoint parse(const core::ExecutionOutput& output,
                                 const core::ModuleContext& context) const override;

    /**
     * @brief Maps a container state ("running", "exited", ...) to a criticality.
     */
    static core::Criticality stateCriticality(const std::string& state);
};

/**
 * @brief Child commands of docker-compose.
 *
 * The "legacy_binary" setting ("true") selects the standalone docker-compose
 * executable instead of the compose plugin.
 */
class DockerComposeCommand : public core::CommandModule {
public:
    enum class Action {
        Up,      ///< Project level: up -d
        Restart, ///< Service level
        Logs     ///< Service level, opens a text view
    };

    explicit DockerComposeCommand(Action action);

    std::string buildCommand(const core::ModuleContext& context) const override;
    core::CommandResult parse(const core::ExecutionOutput& output,
                              const core::ModuleContext& context) const override;

private:
    Action action_;
};

} // namespace hostkeeper::infra::builtin
