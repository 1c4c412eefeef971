#include "infrastructure/modules/builtin/DockerComposeModules.hpp"

#include "core/modules/ShellCommand.hpp"
#include "core/types/Errors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>

namespace hostkeeper::infra::builtin {

using core::Criticality;
using core::ModuleContext;
using core::MonitorDataPoint;

namespace {

constexpr const char* ProjectLabel = "com.docker.compose.project";
constexpr const char* ServiceLabel = "com.docker.compose.service";
constexpr const char* WorkingDirLabel = "com.docker.compose.project.working_dir";
constexpr const char* ConfigHashLabel = "com.docker.compose.config-hash";
constexpr const char* DefaultPageSize = "400";

std::string joinPath(const std::string& dir, const std::string& name) {
    if (dir.empty() || dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

core::ShellCommand composeCommand(const ModuleContext& context, const std::string& composeFile) {
    core::ShellCommand command;
    if (context.setting("legacy_binary") == "true") {
        command.argument("docker-compose");
    } else {
        command.arguments({"docker", "compose"});
    }
    command.arguments({"-f", composeFile});
    command.useSudoIf(context.useSudo());
    return command;
}

core::ModuleDescriptor commandDescriptor(DockerComposeCommand::Action action) {
    core::ModuleDescriptor descriptor;
    descriptor.kind = core::ModuleKind::Command;
    descriptor.display.category = "docker-compose";
    descriptor.display.style = core::DisplayStyle::Icon;
    descriptor.display.parentId = "docker-compose";
    descriptor.requiredSubsystems = {"docker"};

    switch (action) {
    case DockerComposeCommand::Action::Up:
        descriptor.id = "docker-compose-up";
        descriptor.description = "Creates and starts the containers of a compose project";
        descriptor.display.text = "Up";
        descriptor.display.multivalueLevel = 1;
        break;
    case DockerComposeCommand::Action::Restart:
        descriptor.id = "docker-compose-restart";
        descriptor.description = "Restarts a compose service";
        descriptor.display.text = "Restart";
        descriptor.display.multivalueLevel = 2;
        break;
    case DockerComposeCommand::Action::Logs:
        descriptor.id = "docker-compose-logs";
        descriptor.description = "Shows the logs of a compose service";
        descriptor.display.text = "Logs";
        descriptor.display.multivalueLevel = 2;
        descriptor.opensTextView = true;
        descriptor.showInNotification = false;
        break;
    }
    return descriptor;
}

} // namespace

DockerComposeMonitor::DockerComposeMonitor() : MonitorModule([] {
    core::ModuleDescriptor descriptor;
    descriptor.id = "docker-compose";
    descriptor.kind = core::ModuleKind::Monitor;
    descriptor.description = "Docker compose projects and services";
    descriptor.display.text = "Compose";
    descriptor.display.category = "docker-compose";
    descriptor.display.style = core::DisplayStyle::CriticalityLevel;
    descriptor.display.multivalue = true;
    descriptor.requiredSubsystems = {"docker"};
    return descriptor;
}()) {}

Criticality DockerComposeMonitor::stateCriticality(const std::string& state) {
    if (state == "running") {
        return Criticality::Normal;
    }
    if (state == "created" || state == "paused") {
        return Criticality::Info;
    }
    if (state == "restarting" || state == "removing") {
        return Criticality::Warning;
    }
    if (state == "dead") {
        return Criticality::Critical;
    }
    return Criticality::Error;
}

std::string DockerComposeMonitor::buildCommand(const ModuleContext& context) const {
    return core::ShellCommand({"curl", "-s", "--unix-socket", "/var/run/docker.sock",
                               "http://localhost/containers/json?all=true"})
        .useSudoIf(context.useSudo())
        .toString();
}

MonitorDataPoint DockerComposeMonitor::parse(const core::ExecutionOutput& output,
                                             const ModuleContext& context) const {
    nlohmann::json containers;
    try {
        containers = nlohmann::json::parse(output.stdoutText);
    } catch (const nlohmann::json::exception& e) {
        throw core::ParseError(std::string("Invalid Docker API response: ") + e.what());
    }
    if (!containers.is_array()) {
        throw core::ParseError("Docker API response is not a container list");
    }

    const auto composeFileName = context.setting("compose_file_name", "docker-compose.yml");
    const auto mainDir = context.setting("main_dir");

    std::map<std::string, std::vector<MonitorDataPoint>> projects;
    for (const auto& container : containers) {
        const auto labels = container.value("Labels", nlohmann::json::object());
        if (!labels.is_object() || !labels.contains(ConfigHashLabel) || !labels.contains(ProjectLabel)) {
            continue;
        }

        const auto id = container.value("Id", std::string{});
        const auto project = labels.value(ProjectLabel, std::string{});
        const auto service = labels.value(ServiceLabel, std::string{});

        auto workingDir = labels.value(WorkingDirLabel, std::string{});
        if (workingDir.empty()) {
            if (mainDir.empty()) {
                spdlog::warn("[{}] Container {} has no working_dir label and main_dir is not set",
                             context.hostId, id.substr(0, 12));
                continue;
            }
            workingDir = joinPath(mainDir, project);
        }

        auto point = MonitorDataPoint::labeled(service, container.value("Status", std::string{}),
                                               stateCriticality(container.value("State", std::string{})));
        point.description = container.value("Image", std::string{});
        point.commandParams = {joinPath(workingDir, composeFileName), service};
        point.tags = {container.value("State", std::string{})};
        projects[project].push_back(std::move(point));
    }

    MonitorDataPoint root;
    for (auto& [project, services] : projects) {
        std::sort(services.begin(), services.end(),
                  [](const auto& left, const auto& right) { return left.label < right.label; });

        const auto& composeFile = services.front().commandParams.front();
        auto mostCritical = std::max_element(services.begin(), services.end(), [](const auto& a, const auto& b) {
            return core::severityRank(a.criticality) < core::severityRank(b.criticality);
        });

        auto projectPoint = MonitorDataPoint::labeled(project, mostCritical->value, mostCritical->criticality);
        projectPoint.commandParams = {composeFile, project};
        projectPoint.children = std::move(services);
        root.criticality = core::mostSevere(root.criticality, projectPoint.criticality);
        root.children.push_back(std::move(projectPoint));
    }
    return root;
}

DockerComposeCommand::DockerComposeCommand(Action action)
    : CommandModule(commandDescriptor(action)), action_(action) {}

std::string DockerComposeCommand::buildCommand(const ModuleContext& context) const {
    const auto composeFile = context.param(0);
    if (composeFile.empty() || composeFile.front() != '/') {
        throw core::ValidationError("Compose file must be an absolute path: " + composeFile);
    }

    auto command = composeCommand(context, composeFile);
    switch (action_) {
    case Action::Up:
        command.arguments({"up", "-d"});
        break;
    case Action::Restart:
        command.arguments({"restart", context.param(1)});
        break;
    case Action::Logs:
        command.arguments({"logs", "--no-color", "-t", "--tail", context.param(2, DefaultPageSize),
                           context.param(1)});
        break;
    }

    if (action_ != Action::Up && context.param(1).empty()) {
        throw core::ValidationError("Service name is missing");
    }
    return command.toString();
}

core::CommandResult DockerComposeCommand::parse(const core::ExecutionOutput& output,
                                                const ModuleContext& /*context*/) const {
    if (action_ != Action::Logs) {
        auto message = core::trimmed(output.stderrText.empty() ? output.stdoutText : output.stderrText);
        return core::CommandResult::success(message);
    }

    // Strips the "service-1  | " prefix compose writes in front of every line
    std::string text;
    for (const auto& line : core::splitLines(output.stdoutText)) {
        auto separator = line.find('|');
        auto stripped = separator == std::string::npos ? line : line.substr(separator + 1);
        auto start = stripped.find_first_not_of(' ');
        text += (start == std::string::npos ? std::string{} : stripped.substr(start)) + "\n";
    }
    return core::CommandResult::success(text);
}

} // namespace hostkeeper::infra::builtin
