#include "infrastructure/modules/builtin/SystemdModules.hpp"

#include "core/modules/ShellCommand.hpp"
#include "core/types/Errors.hpp"
#include "infrastructure/modules/builtin/HostMonitors.hpp"

#include <algorithm>
#include <cctype>

namespace hostkeeper::infra::builtin {

using core::Criticality;
using core::ModuleContext;

namespace {

constexpr const char* ServiceSuffix = ".service";

Criticality criticalityOfState(const std::string& activeState, const std::string& loadState) {
    if (loadState == "masked") {
        return Criticality::Info;
    }
    if (activeState == "active") {
        return Criticality::Normal;
    }
    if (activeState == "failed") {
        return Criticality::Error;
    }
    if (activeState == "activating" || activeState == "deactivating" || activeState == "reloading") {
        return Criticality::Warning;
    }
    return Criticality::Info;
}

std::string withoutSuffix(const std::string& unit) {
    const std::string suffix = ServiceSuffix;
    if (unit.size() > suffix.size() && unit.compare(unit.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return unit.substr(0, unit.size() - suffix.size());
    }
    return unit;
}

struct ActionInfo {
    const char* id;
    const char* verb;
    const char* text;
    std::vector<std::string> dependsOnTags;
    std::vector<std::string> dependsOnNoTags;
};

ActionInfo actionInfo(SystemdServiceCommand::Action action) {
    using Action = SystemdServiceCommand::Action;
    switch (action) {
    case Action::Start:
        return {"systemd-service-start", "start", "Start", {"inactive", "failed"}, {"masked"}};
    case Action::Stop:
        return {"systemd-service-stop", "stop", "Stop", {"active"}, {}};
    case Action::Restart:
        return {"systemd-service-restart", "restart", "Restart", {"active"}, {}};
    case Action::Mask:
        return {"systemd-service-mask", "mask", "Mask", {}, {"masked"}};
    case Action::Unmask:
        return {"systemd-service-unmask", "unmask", "Unmask", {"masked"}, {}};
    }
    return {"systemd-service-start", "start", "Start", {}, {}};
}

core::ModuleDescriptor commandDescriptor(SystemdServiceCommand::Action action) {
    auto info = actionInfo(action);

    core::ModuleDescriptor descriptor;
    descriptor.id = info.id;
    descriptor.kind = core::ModuleKind::Command;
    descriptor.description = std::string("Runs systemctl ") + info.verb + " for a service";
    descriptor.display.text = info.text;
    descriptor.display.category = "systemd";
    descriptor.display.style = core::DisplayStyle::Icon;
    descriptor.display.parentId = "systemd-service";
    descriptor.display.multivalueLevel = 1;
    descriptor.display.dependsOnTags = info.dependsOnTags;
    descriptor.display.dependsOnNoTags = info.dependsOnNoTags;
    descriptor.requiredSubsystems = {"systemd"};
    return descriptor;
}

} // namespace

SystemdServiceMonitor::SystemdServiceMonitor() : MonitorModule([] {
    core::ModuleDescriptor descriptor;
    descriptor.id = "systemd-service";
    descriptor.kind = core::ModuleKind::Monitor;
    descriptor.description = "State of systemd services";
    descriptor.display.text = "Services";
    descriptor.display.category = "systemd";
    descriptor.display.style = core::DisplayStyle::CriticalityLevel;
    descriptor.display.multivalue = true;
    descriptor.requiredSubsystems = {"systemd"};
    return descriptor;
}()) {}

std::string SystemdServiceMonitor::buildCommand(const ModuleContext& /*context*/) const {
    return core::ShellCommand(
               {"systemctl", "list-units", "--type=service", "--all", "--plain", "--no-legend", "--no-pager"})
        .toString();
}

core::MonitorDataPoint SystemdServiceMonitor::parse(const core::ExecutionOutput& output,
                                                    const ModuleContext& context) const {
    auto wanted = splitList(context.setting("services"));
    std::transform(wanted.begin(), wanted.end(), wanted.begin(), withoutSuffix);

    core::MonitorDataPoint root;
    for (const auto& line : core::splitLines(output.stdoutText)) {
        auto fields = core::splitFields(line);
        if (!fields.empty() && !std::isalnum(static_cast<unsigned char>(fields.front().front()))) {
            // Status marker of failed units
            fields.erase(fields.begin());
        }
        if (fields.empty()) {
            continue;
        }
        if (fields.size() < 4) {
            throw core::ParseError("Unexpected unit line: " + line);
        }

        const auto& unit = fields[0];
        const auto& loadState = fields[1];
        const auto& activeState = fields[2];
        const auto& subState = fields[3];

        auto name = withoutSuffix(unit);
        if (!wanted.empty() && std::find(wanted.begin(), wanted.end(), name) == wanted.end()) {
            continue;
        }

        std::string description;
        for (size_t i = 4; i < fields.size(); ++i) {
            description += (i > 4 ? " " : "") + fields[i];
        }

        auto child = core::MonitorDataPoint::labeled(name, subState, criticalityOfState(activeState, loadState));
        child.description = description;
        child.commandParams = {unit};
        child.tags = {activeState};
        if (loadState == "masked") {
            child.tags.push_back("masked");
        }
        root.criticality = core::mostSevere(root.criticality, child.criticality);
        root.children.push_back(std::move(child));
    }

    std::sort(root.children.begin(), root.children.end(),
              [](const auto& left, const auto& right) { return left.label < right.label; });
    return root;
}

SystemdServiceCommand::SystemdServiceCommand(Action action)
    : CommandModule(commandDescriptor(action)), action_(action) {}

bool SystemdServiceCommand::isValidUnitName(const std::string& unit) {
    if (unit.empty() || unit.front() == '-') {
        return false;
    }
    return std::all_of(unit.begin(), unit.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '@' ||
               c == '\\';
    });
}

std::string SystemdServiceCommand::buildCommand(const ModuleContext& context) const {
    auto unit = context.param(0);
    if (!isValidUnitName(unit)) {
        throw core::ValidationError("Invalid unit name: " + unit);
    }
    return core::ShellCommand({"systemctl", actionInfo(action_).verb, unit})
        .useSudoIf(context.useSudo())
        .toString();
}

core::CommandResult SystemdServiceCommand::parse(const core::ExecutionOutput& output,
                                                 const ModuleContext& context) const {
    auto message = core::trimmed(output.stdoutText);
    if (!message.empty()) {
        return core::CommandResult::warning(message);
    }
    return core::CommandResult::success(std::string(actionInfo(action_).text) + " " + context.param(0) + ": done");
}

} // namespace hostkeeper::infra::builtin
