#include "infrastructure/modules/builtin/HostCommands.hpp"

#include "core/modules/ShellCommand.hpp"
#include "core/types/Errors.hpp"
#include "infrastructure/modules/builtin/SystemdModules.hpp"

#include <cstdint>

namespace hostkeeper::infra::builtin {

using core::ModuleContext;

namespace {

core::ModuleDescriptor hostCommand(const std::string& id, const std::string& text) {
    core::ModuleDescriptor descriptor;
    descriptor.id = id;
    descriptor.kind = core::ModuleKind::Command;
    descriptor.display.text = text;
    descriptor.display.category = "host";
    descriptor.display.style = core::DisplayStyle::Icon;
    return descriptor;
}

int positiveParam(const ModuleContext& context, size_t index, int fallback, int maximum, const std::string& name) {
    auto value = context.param(index);
    if (value.empty()) {
        return fallback;
    }
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed == value.size() && parsed > 0 && parsed <= maximum) {
            return parsed;
        }
    } catch (const std::logic_error&) {
    }
    throw core::ValidationError("Invalid " + name + ": " + value);
}

} // namespace

PowerCommand::PowerCommand(Action action)
    : CommandModule([action] {
          auto descriptor = action == Action::Shutdown ? hostCommand("shutdown", "Shut down")
                                                       : hostCommand("reboot", "Reboot");
          descriptor.confirmationText = action == Action::Shutdown ? "Shut down the host?" : "Reboot the host?";
          descriptor.idempotent = false;
          return descriptor;
      }()),
      action_(action) {}

std::string PowerCommand::buildCommand(const ModuleContext& context) const {
    return core::ShellCommand({"shutdown", action_ == Action::Shutdown ? "-P" : "-r", "now"})
        .useSudoIf(context.useSudo())
        .toString();
}

LogsCommand::LogsCommand() : CommandModule([] {
    auto descriptor = hostCommand("logs", "Show logs");
    descriptor.description = "Shows journal entries, newest first page";
    descriptor.opensTextView = true;
    descriptor.showInNotification = false;
    descriptor.requiredSubsystems = {"systemd"};
    return descriptor;
}()) {}

std::string LogsCommand::buildCommand(const ModuleContext& context) const {
    const auto target = context.param(0);
    const auto pattern = context.param(1);
    const int64_t page = positiveParam(context, 2, 1, MaxPage, "page number");
    const int64_t pageSize = positiveParam(context, 3, DefaultPageSize, MaxPageSize, "page size");

    core::ShellCommand command({"journalctl", "-q", "-n", std::to_string(page * pageSize)});
    if (target == "dmesg") {
        command.argument("--dmesg");
    } else if (!target.empty() && target != "all") {
        if (!SystemdServiceCommand::isValidUnitName(target)) {
            throw core::ValidationError("Invalid unit name: " + target);
        }
        command.arguments({"-u", target});
    }
    if (!pattern.empty()) {
        command.arguments({"-g", pattern});
    }
    command.useSudoIf(context.useSudo());
    command.pipeTo(core::ShellCommand({"head", "-n", std::to_string(pageSize)}));
    return command.toString();
}

core::CommandResult LogsCommand::parse(const core::ExecutionOutput& output, const ModuleContext& /*context*/) const {
    return core::CommandResult::success(output.stdoutText);
}

PackagesUpdateCommand::PackagesUpdateCommand() : CommandModule([] {
    auto descriptor = hostCommand("linux-packages-update", "Update packages");
    descriptor.description = "Upgrades all installed packages";
    descriptor.confirmationText = "Upgrade all packages on the host?";
    descriptor.opensDetails = true;
    descriptor.requiredSubsystems = {"apt", "dnf", "yum"};
    return descriptor;
}()) {}

std::string PackagesUpdateCommand::buildCommand(const ModuleContext& context) const {
    const bool sudo = context.useSudo();
    if (context.facts.hasSubsystem("apt")) {
        return core::ShellCommand({"apt-get", "-q", "update"}).useSudoIf(sudo).toString() + " && " +
               core::ShellCommand({"apt-get", "-q", "-y", "upgrade"}).useSudoIf(sudo).toString();
    }
    if (context.facts.hasSubsystem("dnf")) {
        return core::ShellCommand({"dnf", "-y", "upgrade"}).useSudoIf(sudo).toString();
    }
    if (context.facts.hasSubsystem("yum")) {
        return core::ShellCommand({"yum", "-y", "update"}).useSudoIf(sudo).toString();
    }
    throw core::ValidationError("No supported package manager on host " + context.hostId);
}

SetHostnameCommand::SetHostnameCommand() : CommandModule([] {
    auto descriptor = hostCommand("set-hostname", "Set hostname");
    descriptor.description = "Changes the static host name";
    descriptor.requiredSubsystems = {"systemd"};
    descriptor.inputs = {core::InputSpec{"Hostname", {}, HostnamePattern, {}, {}}};
    return descriptor;
}()) {}

std::string SetHostnameCommand::buildCommand(const ModuleContext& context) const {
    const auto hostname = context.param(0);
    const auto inputs = effectiveInputs(context.config);
    if (hostname.empty() || !inputs.front().accepts(hostname)) {
        throw core::ValidationError("Invalid hostname: " + hostname);
    }
    return core::ShellCommand({"hostnamectl", "set-hostname", hostname}).useSudoIf(context.useSudo()).toString();
}

} // namespace hostkeeper::infra::builtin
