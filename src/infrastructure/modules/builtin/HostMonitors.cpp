#include "infrastructure/modules/builtin/HostMonitors.hpp"

#include "core/modules/ShellCommand.hpp"
#include "core/types/Errors.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>

namespace hostkeeper::infra::builtin {

using core::Criticality;
using core::ExecutionOutput;
using core::ModuleContext;
using core::MonitorDataPoint;
using core::ParseError;

namespace {

double parseNumber(const std::string& text, const std::string& what) {
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed == 0) {
            throw ParseError("Invalid " + what + ": " + text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw ParseError("Invalid " + what + ": " + text);
    }
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

core::ModuleDescriptor monitorDescriptor(const std::string& id, const std::string& text,
                                         const std::string& category) {
    core::ModuleDescriptor descriptor;
    descriptor.id = id;
    descriptor.kind = core::ModuleKind::Monitor;
    descriptor.display.text = text;
    descriptor.display.category = category;
    return descriptor;
}

// Executables looked up on the host and the subsystem each one indicates.
const std::map<std::string, std::string>& subsystemExecutables() {
    static const std::map<std::string, std::string> executables = {
        {"systemctl", "systemd"}, {"docker", "docker"}, {"pvs", "lvm"},
        {"apt-get", "apt"},       {"dnf", "dnf"},       {"yum", "yum"},
    };
    return executables;
}

} // namespace

Criticality usageCriticality(double percent, const ModuleContext& context) {
    if (percent >= context.numericSetting("critical_threshold", 95.0)) {
        return Criticality::Critical;
    }
    if (percent >= context.numericSetting("error_threshold", 90.0)) {
        return Criticality::Error;
    }
    if (percent >= context.numericSetting("warning_threshold", 80.0)) {
        return Criticality::Warning;
    }
    return Criticality::Normal;
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = core::trimmed(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

// PlatformInfoMonitor

PlatformInfoMonitor::PlatformInfoMonitor()
    : MonitorModule([] {
          auto descriptor = monitorDescriptor("platform-info", "Platform", "host");
          descriptor.internal = true;
          descriptor.description = "Discovers operating system and available subsystems";
          return descriptor;
      }()) {}

std::string PlatformInfoMonitor::buildCommand(const ModuleContext& /*context*/) const {
    std::string executables;
    for (const auto& [executable, subsystem] : subsystemExecutables()) {
        executables += executables.empty() ? executable : " " + executable;
    }
    return "uname -s -m; cat /etc/os-release 2>/dev/null; for c in " + executables +
           "; do command -v $c >/dev/null 2>&1 && echo \"has:$c\"; done; true";
}

core::HostFacts PlatformInfoMonitor::parseFacts(const std::string& output) {
    auto lines = core::splitLines(output);
    if (lines.empty()) {
        throw ParseError("Empty platform information");
    }

    auto uname = core::splitFields(lines.front());
    if (uname.size() < 2) {
        throw ParseError("Unexpected uname output: " + lines.front());
    }

    core::HostFacts facts;
    facts.osFamily = toLower(uname[0]);
    facts.architecture = uname[1];

    for (size_t i = 1; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (line.rfind("has:", 0) == 0) {
            auto it = subsystemExecutables().find(line.substr(4));
            if (it != subsystemExecutables().end()) {
                facts.subsystems.insert(it->second);
            }
            continue;
        }

        auto separator = line.find('=');
        if (separator == std::string::npos) {
            continue;
        }
        auto key = line.substr(0, separator);
        auto value = unquote(line.substr(separator + 1));
        if (key == "ID") {
            facts.distribution = value;
        } else if (key == "VERSION_ID") {
            facts.version = value;
        }
    }
    return facts;
}

std::optional<core::HostFacts> PlatformInfoMonitor::discoverFacts(const ExecutionOutput& output) const {
    return parseFacts(output.stdoutText);
}

MonitorDataPoint PlatformInfoMonitor::parse(const ExecutionOutput& output,
                                            const ModuleContext& /*context*/) const {
    auto facts = parseFacts(output.stdoutText);

    auto value = facts.distribution.empty() ? facts.osFamily : facts.distribution;
    if (!facts.version.empty()) {
        value += " " + facts.version;
    }

    auto point = MonitorDataPoint::withValue(value);
    point.description = facts.architecture;
    point.tags.assign(facts.subsystems.begin(), facts.subsystems.end());
    return point;
}

// UptimeMonitor

UptimeMonitor::UptimeMonitor() : MonitorModule([] {
    auto descriptor = monitorDescriptor("uptime", "Uptime", "host");
    descriptor.display.unit = "d";
    return descriptor;
}()) {}

std::string UptimeMonitor::buildCommand(const ModuleContext& /*context*/) const {
    return core::ShellCommand({"uptime", "-s"}).toString();
}

int64_t UptimeMonitor::daysSince(const std::string& bootTime, std::chrono::system_clock::time_point now) {
    std::tm tm{};
    std::istringstream stream(core::trimmed(bootTime));
    stream >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (stream.fail()) {
        throw ParseError("Invalid boot time: " + bootTime);
    }

    auto boot = std::chrono::system_clock::from_time_t(timegm(&tm));
    return std::chrono::duration_cast<std::chrono::hours>(now - boot).count() / 24;
}

MonitorDataPoint UptimeMonitor::parse(const ExecutionOutput& output, const ModuleContext& /*context*/) const {
    auto days = daysSince(output.stdoutText, std::chrono::system_clock::now());
    return MonitorDataPoint::withValue(std::to_string(days));
}

// LoadMonitor

LoadMonitor::LoadMonitor() : MonitorModule(monitorDescriptor("load", "Load", "host")) {}

std::string LoadMonitor::buildCommand(const ModuleContext& /*context*/) const {
    return "cat /proc/loadavg; nproc";
}

MonitorDataPoint LoadMonitor::parse(const ExecutionOutput& output, const ModuleContext& context) const {
    auto lines = core::splitLines(output.stdoutText);
    if (lines.size() < 2) {
        throw ParseError("Expected load averages and CPU count");
    }

    auto fields = core::splitFields(lines[0]);
    if (fields.size() < 3) {
        throw ParseError("Unexpected load average line: " + lines[0]);
    }
    double load1 = parseNumber(fields[0], "load average");
    parseNumber(fields[1], "load average");
    parseNumber(fields[2], "load average");
    double cpus = std::max(1.0, parseNumber(core::trimmed(lines[1]), "CPU count"));

    double perCpu = load1 / cpus;
    auto criticality = Criticality::Normal;
    if (perCpu >= context.numericSetting("error_threshold", 2.0)) {
        criticality = Criticality::Error;
    } else if (perCpu >= context.numericSetting("warning_threshold", 1.0)) {
        criticality = Criticality::Warning;
    }

    auto point = MonitorDataPoint::withValue(fields[0] + " " + fields[1] + " " + fields[2], criticality);
    point.description = fmt::format("{} CPUs", static_cast<int>(cpus));
    return point;
}

// MemoryMonitor

MemoryMonitor::MemoryMonitor() : MonitorModule([] {
    auto descriptor = monitorDescriptor("memory", "Memory", "host");
    descriptor.display.unit = "%";
    descriptor.display.style = core::DisplayStyle::ProgressBar;
    return descriptor;
}()) {}

std::string MemoryMonitor::buildCommand(const ModuleContext& /*context*/) const {
    return core::ShellCommand({"free", "-m"}).toString();
}

MonitorDataPoint MemoryMonitor::parse(const ExecutionOutput& output, const ModuleContext& context) const {
    for (const auto& line : core::splitLines(output.stdoutText)) {
        auto fields = core::splitFields(line);
        if (fields.empty() || fields[0] != "Mem:") {
            continue;
        }
        if (fields.size() < 3) {
            throw ParseError("Unexpected memory line: " + line);
        }

        double total = parseNumber(fields[1], "memory total");
        double used = fields.size() >= 7 ? total - parseNumber(fields[6], "available memory")
                                         : parseNumber(fields[2], "used memory");
        if (total <= 0) {
            throw ParseError("Total memory is zero");
        }

        double percent = used * 100.0 / total;
        auto point = MonitorDataPoint::withValue(fmt::format("{:.0f}", percent),
                                                 usageCriticality(percent, context));
        point.description = fmt::format("{:.0f} / {:.0f} MiB", used, total);
        return point;
    }
    throw ParseError("No memory information in output");
}

// FilesystemMonitor

FilesystemMonitor::FilesystemMonitor() : MonitorModule([] {
    auto descriptor = monitorDescriptor("filesystem", "Filesystems", "storage");
    descriptor.display.unit = "%";
    descriptor.display.style = core::DisplayStyle::ProgressBar;
    descriptor.display.multivalue = true;
    return descriptor;
}()) {}

std::string FilesystemMonitor::buildCommand(const ModuleContext& /*context*/) const {
    return core::ShellCommand({"df", "-P", "-x", "tmpfs", "-x", "devtmpfs", "-x", "squashfs", "-x", "overlay"})
        .toString();
}

MonitorDataPoint FilesystemMonitor::parse(const ExecutionOutput& output, const ModuleContext& context) const {
    auto lines = core::splitLines(output.stdoutText);
    if (lines.empty() || lines.front().rfind("Filesystem", 0) != 0) {
        throw ParseError("Missing df header");
    }

    auto ignored = splitList(context.setting("ignored_filesystems"));

    MonitorDataPoint root;
    for (size_t i = 1; i < lines.size(); ++i) {
        auto fields = core::splitFields(lines[i]);
        if (fields.empty()) {
            continue;
        }
        if (fields.size() < 6) {
            throw ParseError("Unexpected df line: " + lines[i]);
        }

        std::string mountPoint = fields[5];
        for (size_t f = 6; f < fields.size(); ++f) {
            mountPoint += " " + fields[f];
        }
        if (std::find(ignored.begin(), ignored.end(), mountPoint) != ignored.end()) {
            continue;
        }

        auto capacity = fields[4];
        if (!capacity.empty() && capacity.back() == '%') {
            capacity.pop_back();
        }
        double percent = parseNumber(capacity, "capacity");

        auto child = MonitorDataPoint::labeled(mountPoint, capacity, usageCriticality(percent, context));
        child.unit = "%";
        child.description = fields[0];
        child.commandParams = {mountPoint};
        root.criticality = core::mostSevere(root.criticality, child.criticality);
        root.children.push_back(std::move(child));
    }
    return root;
}

// LvmPhysicalVolumeMonitor

LvmPhysicalVolumeMonitor::LvmPhysicalVolumeMonitor() : MonitorModule([] {
    auto descriptor = monitorDescriptor("lvm-pv", "Physical volumes", "storage");
    descriptor.display.style = core::DisplayStyle::CriticalityLevel;
    descriptor.display.multivalue = true;
    descriptor.display.ignoreFromSummary = true;
    descriptor.requiredSubsystems = {"lvm"};
    return descriptor;
}()) {}

std::string LvmPhysicalVolumeMonitor::buildCommand(const ModuleContext& context) const {
    return core::ShellCommand({"pvs", "--separator", "|", "--options", "pv_name,pv_attr,pv_size", "--units", "H"})
        .useSudoIf(context.useSudo())
        .toString();
}

MonitorDataPoint LvmPhysicalVolumeMonitor::parse(const ExecutionOutput& output,
                                                 const ModuleContext& /*context*/) const {
    MonitorDataPoint root;
    auto lines = core::splitLines(output.stdoutText);

    for (size_t i = 1; i < lines.size(); ++i) {
        if (core::trimmed(lines[i]).empty()) {
            continue;
        }

        std::vector<std::string> parts;
        std::istringstream stream(lines[i]);
        std::string part;
        while (std::getline(stream, part, '|')) {
            parts.push_back(core::trimmed(part));
        }
        if (parts.size() < 3) {
            throw ParseError("Unexpected pvs line: " + lines[i]);
        }

        auto child = MonitorDataPoint::labeled(parts[0], "OK");
        child.description = "size: " + parts[2];
        if (parts[1].size() > 2 && parts[1][2] == 'm') {
            child.value = "Missing";
            child.criticality = Criticality::Critical;
        }
        child.commandParams = {parts[0]};
        root.criticality = core::mostSevere(root.criticality, child.criticality);
        root.children.push_back(std::move(child));
    }
    return root;
}

} // namespace hostkeeper::infra::builtin
