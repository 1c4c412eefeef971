#include "infrastructure/modules/builtin/NixosModules.hpp"

#include "core/modules/ShellCommand.hpp"
#include "core/types/Errors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace hostkeeper::infra::builtin {

using core::ModuleContext;
using core::MonitorDataPoint;

namespace {

struct Generation {
    int number{0};
    std::string date;
    std::string nixosVersion;
    std::string kernelVersion;
    bool current{false};
};

Generation readGeneration(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("generation") || !j["generation"].is_number_integer()) {
        throw core::ParseError("Generation entry without a generation number");
    }

    Generation generation;
    generation.number = j["generation"].get<int>();
    generation.date = j.value("date", std::string{});
    generation.nixosVersion = j.value("nixosVersion", std::string{});
    generation.kernelVersion = j.value("kernelVersion", std::string{});
    generation.current = j.value("current", false);
    return generation;
}

// "2024-03-01T10:20:30Z" -> "2024-03-01 10:20:30"
std::string displayDate(std::string date) {
    std::replace(date.begin(), date.end(), 'T', ' ');
    date.erase(std::remove(date.begin(), date.end(), 'Z'), date.end());
    return date;
}

} // namespace

NixosRebuildGenerationsMonitor::NixosRebuildGenerationsMonitor() : MonitorModule([] {
    core::ModuleDescriptor descriptor;
    descriptor.id = "nixos-rebuild-generations";
    descriptor.kind = core::ModuleKind::Monitor;
    descriptor.description = "Configuration generations of a NixOS host";
    descriptor.display.text = "Generations";
    descriptor.display.category = "nixos";
    descriptor.display.multivalue = true;
    descriptor.display.ignoreFromSummary = true;
    return descriptor;
}()) {}

bool NixosRebuildGenerationsMonitor::appliesTo(const core::HostFacts& facts) const {
    if (!facts.isKnown()) {
        return true;
    }
    return facts.isLinux() && facts.isDistributionAtLeast("nixos", MinimumMajorVersion);
}

std::string NixosRebuildGenerationsMonitor::buildCommand(const ModuleContext& context) const {
    if (context.facts.isKnown() && !context.facts.isDistributionAtLeast("nixos", MinimumMajorVersion)) {
        throw core::ValidationError("Unsupported platform for " + id());
    }
    return core::ShellCommand({"nixos-rebuild", "list-generations", "--json"})
        .useSudoIf(context.useSudo())
        .toString();
}

MonitorDataPoint NixosRebuildGenerationsMonitor::parse(const core::ExecutionOutput& output,
                                                       const ModuleContext& /*context*/) const {
    nlohmann::json entries;
    try {
        entries = nlohmann::json::parse(output.stdoutText);
    } catch (const nlohmann::json::exception& e) {
        throw core::ParseError(std::string("Invalid generation list: ") + e.what());
    }
    if (!entries.is_array()) {
        throw core::ParseError("Generation list is not an array");
    }

    std::vector<Generation> generations;
    try {
        for (const auto& entry : entries) {
            generations.push_back(readGeneration(entry));
        }
    } catch (const nlohmann::json::exception& e) {
        throw core::ParseError(std::string("Invalid generation entry: ") + e.what());
    }
    std::sort(generations.begin(), generations.end(),
              [](const Generation& a, const Generation& b) { return a.number > b.number; });

    MonitorDataPoint root;
    for (const auto& generation : generations) {
        auto child = MonitorDataPoint::labeled(fmt::format("#{} @ {}", generation.number, displayDate(generation.date)),
                                               generation.nixosVersion);
        child.description = fmt::format("NixOS {} | Kernel {}", generation.nixosVersion, generation.kernelVersion);
        if (generation.current) {
            child.tags.push_back("Current");
            root.value = std::to_string(generation.number);
        }
        root.children.push_back(std::move(child));
    }
    return root;
}

} // namespace hostkeeper::infra::builtin
