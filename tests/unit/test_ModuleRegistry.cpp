#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "infrastructure/modules/ModuleRegistry.hpp"

#include <algorithm>

using namespace hostkeeper::core;
using namespace hostkeeper::infra;

namespace {

class StubMonitor : public MonitorModule {
public:
    explicit StubMonitor(ModuleDescriptor descriptor) : MonitorModule(std::move(descriptor)) {}

    std::string buildCommand(const ModuleContext& /*context*/) const override { return "true"; }

    MonitorDataPoint parse(const ExecutionOutput& output, const ModuleContext& /*context*/) const override {
        if (output.stdoutText.empty()) {
            throw std::runtime_error("empty output");
        }
        return MonitorDataPoint::withValue(trimmed(output.stdoutText));
    }
};

class StubCommand : public CommandModule {
public:
    explicit StubCommand(ModuleDescriptor descriptor) : CommandModule(std::move(descriptor)) {}

    std::string buildCommand(const ModuleContext& context) const override {
        if (context.params.empty()) {
            throw std::invalid_argument("no target");
        }
        return "do " + context.params.front();
    }
};

ModuleDescriptor descriptor(const std::string& id, ModuleKind kind, const std::string& category = "host") {
    ModuleDescriptor d;
    d.id = id;
    d.kind = kind;
    d.display.category = category;
    return d;
}

EffectiveConfig configEnabling(std::vector<std::string> monitors, std::vector<std::string> commands) {
    EffectiveConfig config;
    config.hostId = "web-1";
    for (const auto& id : monitors) {
        config.settings.monitors[id] = ModuleConfig{};
    }
    for (const auto& id : commands) {
        config.settings.commands[id] = ModuleConfig{};
    }
    return config;
}

} // namespace

TEST_CASE("ModuleRegistry registration", "[ModuleRegistry]") {
    ModuleRegistry registry;

    REQUIRE(registry.registerMonitor(std::make_shared<StubMonitor>(descriptor("uptime", ModuleKind::Monitor))));
    REQUIRE(registry.registerCommand(std::make_shared<StubCommand>(descriptor("reboot", ModuleKind::Command))));

    SECTION("Ids are unique across kinds") {
        REQUIRE_FALSE(
            registry.registerCommand(std::make_shared<StubCommand>(descriptor("uptime", ModuleKind::Command))));
        REQUIRE_FALSE(
            registry.registerMonitor(std::make_shared<StubMonitor>(descriptor("reboot", ModuleKind::Monitor))));
    }

    SECTION("Lookup by kind") {
        REQUIRE(registry.monitor("uptime") != nullptr);
        REQUIRE(registry.monitor("reboot") == nullptr);
        REQUIRE(registry.command("reboot") != nullptr);
        REQUIRE(registry.find("reboot")->kind() == ModuleKind::Command);
        REQUIRE(registry.find("unknown") == nullptr);
    }

    SECTION("Listing") {
        REQUIRE(registry.monitorIds() == std::vector<std::string>{"uptime"});
        REQUIRE(registry.commandIds() == std::vector<std::string>{"reboot"});
    }
}

TEST_CASE("ModuleRegistry applicableModules", "[ModuleRegistry]") {
    ModuleRegistry registry;

    auto internal = descriptor("platform", ModuleKind::Monitor);
    internal.internal = true;
    auto lvm = descriptor("lvm", ModuleKind::Monitor, "storage");
    lvm.requiredSubsystems = {"lvm"};

    registry.registerMonitor(std::make_shared<StubMonitor>(internal));
    registry.registerMonitor(std::make_shared<StubMonitor>(descriptor("uptime", ModuleKind::Monitor)));
    registry.registerMonitor(std::make_shared<StubMonitor>(descriptor("memory", ModuleKind::Monitor)));
    registry.registerMonitor(std::make_shared<StubMonitor>(lvm));
    registry.registerCommand(std::make_shared<StubCommand>(descriptor("reboot", ModuleKind::Command)));

    HostFacts facts;
    facts.osFamily = "linux";

    SECTION("Only configured and enabled modules are listed") {
        auto config = configEnabling({"uptime", "memory", "platform"}, {});
        config.settings.monitors["memory"].enabled = false;

        auto ids = registry.applicableModules(config, facts, "", ModuleKind::Monitor);
        REQUIRE(ids == std::vector<std::string>{"uptime"});
    }

    SECTION("Platform predicate filters by subsystem") {
        auto config = configEnabling({"uptime", "lvm"}, {});

        auto ids = registry.applicableModules(config, facts, "", ModuleKind::Monitor);
        REQUIRE(std::find(ids.begin(), ids.end(), "lvm") == ids.end());

        facts.subsystems = {"lvm"};
        ids = registry.applicableModules(config, facts, "", ModuleKind::Monitor);
        REQUIRE(std::find(ids.begin(), ids.end(), "lvm") != ids.end());
    }

    SECTION("Category filter") {
        facts.subsystems = {"lvm"};
        auto config = configEnabling({"uptime", "lvm"}, {});

        auto ids = registry.applicableModules(config, facts, "storage", ModuleKind::Monitor);
        REQUIRE(ids == std::vector<std::string>{"lvm"});
    }

    SECTION("Commands are listed separately") {
        auto config = configEnabling({"uptime"}, {"reboot"});

        auto ids = registry.applicableModules(config, facts, "", ModuleKind::Command);
        REQUIRE(ids == std::vector<std::string>{"reboot"});
    }
}

TEST_CASE("ModuleRegistry error translation", "[ModuleRegistry]") {
    ModuleRegistry registry;
    auto monitor = std::make_shared<StubMonitor>(descriptor("uptime", ModuleKind::Monitor));
    auto command = std::make_shared<StubCommand>(descriptor("restart", ModuleKind::Command));
    registry.registerMonitor(monitor);
    registry.registerCommand(command);

    auto config = configEnabling({"uptime"}, {"restart"});
    config.settings.hostSettings = {"use_sudo"};
    config.settings.commands["restart"].settings["unit"] = "nginx";

    SECTION("makeContext carries host settings and module config") {
        auto context = ModuleRegistry::makeContext(*command, config, HostFacts{}, {"nginx"});
        REQUIRE(context.hostId == "web-1");
        REQUIRE(context.useSudo());
        REQUIRE(context.setting("unit") == "nginx");
        REQUIRE(registry.buildCommand(*command, context) == "do nginx");
    }

    SECTION("Build failures become ValidationError") {
        auto context = ModuleRegistry::makeContext(*command, config, HostFacts{}, {});
        REQUIRE_THROWS_AS(registry.buildCommand(*command, context), ValidationError);
    }

    SECTION("Parse failures become ParseError") {
        auto context = ModuleRegistry::makeContext(*monitor, config, HostFacts{}, {});
        REQUIRE_THROWS_AS(registry.parseMonitor(*monitor, ExecutionOutput{}, context), ParseError);

        ExecutionOutput output;
        output.stdoutText = " 42 \n";
        REQUIRE(registry.parseMonitor(*monitor, output, context).value == "42");
    }
}
