#include <catch2/catch_test_macros.hpp>

#include "core/modules/Module.hpp"
#include "core/types/Errors.hpp"

using namespace hostkeeper::core;

namespace {

class TestCommand : public CommandModule {
public:
    explicit TestCommand(ModuleDescriptor descriptor) : CommandModule(std::move(descriptor)) {}

    std::string buildCommand(const ModuleContext& context) const override {
        return "echo " + context.param(0);
    }
};

ModuleDescriptor commandDescriptor(const std::string& id) {
    ModuleDescriptor descriptor;
    descriptor.id = id;
    descriptor.kind = ModuleKind::Command;
    return descriptor;
}

HostFacts linuxFacts(std::set<std::string> subsystems) {
    HostFacts facts;
    facts.osFamily = "linux";
    facts.subsystems = std::move(subsystems);
    return facts;
}

} // namespace

TEST_CASE("Module appliesTo", "[Module]") {
    auto descriptor = commandDescriptor("compose-up");
    descriptor.requiredSubsystems = {"docker", "podman"};
    TestCommand command(descriptor);

    SECTION("Unknown facts accept the module") {
        REQUIRE(command.appliesTo(HostFacts{}));
    }

    SECTION("Any one required subsystem is enough") {
        REQUIRE(command.appliesTo(linuxFacts({"podman"})));
        REQUIRE_FALSE(command.appliesTo(linuxFacts({"systemd"})));
    }

    SECTION("Non-Linux hosts are rejected") {
        HostFacts facts;
        facts.osFamily = "freebsd";
        facts.subsystems = {"docker"};
        REQUIRE_FALSE(command.appliesTo(facts));
    }

    SECTION("No required subsystems accepts any Linux host") {
        TestCommand plain(commandDescriptor("plain"));
        REQUIRE(plain.appliesTo(linuxFacts({})));
    }
}

TEST_CASE("DisplayOptions acceptsTags", "[Module]") {
    DisplayOptions display;

    SECTION("No conditions accept every row") {
        REQUIRE(display.acceptsTags({}));
        REQUIRE(display.acceptsTags({"active"}));
    }

    SECTION("dependsOnTags needs one matching tag") {
        display.dependsOnTags = {"inactive", "failed"};
        REQUIRE(display.acceptsTags({"failed"}));
        REQUIRE_FALSE(display.acceptsTags({"active"}));
    }

    SECTION("dependsOnNoTags rejects rows carrying the tag") {
        display.dependsOnNoTags = {"masked"};
        REQUIRE(display.acceptsTags({"active"}));
        REQUIRE_FALSE(display.acceptsTags({"active", "masked"}));
    }
}

TEST_CASE("CommandModule input validation", "[Module]") {
    auto descriptor = commandDescriptor("rename");
    descriptor.inputs = {InputSpec{"Name", {}, "[a-z]+", {}, {}}};
    descriptor.inputOffset = 1;
    TestCommand command(descriptor);

    SECTION("Missing inputs are counted") {
        REQUIRE(command.validateInput({"unit"}) == 1);
        REQUIRE(command.validateInput({}) == 1);
    }

    SECTION("Valid input completes the params") {
        REQUIRE(command.validateInput({"unit", "alpha"}) == 0);
    }

    SECTION("Rejected input throws ValidationError") {
        REQUIRE_THROWS_AS(command.validateInput({"unit", "Alpha1"}), ValidationError);
    }

    SECTION("validator setting replaces the first input's pattern") {
        ModuleConfig config;
        config.settings["validator"] = "[0-9]+";

        auto inputs = command.effectiveInputs(config);
        REQUIRE(inputs.front().validator == "[0-9]+");
        REQUIRE(command.validateInput({"unit", "42"}, config) == 0);
        REQUIRE_THROWS_AS(command.validateInput({"unit", "alpha"}, config), ValidationError);
    }

    SECTION("Capabilities follow the descriptor") {
        auto caps = command.descriptor().capabilities();
        REQUIRE(caps.requiresInput);
        REQUIRE_FALSE(caps.requiresConfirmation);
    }
}

TEST_CASE("ModuleContext helpers", "[Module]") {
    ModuleContext context;
    context.params = {"first"};
    context.hostSettings = {"use_sudo"};
    context.config.settings["warning_threshold"] = "80";
    context.config.settings["broken"] = "80x";

    REQUIRE(context.useSudo());
    REQUIRE(context.param(0) == "first");
    REQUIRE(context.param(3, "fallback") == "fallback");
    REQUIRE(context.numericSetting("warning_threshold", 0.0) == 80.0);
    REQUIRE(context.numericSetting("missing", 5.0) == 5.0);
    REQUIRE_THROWS_AS(context.numericSetting("broken", 0.0), ValidationError);
}

TEST_CASE("Text helpers", "[Module]") {
    REQUIRE(trimmed("  value \n") == "value");
    REQUIRE(trimmed(" \t ").empty());

    auto lines = splitLines("one\r\ntwo\n");
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0] == "one");
    REQUIRE(lines[1] == "two");

    auto fields = splitFields("  /dev/sda1   100  50 ");
    REQUIRE(fields.size() == 3);
    REQUIRE(fields[2] == "50");
}
