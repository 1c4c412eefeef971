#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "infrastructure/config/ConfigResolver.hpp"
#include "support/TestDefinitions.hpp"

#include <algorithm>

using namespace hostkeeper::core;
using namespace hostkeeper::infra;
using namespace hostkeeper::testing;

namespace {

SettingsLayer sshPort(const std::string& port) {
    SettingsLayer layer;
    layer.connectors["ssh"] = moduleConfig({{"port", port}});
    return layer;
}

GroupDefinition group(const std::string& name, SettingsLayer settings,
                      std::vector<std::string> templates = {}) {
    GroupDefinition g;
    g.name = name;
    g.settings = std::move(settings);
    g.templates = std::move(templates);
    return g;
}

TemplateDefinition templateDefinition(const std::string& name, SettingsLayer settings) {
    TemplateDefinition t;
    t.name = name;
    t.settings = std::move(settings);
    return t;
}

std::string portOf(const EffectiveConfig& config) {
    const auto* ssh = config.connector("ssh");
    return ssh ? ssh->setting("port") : std::string{};
}

} // namespace

TEST_CASE("ConfigResolver layer precedence", "[ConfigResolver]") {
    DefinitionStore store;
    Definitions definitions;
    definitions.templates["base"] = templateDefinition("base", sshPort("1"));
    definitions.groups["web"] = group("web", sshPort("2"), {"base"});

    SECTION("Host overrides beat groups, groups beat templates") {
        definitions.hosts["web-1"] = hostDefinition("web-1", "10.0.0.1", {"web"}, sshPort("3"));
        store.set(definitions);
        ConfigResolver resolver(store.source());
        resolver.reloadAll();

        REQUIRE(portOf(resolver.resolve("web-1")) == "3");
    }

    SECTION("Group beats its template") {
        definitions.hosts["web-1"] = hostDefinition("web-1", "10.0.0.1", {"web"});
        store.set(definitions);
        ConfigResolver resolver(store.source());
        resolver.reloadAll();

        REQUIRE(portOf(resolver.resolve("web-1")) == "2");
    }

    SECTION("Template values reach the host when nothing overrides them") {
        definitions.groups["web"] = group("web", {}, {"base"});
        definitions.hosts["web-1"] = hostDefinition("web-1", "10.0.0.1", {"web"});
        store.set(definitions);
        ConfigResolver resolver(store.source());
        resolver.reloadAll();

        REQUIRE(portOf(resolver.resolve("web-1")) == "1");
    }
}

TEST_CASE("ConfigResolver group tie-break", "[ConfigResolver]") {
    DefinitionStore store;
    Definitions definitions;
    definitions.groups["g1"] = group("g1", sshPort("5"));
    definitions.groups["g2"] = group("g2", sshPort("10"));
    definitions.hosts["db-1"] = hostDefinition("db-1", "10.0.0.2", {"g1", "g2"});
    store.set(definitions);

    SECTION("last_wins takes the later group") {
        ConfigResolver resolver(store.source(), GroupMergeOrder::LastWins);
        resolver.reloadAll();
        REQUIRE(portOf(resolver.resolve("db-1")) == "10");
    }

    SECTION("first_wins takes the earlier group") {
        ConfigResolver resolver(store.source(), GroupMergeOrder::FirstWins);
        resolver.reloadAll();
        REQUIRE(portOf(resolver.resolve("db-1")) == "5");
    }

    SECTION("Merge order parsing") {
        REQUIRE(groupMergeOrderFromString("first_wins") == GroupMergeOrder::FirstWins);
        REQUIRE(groupMergeOrderFromString("last_wins") == GroupMergeOrder::LastWins);
        REQUIRE(groupMergeOrderFromString("whatever") == GroupMergeOrder::LastWins);
    }
}

TEST_CASE("ConfigResolver mergeLayers", "[ConfigResolver]") {
    SettingsLayer base;
    base.monitors["memory"] = moduleConfig({{"warning_threshold", "80"}, {"error_threshold", "90"}});
    base.monitors["memory"].isCritical = true;
    base.hostSettings = {"use_sudo"};

    SettingsLayer overlay;
    overlay.monitors["memory"] = moduleConfig({{"warning_threshold", "70"}});
    overlay.monitors["memory"].enabled = false;
    overlay.hostSettings = {"use_sudo", "no_cache"};

    auto merged = ConfigResolver::mergeLayers(base, overlay);
    const auto& memory = merged.monitors.at("memory");

    REQUIRE(memory.setting("warning_threshold") == "70");
    REQUIRE(memory.setting("error_threshold") == "90");
    REQUIRE_FALSE(memory.isEnabled());
    REQUIRE(memory.isCritical == true);
    REQUIRE(merged.hostSettings == std::vector<std::string>{"use_sudo", "no_cache"});
}

TEST_CASE("ConfigResolver validation", "[ConfigResolver]") {
    DefinitionStore store;
    Definitions valid;
    valid.groups["web"] = group("web", sshPort("22"));
    valid.hosts["web-1"] = hostDefinition("web-1", "10.0.0.1", {"web"});
    store.set(valid);

    ConfigResolver resolver(store.source());
    resolver.reloadAll();
    const auto generation = resolver.snapshot()->generation;

    SECTION("Unknown groups are listed and the previous snapshot stays active") {
        auto broken = valid;
        broken.hosts["web-2"] = hostDefinition("web-2", "10.0.0.3", {"missing-b", "web"});
        broken.hosts["web-3"] = hostDefinition("web-3", "10.0.0.4", {"missing-a"});
        store.set(broken);

        try {
            resolver.reloadAll();
            FAIL("reloadAll should have thrown");
        } catch (const ConfigError& e) {
            REQUIRE(std::string(e.what()) == "Invalid group references: missing-a, missing-b");
        }

        REQUIRE(resolver.snapshot()->generation == generation);
        REQUIRE(resolver.hostIds() == std::vector<std::string>{"web-1"});
    }

    SECTION("Unknown template reference is rejected") {
        auto broken = valid;
        broken.groups["web"].templates = {"nope"};
        store.set(broken);

        REQUIRE_THROWS_AS(resolver.reloadAll(), ConfigError);
    }

    SECTION("Malformed validator pattern is rejected") {
        auto broken = valid;
        broken.hosts["web-1"].overrides.commands["set-hostname"] = moduleConfig({{"validator", "[a-z"}});
        store.set(broken);

        REQUIRE_THROWS_AS(resolver.reloadAll(), ConfigError);
    }

    SECTION("Addresses that look like options are rejected") {
        auto broken = valid;
        broken.hosts["web-2"] = hostDefinition("web-2", "-oProxyCommand=sh");
        store.set(broken);

        REQUIRE_THROWS_AS(resolver.reloadAll(), ConfigError);
        REQUIRE(resolver.hostIds() == std::vector<std::string>{"web-1"});
    }

    SECTION("Unknown host cannot be resolved") {
        REQUIRE_THROWS_AS(resolver.resolve("ghost"), ConfigError);
    }
}

TEST_CASE("ConfigResolver change detection", "[ConfigResolver]") {
    DefinitionStore store;
    store.addHost(hostDefinition("a", "10.0.0.1"));
    store.addHost(hostDefinition("b", "10.0.0.2"));

    ConfigResolver resolver(store.source());

    std::vector<std::vector<std::string>> notifications;
    resolver.addChangeListener([&](const std::vector<std::string>& changed) { notifications.push_back(changed); });

    auto first = resolver.reloadAll();
    std::sort(first.begin(), first.end());
    REQUIRE(first == std::vector<std::string>{"a", "b"});
    REQUIRE(notifications.size() == 1);

    SECTION("Unchanged definitions report nothing and do not notify") {
        REQUIRE(resolver.reloadAll().empty());
        REQUIRE(notifications.size() == 1);
    }

    SECTION("Modified, added and removed hosts are reported") {
        store.addHost(hostDefinition("a", "10.0.0.1", {}, enabling({"memory"})));
        store.removeHost("b");
        store.addHost(hostDefinition("c", "10.0.0.3"));

        auto changed = resolver.reloadAll();
        std::sort(changed.begin(), changed.end());
        REQUIRE(changed == std::vector<std::string>{"a", "b", "c"});
        REQUIRE(notifications.size() == 2);
        REQUIRE(resolver.resolve("a").monitor("memory") != nullptr);
    }

    SECTION("Removed listeners are not called") {
        ConfigResolver other(store.source());
        int calls = 0;
        int id = other.addChangeListener([&](const std::vector<std::string>&) { ++calls; });
        other.removeChangeListener(id);
        other.reloadAll();
        REQUIRE(calls == 0);
    }
}
