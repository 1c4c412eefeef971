#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "infrastructure/modules/builtin/DockerComposeModules.hpp"
#include "infrastructure/modules/builtin/HostCommands.hpp"
#include "infrastructure/modules/builtin/SystemdModules.hpp"

using namespace hostkeeper::core;
using namespace hostkeeper::infra::builtin;

namespace {

ModuleContext contextWith(std::vector<std::string> params, bool sudo = false) {
    ModuleContext context;
    context.hostId = "web-1";
    context.params = std::move(params);
    if (sudo) {
        context.hostSettings = {"use_sudo"};
    }
    return context;
}

ExecutionOutput outputOf(const std::string& stdoutText, const std::string& stderrText = {}) {
    ExecutionOutput output;
    output.stdoutText = stdoutText;
    output.stderrText = stderrText;
    return output;
}

} // namespace

TEST_CASE("SystemdServiceCommand", "[CommandModules][Systemd]") {
    SystemdServiceCommand restart(SystemdServiceCommand::Action::Restart);
    SystemdServiceCommand start(SystemdServiceCommand::Action::Start);

    SECTION("Builds systemctl calls") {
        REQUIRE(restart.buildCommand(contextWith({"nginx.service"})) == "systemctl restart nginx.service");
        REQUIRE(start.buildCommand(contextWith({"getty@tty1.service"}, true)) ==
                "sudo systemctl start getty@tty1.service");
    }

    SECTION("Rejects unit names that could carry options or shell syntax") {
        REQUIRE_THROWS_AS(restart.buildCommand(contextWith({"--now"})), ValidationError);
        REQUIRE_THROWS_AS(restart.buildCommand(contextWith({"a;reboot"})), ValidationError);
        REQUIRE_THROWS_AS(restart.buildCommand(contextWith({})), ValidationError);
    }

    SECTION("Child command of the service monitor") {
        const auto& display = restart.descriptor().display;
        REQUIRE(restart.id() == "systemd-service-restart");
        REQUIRE(display.parentId == "systemd-service");
        REQUIRE(display.multivalueLevel == 1);
        REQUIRE(display.acceptsTags({"active"}));
        REQUIRE_FALSE(display.acceptsTags({"failed"}));

        const auto& startDisplay = start.descriptor().display;
        REQUIRE(startDisplay.acceptsTags({"failed"}));
        REQUIRE_FALSE(startDisplay.acceptsTags({"inactive", "masked"}));
    }

    SECTION("Output becomes a warning, silence means success") {
        auto context = contextWith({"nginx.service"});
        auto done = restart.parse(outputOf(""), context);
        REQUIRE(done.message() == "Restart nginx.service: done");
        REQUIRE(done.criticality() == Criticality::Normal);

        auto noisy = restart.parse(outputOf("Warning: unit file changed on disk\n"), context);
        REQUIRE(noisy.criticality() == Criticality::Warning);
        REQUIRE(noisy.message() == "Warning: unit file changed on disk");
    }
}

TEST_CASE("LogsCommand", "[CommandModules][Logs]") {
    LogsCommand logs;

    SECTION("Default is the newest page of all entries") {
        REQUIRE(logs.buildCommand(contextWith({})) == "journalctl -q -n 400 | head -n 400");
        REQUIRE(logs.buildCommand(contextWith({"all"})) == "journalctl -q -n 400 | head -n 400");
    }

    SECTION("Unit, pattern and paging") {
        REQUIRE(logs.buildCommand(contextWith({"nginx.service", "error", "2", "50"}, true)) ==
                "sudo journalctl -q -n 100 -u nginx.service -g error | head -n 50");
    }

    SECTION("Kernel ring buffer") {
        REQUIRE(logs.buildCommand(contextWith({"dmesg"})) == "journalctl -q -n 400 --dmesg | head -n 400");
    }

    SECTION("Patterns are quoted") {
        REQUIRE(logs.buildCommand(contextWith({"", "out of memory"})) ==
                "journalctl -q -n 400 -g 'out of memory' | head -n 400");
    }

    SECTION("Invalid paging and targets") {
        REQUIRE_THROWS_AS(logs.buildCommand(contextWith({"", "", "0"})), ValidationError);
        REQUIRE_THROWS_AS(logs.buildCommand(contextWith({"", "", "1", "many"})), ValidationError);
        REQUIRE_THROWS_AS(logs.buildCommand(contextWith({"bad unit"})), ValidationError);
    }

    SECTION("Paging is bounded") {
        REQUIRE(logs.buildCommand(contextWith({"all", "", "1000", "10000"})) ==
                "journalctl -q -n 10000000 | head -n 10000");
        REQUIRE_THROWS_AS(logs.buildCommand(contextWith({"all", "", "2000000000", "100"})), ValidationError);
        REQUIRE_THROWS_AS(logs.buildCommand(contextWith({"all", "", "1001"})), ValidationError);
        REQUIRE_THROWS_AS(logs.buildCommand(contextWith({"all", "", "1", "10001"})), ValidationError);
        REQUIRE_THROWS_AS(logs.buildCommand(contextWith({"all", "", "99999999999"})), ValidationError);
    }

    SECTION("Opens a text view and keeps the raw output") {
        REQUIRE(logs.descriptor().opensTextView);
        REQUIRE_FALSE(logs.descriptor().showInNotification);
        REQUIRE(logs.parse(outputOf("line 1\nline 2\n"), contextWith({})).message() == "line 1\nline 2\n");
    }
}

TEST_CASE("PowerCommand", "[CommandModules][Power]") {
    PowerCommand reboot(PowerCommand::Action::Reboot);
    PowerCommand shutdown(PowerCommand::Action::Shutdown);

    REQUIRE(reboot.buildCommand(contextWith({})) == "shutdown -r now");
    REQUIRE(shutdown.buildCommand(contextWith({}, true)) == "sudo shutdown -P now");

    REQUIRE(reboot.descriptor().confirmationText == "Reboot the host?");
    REQUIRE(reboot.descriptor().capabilities().requiresConfirmation);
    REQUIRE_FALSE(reboot.descriptor().idempotent);
    REQUIRE_FALSE(shutdown.descriptor().idempotent);
}

TEST_CASE("PackagesUpdateCommand", "[CommandModules][Packages]") {
    PackagesUpdateCommand update;
    auto context = contextWith({});
    context.facts.osFamily = "linux";

    SECTION("apt") {
        context.facts.subsystems = {"apt"};
        REQUIRE(update.buildCommand(context) == "apt-get -q update && apt-get -q -y upgrade");
    }

    SECTION("dnf with sudo") {
        context.facts.subsystems = {"dnf"};
        context.hostSettings = {"use_sudo"};
        REQUIRE(update.buildCommand(context) == "sudo dnf -y upgrade");
    }

    SECTION("No package manager") {
        REQUIRE_THROWS_AS(update.buildCommand(context), ValidationError);
        REQUIRE_FALSE(update.appliesTo(context.facts));
    }

    SECTION("Requires confirmation and opens details") {
        REQUIRE(update.descriptor().capabilities().requiresConfirmation);
        REQUIRE(update.descriptor().opensDetails);
    }
}

TEST_CASE("SetHostnameCommand", "[CommandModules][Hostname]") {
    SetHostnameCommand setHostname;

    SECTION("Valid host names") {
        REQUIRE(setHostname.buildCommand(contextWith({"web-01.example.com"})) ==
                "hostnamectl set-hostname web-01.example.com");
        REQUIRE(setHostname.buildCommand(contextWith({"db1"}, true)) == "sudo hostnamectl set-hostname db1");
    }

    SECTION("Invalid host names") {
        REQUIRE_THROWS_AS(setHostname.buildCommand(contextWith({"bad_name"})), ValidationError);
        REQUIRE_THROWS_AS(setHostname.buildCommand(contextWith({"-leading"})), ValidationError);
        REQUIRE_THROWS_AS(setHostname.buildCommand(contextWith({})), ValidationError);
    }

    SECTION("Asks for the host name") {
        REQUIRE(setHostname.descriptor().capabilities().requiresInput);
        REQUIRE(setHostname.validateInput({}) == 1);
        REQUIRE(setHostname.validateInput({"web-02"}) == 0);
        REQUIRE_THROWS_AS(setHostname.validateInput({"no spaces"}), ValidationError);
    }

    SECTION("validator setting replaces the host name pattern") {
        auto context = contextWith({"bad_name"});
        context.config.settings["validator"] = "[a-z_]+";
        REQUIRE(setHostname.buildCommand(context) == "hostnamectl set-hostname bad_name");
        REQUIRE(setHostname.validateInput({"bad_name"}, context.config) == 0);
    }
}

TEST_CASE("DockerComposeCommand", "[CommandModules][DockerCompose]") {
    DockerComposeCommand up(DockerComposeCommand::Action::Up);
    DockerComposeCommand restart(DockerComposeCommand::Action::Restart);
    DockerComposeCommand logs(DockerComposeCommand::Action::Logs);

    const std::string composeFile = "/srv/web/docker-compose.yml";

    SECTION("Project level up") {
        REQUIRE(up.buildCommand(contextWith({composeFile, "web"})) ==
                "docker compose -f /srv/web/docker-compose.yml up -d");
        REQUIRE(up.descriptor().display.multivalueLevel == 1);
    }

    SECTION("Legacy binary") {
        auto context = contextWith({composeFile, "web"});
        context.config.settings["legacy_binary"] = "true";
        REQUIRE(up.buildCommand(context) == "docker-compose -f /srv/web/docker-compose.yml up -d");
    }

    SECTION("Service level restart and logs") {
        REQUIRE(restart.buildCommand(contextWith({composeFile, "app"}, true)) ==
                "sudo docker compose -f /srv/web/docker-compose.yml restart app");
        REQUIRE(logs.buildCommand(contextWith({composeFile, "app"})) ==
                "docker compose -f /srv/web/docker-compose.yml logs --no-color -t --tail 400 app");
        REQUIRE(restart.descriptor().display.multivalueLevel == 2);
        REQUIRE(logs.descriptor().opensTextView);
    }

    SECTION("Parameter validation") {
        REQUIRE_THROWS_AS(up.buildCommand(contextWith({"docker-compose.yml"})), ValidationError);
        REQUIRE_THROWS_AS(restart.buildCommand(contextWith({composeFile})), ValidationError);
    }

    SECTION("Log prefixes are stripped") {
        auto result = logs.parse(outputOf("app-1  | 2024-01-01T00:00:00Z hello\napp-1  | world\n"),
                                 contextWith({composeFile, "app"}));
        REQUIRE(result.message() == "2024-01-01T00:00:00Z hello\nworld\n");
    }

    SECTION("Compose progress output goes to stderr") {
        auto result = restart.parse(outputOf("", " Container web-app-1  Restarting\n"),
                                    contextWith({composeFile, "app"}));
        REQUIRE(result.message() == "Container web-app-1  Restarting");
    }
}
