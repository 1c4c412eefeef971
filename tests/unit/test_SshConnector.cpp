#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "infrastructure/connectors/ProcessRunner.hpp"
#include "infrastructure/connectors/SshConnector.hpp"

#include <algorithm>
#include <filesystem>

using namespace hostkeeper::core;
using namespace hostkeeper::infra;

namespace {

bool containsPair(const std::vector<std::string>& args, const std::string& flag, const std::string& value) {
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == flag && args[i + 1] == value) {
            return true;
        }
    }
    return false;
}

} // namespace

TEST_CASE("SshConnector argument building", "[SshConnector]") {
    SshSettings settings;
    settings.controlPersistSeconds = 120;

    ConnectorConfig config;
    config.hostId = "web-1";
    config.address = "10.0.0.5";

    SECTION("Defaults") {
        auto args = SshConnector::buildArguments(settings, config, "/run/hk/s1", "uptime -s");

        REQUIRE(containsPair(args, "-o", "BatchMode=yes"));
        REQUIRE(containsPair(args, "-o", "ConnectTimeout=10"));
        REQUIRE(containsPair(args, "-o", "StrictHostKeyChecking=yes"));
        REQUIRE(containsPair(args, "-o", "ControlMaster=auto"));
        REQUIRE(containsPair(args, "-o", "ControlPath=/run/hk/s1"));
        REQUIRE(containsPair(args, "-o", "ControlPersist=120"));
        REQUIRE(containsPair(args, "-p", "22"));
        REQUIRE(std::find(args.begin(), args.end(), "-l") == args.end());
        REQUIRE(std::find(args.begin(), args.end(), "-i") == args.end());

        REQUIRE(args[args.size() - 3] == "--");
        REQUIRE(args[args.size() - 2] == "10.0.0.5");
        REQUIRE(args.back() == "uptime -s");
    }

    SECTION("Options end before the destination") {
        config.address = "-oProxyCommand=touch /tmp/x";
        auto args = SshConnector::buildArguments(settings, config, "/run/hk/s3", "true");

        auto separator = std::find(args.begin(), args.end(), "--");
        REQUIRE(separator != args.end());
        REQUIRE(*(separator + 1) == "-oProxyCommand=touch /tmp/x");
        REQUIRE(std::find(args.begin(), separator, "-oProxyCommand=touch /tmp/x") == separator);
    }

    SECTION("Credentials, port and extra options") {
        settings.strictHostKeyChecking = false;
        config.port = 2222;
        config.username = "ops";
        config.identityFile = "/keys/id_ed25519";
        config.connectTimeoutSeconds = 3;
        config.options = {{"ssh_option.Compression", "yes"}, {"jump_host", "ignored"}};

        auto args = SshConnector::buildArguments(settings, config, "/run/hk/s2", "true");

        REQUIRE(containsPair(args, "-p", "2222"));
        REQUIRE(containsPair(args, "-l", "ops"));
        REQUIRE(containsPair(args, "-i", "/keys/id_ed25519"));
        REQUIRE(containsPair(args, "-o", "IdentitiesOnly=yes"));
        REQUIRE(containsPair(args, "-o", "ConnectTimeout=3"));
        REQUIRE(containsPair(args, "-o", "StrictHostKeyChecking=no"));
        REQUIRE(containsPair(args, "-o", "Compression=yes"));
        REQUIRE(std::find(args.begin(), args.end(), "ignored") == args.end());
    }
}

TEST_CASE("SshConnector reports transport failures as connection errors", "[SshConnector]") {
    auto controlDir = std::filesystem::temp_directory_path() / "hostkeeper_ssh_test";
    std::filesystem::remove_all(controlDir);

    SshSettings settings;
    settings.binary = "/nonexistent/hostkeeper-ssh";
    settings.controlDir = controlDir;
    SshConnector connector(settings);

    REQUIRE(connector.id() == "ssh");
    REQUIRE(std::filesystem::is_directory(controlDir));

    ConnectorConfig config;
    config.hostId = "web-1";
    config.address = "10.0.0.5";
    config.connectTimeoutSeconds = 1;

    REQUIRE_THROWS_AS(connector.openSession(config), ConnectionError);

    std::filesystem::remove_all(controlDir);
}

TEST_CASE("ProcessRunner", "[ProcessRunner]") {
    SECTION("Captures output and exit status") {
        auto result = ProcessRunner::run("/bin/sh", {"-c", "echo out; echo err >&2; exit 3"}, std::chrono::seconds(5));
        REQUIRE_FALSE(result.success());
        REQUIRE(result.exitCode == 3);
        REQUIRE(result.stdoutText == "out\n");
        REQUIRE(result.stderrText == "err\n");
    }

    SECTION("Missing program") {
        auto result = ProcessRunner::run("/nonexistent/program", {}, std::chrono::seconds(1));
        REQUIRE(result.failedToStart);
    }

    SECTION("Timeout kills the program") {
        auto result = ProcessRunner::run("/bin/sh", {"-c", "sleep 5"}, std::chrono::milliseconds(200));
        REQUIRE(result.timedOut);
    }
}
