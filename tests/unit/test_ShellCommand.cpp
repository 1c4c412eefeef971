#include <catch2/catch_test_macros.hpp>

#include "core/modules/ShellCommand.hpp"

using namespace hostkeeper::core;

TEST_CASE("ShellCommand quoting", "[ShellCommand]") {
    SECTION("Safe arguments are left alone") {
        REQUIRE(ShellCommand::quote("nginx.service") == "nginx.service");
        REQUIRE(ShellCommand::quote("/var/log/syslog") == "/var/log/syslog");
        REQUIRE(ShellCommand::quote("user@host:22") == "user@host:22");
    }

    SECTION("Empty argument becomes an empty quoted string") {
        REQUIRE(ShellCommand::quote("") == "''");
    }

    SECTION("Whitespace and shell syntax are single-quoted") {
        REQUIRE(ShellCommand::quote("my unit") == "'my unit'");
        REQUIRE(ShellCommand::quote("a;rm -rf /") == "'a;rm -rf /'");
        REQUIRE(ShellCommand::quote("$(id)") == "'$(id)'");
    }

    SECTION("Embedded single quotes are escaped") {
        REQUIRE(ShellCommand::quote("it's") == "'it'\\''s'");
    }
}

TEST_CASE("ShellCommand building", "[ShellCommand]") {
    SECTION("Joins arguments with spaces") {
        ShellCommand cmd({"systemctl", "restart", "nginx"});
        REQUIRE(cmd.toString() == "systemctl restart nginx");
    }

    SECTION("sudo prefixes only the first pipeline stage") {
        auto cmd = ShellCommand({"journalctl", "-n", "100"})
                       .useSudoIf(true)
                       .pipeTo(ShellCommand({"tail", "-n", "10"}));
        REQUIRE(cmd.toString() == "sudo journalctl -n 100 | tail -n 10");
    }

    SECTION("useSudoIf(false) keeps the command unchanged") {
        auto cmd = ShellCommand({"df", "-P"}).useSudoIf(false);
        REQUIRE(cmd.toString() == "df -P");
    }

    SECTION("Arguments added later are quoted too") {
        ShellCommand cmd({"hostnamectl", "set-hostname"});
        cmd.argument("bad name");
        REQUIRE(cmd.toString() == "hostnamectl set-hostname 'bad name'");
    }

    SECTION("Default constructed command is empty") {
        ShellCommand cmd;
        REQUIRE(cmd.empty());
        REQUIRE(cmd.toString().empty());
    }
}
