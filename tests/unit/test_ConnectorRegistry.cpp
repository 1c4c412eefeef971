#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "infrastructure/connectors/ConnectorRegistry.hpp"
#include "support/FakeConnector.hpp"

#include <thread>

using namespace hostkeeper::core;
using namespace hostkeeper::infra;
using namespace hostkeeper::testing;

namespace {

ConnectorConfig hostConfig(const std::string& hostId, const std::string& address, int timeoutSeconds = 1) {
    ConnectorConfig config;
    config.hostId = hostId;
    config.address = address;
    config.connectTimeoutSeconds = timeoutSeconds;
    return config;
}

} // namespace

TEST_CASE("ConnectorRegistry session pooling", "[ConnectorRegistry]") {
    auto connector = std::make_shared<FakeConnector>();
    ConnectorRegistry registry(2);
    registry.registerConnector(connector);
    registry.configure("web-1", hostConfig("web-1", "10.0.0.5"));

    REQUIRE(registry.hasConnector("ssh"));
    REQUIRE(registry.config("web-1")->address == "10.0.0.5");

    SECTION("Released sessions are reused") {
        {
            auto lease = registry.acquireSession("web-1");
            REQUIRE(lease.valid());
            REQUIRE(registry.leasedSessions("web-1") == 1);
        }
        REQUIRE(registry.idleSessions("web-1") == 1);
        REQUIRE(registry.leasedSessions("web-1") == 0);

        auto lease = registry.acquireSession("web-1");
        REQUIRE(connector->opened() == 1);
    }

    SECTION("Executes commands on the leased session") {
        auto lease = registry.acquireSession("web-1");
        auto output = registry.execute(lease, "uptime -s", std::chrono::seconds(5));
        REQUIRE(output.stdoutText == "2024-01-01 00:00:00\n");
        REQUIRE(connector->commands() == std::vector<std::string>{"uptime -s"});
    }

    SECTION("At most poolSize sessions per host") {
        auto first = registry.acquireSession("web-1");
        auto second = registry.acquireSession("web-1");
        REQUIRE(connector->opened() == 2);

        REQUIRE_THROWS_AS(registry.acquireSession("web-1"), ConnectionError);
    }

    SECTION("A waiting acquire gets the next released session") {
        auto first = registry.acquireSession("web-1");
        auto second = registry.acquireSession("web-1");

        std::thread releaser([lease = std::move(first)]() mutable {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            SessionLease released = std::move(lease);
        });

        auto third = registry.acquireSession("web-1");
        releaser.join();

        REQUIRE(third.valid());
        REQUIRE(connector->opened() == 2);
    }

    SECTION("Connection errors discard the session") {
        connector->setHandler([](const std::string&, const std::string&) -> ExecutionOutput {
            throw ConnectionError("connection reset");
        });

        {
            auto lease = registry.acquireSession("web-1");
            REQUIRE_THROWS_AS(registry.execute(lease, "true", std::chrono::seconds(1)), ConnectionError);
        }
        REQUIRE(registry.idleSessions("web-1") == 0);
        REQUIRE(registry.leasedSessions("web-1") == 0);
    }

    SECTION("Execution errors keep the session") {
        connector->setHandler([](const std::string&, const std::string&) -> ExecutionOutput {
            throw ExecutionError("exit 1", 1, "", "failed");
        });

        {
            auto lease = registry.acquireSession("web-1");
            REQUIRE_THROWS_AS(registry.execute(lease, "false", std::chrono::seconds(1)), ExecutionError);
        }
        REQUIRE(registry.idleSessions("web-1") == 1);
    }

    SECTION("invalidate closes idle sessions and retires leased ones") {
        auto leased = registry.acquireSession("web-1");
        {
            auto idle = registry.acquireSession("web-1");
        }
        REQUIRE(registry.idleSessions("web-1") == 1);

        registry.invalidate("web-1");
        REQUIRE(registry.idleSessions("web-1") == 0);

        leased = SessionLease();
        REQUIRE(registry.idleSessions("web-1") == 0);
        REQUIRE(registry.leasedSessions("web-1") == 0);
    }

    SECTION("Changed configuration invalidates sessions, the same one does not") {
        {
            auto lease = registry.acquireSession("web-1");
        }
        registry.configure("web-1", hostConfig("web-1", "10.0.0.5"));
        REQUIRE(registry.idleSessions("web-1") == 1);

        registry.configure("web-1", hostConfig("web-1", "10.0.0.6"));
        REQUIRE(registry.idleSessions("web-1") == 0);
    }
}

TEST_CASE("ConnectorRegistry failures", "[ConnectorRegistry]") {
    auto connector = std::make_shared<FakeConnector>();
    ConnectorRegistry registry(1);
    registry.registerConnector(connector);

    SECTION("Unconfigured host") {
        REQUIRE_THROWS_AS(registry.acquireSession("ghost"), ConnectionError);
    }

    SECTION("Unknown connector") {
        auto config = hostConfig("web-1", "10.0.0.5");
        config.connectorId = "telnet";
        registry.configure("web-1", config);
        REQUIRE_THROWS_AS(registry.acquireSession("web-1"), ConnectionError);
    }

    SECTION("Open failures free the slot") {
        registry.configure("web-1", hostConfig("web-1", "10.0.0.5"));
        connector->setFailOpen(true);
        REQUIRE_THROWS_AS(registry.acquireSession("web-1"), ConnectionError);

        connector->setFailOpen(false);
        REQUIRE(registry.acquireSession("web-1").valid());
    }

    SECTION("Removed hosts drop their pool") {
        registry.configure("web-1", hostConfig("web-1", "10.0.0.5"));
        {
            auto lease = registry.acquireSession("web-1");
        }
        registry.remove("web-1");

        REQUIRE_FALSE(registry.config("web-1").has_value());
        REQUIRE(registry.idleSessions("web-1") == 0);
        REQUIRE_THROWS_AS(registry.acquireSession("web-1"), ConnectionError);
    }

    SECTION("A lease outliving its host's removal is closed on release") {
        registry.configure("web-1", hostConfig("web-1", "10.0.0.5"));
        auto lease = registry.acquireSession("web-1");
        registry.remove("web-1");
        registry.configure("web-1", hostConfig("web-1", "10.0.0.5"));

        lease = SessionLease();
        REQUIRE(registry.idleSessions("web-1") == 0);
        REQUIRE(registry.acquireSession("web-1").valid());
    }
}
