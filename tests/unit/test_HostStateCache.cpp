#include <catch2/catch_test_macros.hpp>

#include "infrastructure/cache/HostStateCache.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/HostCacheRepository.hpp"

using namespace hostkeeper::core;
using namespace hostkeeper::infra;

namespace {

class TestDatabase {
public:
    TestDatabase() : db_(std::make_shared<Database>(":memory:")) { db_->runMigrations(); }

    std::shared_ptr<Database> get() { return db_; }

private:
    std::shared_ptr<Database> db_;
};

} // namespace

TEST_CASE("HostStateCache in memory", "[HostStateCache]") {
    HostStateCache cache;

    SECTION("Unknown hosts") {
        REQUIRE_FALSE(cache.snapshot("web-1").has_value());
        REQUIRE(cache.status("web-1") == HostStatus::Uninitialized);
        REQUIRE(cache.aggregate("web-1") == Criticality::NoData);
        REQUIRE_FALSE(cache.hasCachedData("web-1"));
        REQUIRE_FALSE(cache.persistenceEnabled());
    }

    SECTION("Monitor data updates the aggregate") {
        REQUIRE(cache.recordMonitorData("web-1", "memory", MonitorDataPoint::withValue("50")) ==
                Criticality::Normal);
        REQUIRE(cache.recordMonitorData("web-1", "filesystem",
                                        MonitorDataPoint::withValue("95", Criticality::Critical)) ==
                Criticality::Critical);
        REQUIRE(cache.recordMonitorData("web-1", "filesystem", MonitorDataPoint::withValue("40")) ==
                Criticality::Normal);

        REQUIRE(cache.aggregate("web-1") == Criticality::Normal);
        REQUIRE(cache.monitorData("web-1", "filesystem")->value == "40");
        REQUIRE_FALSE(cache.monitorData("web-1", "load").has_value());
    }

    SECTION("Snapshots are copies") {
        cache.setHostInfo("web-1", "10.0.0.5", "web-1.example.com");
        cache.setStatus("web-1", HostStatus::InitializingLive);
        auto snapshot = cache.snapshot("web-1");

        cache.setStatus("web-1", HostStatus::Initialized);

        REQUIRE(snapshot->status == HostStatus::InitializingLive);
        REQUIRE(snapshot->address == "10.0.0.5");
        REQUIRE(cache.status("web-1") == HostStatus::Initialized);
    }

    SECTION("Command results keep the last one per module") {
        cache.recordCommandResult("web-1", "logs", CommandResult::success("first"));
        cache.recordCommandResult("web-1", "logs", CommandResult::success("second"));

        auto snapshot = cache.snapshot("web-1");
        REQUIRE(snapshot->commandResults.size() == 1);
        REQUIRE(snapshot->commandResults.at("logs").message() == "second");
        REQUIRE(cache.hasCachedData("web-1"));
    }

    SECTION("Freshness check") {
        auto old = MonitorDataPoint::withValue("1");
        old.timestamp = std::chrono::system_clock::now() - std::chrono::hours(2);
        cache.recordMonitorData("web-1", "uptime", old);

        REQUIRE(cache.hasCachedData("web-1"));
        REQUIRE_FALSE(cache.hasCachedData("web-1", std::chrono::hours(1)));
    }

    SECTION("Excluding a monitor from the summary recomputes aggregates") {
        cache.recordMonitorData("web-1", "memory", MonitorDataPoint::withValue("50"));
        cache.recordMonitorData("web-1", "lvm-pv", MonitorDataPoint::withValue("", Criticality::Critical));
        REQUIRE(cache.aggregate("web-1") == Criticality::Critical);

        cache.setSummaryExcludedMonitors({"lvm-pv"});
        REQUIRE(cache.aggregate("web-1") == Criticality::Normal);

        cache.recordMonitorData("web-2", "lvm-pv", MonitorDataPoint::withValue("", Criticality::Critical));
        REQUIRE(cache.aggregate("web-2") == Criticality::NoData);
    }

    SECTION("Critical monitors mark the host down") {
        cache.setCriticalMonitors("web-1", {"filesystem"});
        cache.recordMonitorData("web-1", "filesystem", MonitorDataPoint::withValue("99", Criticality::Critical));
        REQUIRE(cache.snapshot("web-1")->isDown());
    }

    SECTION("removeHost forgets the host") {
        cache.recordMonitorData("web-1", "memory", MonitorDataPoint::withValue("50"));
        cache.removeHost("web-1");
        REQUIRE(cache.hostIds().empty());
        REQUIRE(cache.save());
    }
}

TEST_CASE("HostStateCache persistence", "[HostStateCache][Database]") {
    TestDatabase db;
    auto repository = std::make_shared<HostCacheRepository>(db.get());

    HostStateCache cache(repository);
    REQUIRE(cache.persistenceEnabled());

    HostFacts facts;
    facts.osFamily = "linux";
    facts.subsystems = {"systemd"};

    cache.setHostInfo("web-1", "10.0.0.5", "");
    cache.setFacts("web-1", facts);
    cache.setStatus("web-1", HostStatus::Initialized);
    cache.recordMonitorData("web-1", "memory", MonitorDataPoint::withValue("85", Criticality::Warning));
    cache.recordCommandResult("web-1", "logs", CommandResult::success("ok").withInvocation(4, "logs"));
    cache.setHostInfo("empty", "10.0.0.6", "");

    REQUIRE(cache.save());

    SECTION("Hosts without data are not stored") {
        REQUIRE(repository->findAll().size() == 1);
        REQUIRE_FALSE(repository->findById("empty").has_value());
    }

    SECTION("A new cache restores the stored state as cached and uninitialized") {
        HostStateCache restored(repository);
        restored.setCriticalMonitors("web-1", {"memory"});
        REQUIRE(restored.load());

        auto state = restored.snapshot("web-1");
        REQUIRE(state.has_value());
        REQUIRE(state->status == HostStatus::Uninitialized);
        REQUIRE(state->facts.hasSubsystem("systemd"));
        REQUIRE(state->aggregate == Criticality::Warning);
        REQUIRE(state->criticalMonitors == std::set<std::string>{"memory"});

        const auto& memory = state->monitorData.at("memory");
        REQUIRE(memory.value == "85");
        REQUIRE(memory.fromCache);
        REQUIRE(state->commandResults.at("logs").fromCache());
    }

    SECTION("Disabled persistence neither reads nor writes") {
        HostStateCache disabled(repository);
        disabled.setPersistenceEnabled(false);
        REQUIRE(disabled.load());
        REQUIRE(disabled.hostIds().empty());
    }

    SECTION("removeHost deletes the stored row") {
        cache.removeHost("web-1");
        REQUIRE(repository->findAll().empty());
    }
}

TEST_CASE("HostCacheRepository", "[HostStateCache][Database]") {
    TestDatabase db;
    HostCacheRepository repository(db.get());

    REQUIRE(db.get()->schemaVersion() >= 1);

    HostState state;
    state.hostId = "db-1";
    state.monitorData["load"] = MonitorDataPoint::withValue("0.1");
    state.updatedAt = std::chrono::system_clock::now() - std::chrono::hours(48);
    repository.upsert(state);

    state.monitorData["load"] = MonitorDataPoint::withValue("0.2");
    repository.upsert(state);

    REQUIRE(repository.findAll().size() == 1);
    REQUIRE(repository.findById("db-1")->monitorData.at("load").value == "0.2");

    SECTION("Unreadable rows are skipped") {
        db.get()->execute("INSERT INTO host_cache (host_id, data, updated_at) VALUES (?, ?, ?)",
                          std::string("broken"), std::string("{not json"), std::string("2024-01-01 00:00:00"));
        REQUIRE(repository.findAll().size() == 1);
    }

    SECTION("Old rows can be purged") {
        REQUIRE(repository.removeOlderThan(std::chrono::system_clock::now() - std::chrono::hours(24)) == 1);
        REQUIRE(repository.findAll().empty());
    }
}
