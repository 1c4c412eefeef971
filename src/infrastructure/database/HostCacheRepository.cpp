#include "infrastructure/database/HostCacheRepository.hpp"

#include <spdlog/spdlog.h>

#include <ctime>

namespace hostkeeper::infra {

namespace {

std::string timePointToString(const std::chrono::system_clock::time_point& tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
    return buffer;
}

std::optional<core::HostState> parseRow(const std::string& hostId, const std::string& data) {
    try {
        auto state = core::HostState::fromJson(nlohmann::json::parse(data));
        state.hostId = hostId;
        return state;
    } catch (const std::exception& e) {
        spdlog::warn("[{}] Discarding unreadable cache entry: {}", hostId, e.what());
        return std::nullopt;
    }
}

} // namespace

HostCacheRepository::HostCacheRepository(std::shared_ptr<Database> db) : db_(std::move(db)) {}

void HostCacheRepository::upsert(const core::HostState& state) {
    auto stmt = db_->prepare(R"(
        INSERT OR REPLACE INTO host_cache (host_id, data, updated_at)
        VALUES (?, ?, ?)
    )");

    stmt.bind(1, state.hostId);
    stmt.bind(2, state.toJson().dump());
    stmt.bind(3, timePointToString(state.updatedAt));

    stmt.step();
}

void HostCacheRepository::upsertAll(const std::vector<core::HostState>& states) {
    db_->transaction([&]() {
        for (const auto& state : states) {
            upsert(state);
        }
    });
    spdlog::debug("Persisted cache for {} hosts", states.size());
}

void HostCacheRepository::remove(const std::string& hostId) {
    auto stmt = db_->prepare("DELETE FROM host_cache WHERE host_id = ?");
    stmt.bind(1, hostId);
    stmt.step();
}

std::optional<core::HostState> HostCacheRepository::findById(const std::string& hostId) {
    auto stmt = db_->prepare("SELECT data FROM host_cache WHERE host_id = ?");
    stmt.bind(1, hostId);

    if (stmt.step()) {
        return parseRow(hostId, stmt.columnText(0));
    }
    return std::nullopt;
}

std::vector<core::HostState> HostCacheRepository::findAll() {
    std::vector<core::HostState> states;
    auto stmt = db_->prepare("SELECT host_id, data FROM host_cache ORDER BY host_id");

    while (stmt.step()) {
        if (auto state = parseRow(stmt.columnText(0), stmt.columnText(1))) {
            states.push_back(std::move(*state));
        }
    }
    return states;
}

int HostCacheRepository::removeOlderThan(std::chrono::system_clock::time_point cutoff) {
    auto stmt = db_->prepare("DELETE FROM host_cache WHERE updated_at < ?");
    stmt.bind(1, timePointToString(cutoff));
    stmt.step();
    return db_->changes();
}

} // namespace hostkeeper::infra
