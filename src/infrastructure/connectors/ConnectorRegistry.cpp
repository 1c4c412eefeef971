#include "infrastructure/connectors/ConnectorRegistry.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace hostkeeper::infra {

namespace {

void closeSessions(std::vector<std::unique_ptr<core::ISession>>& sessions) {
    for (auto& session : sessions) {
        try {
            session->close();
        } catch (const std::exception& e) {
            spdlog::warn("Failed to close session: {}", e.what());
        }
    }
    sessions.clear();
}

} // namespace

// SessionLease implementation
SessionLease::SessionLease(ConnectorRegistry* registry, std::string hostId,
                           std::unique_ptr<core::ISession> session, uint64_t poolId,
                           uint64_t generation)
    : registry_(registry)
    , hostId_(std::move(hostId))
    , session_(std::move(session))
    , poolId_(poolId)
    , generation_(generation) {}

SessionLease::~SessionLease() {
    release();
}

SessionLease::SessionLease(SessionLease&& other) noexcept
    : registry_(other.registry_)
    , hostId_(std::move(other.hostId_))
    , session_(std::move(other.session_))
    , poolId_(other.poolId_)
    , generation_(other.generation_)
    , discarded_(other.discarded_) {
    other.registry_ = nullptr;
}

SessionLease& SessionLease::operator=(SessionLease&& other) noexcept {
    if (this != &other) {
        release();
        registry_ = other.registry_;
        hostId_ = std::move(other.hostId_);
        session_ = std::move(other.session_);
        poolId_ = other.poolId_;
        generation_ = other.generation_;
        discarded_ = other.discarded_;
        other.registry_ = nullptr;
    }
    return *this;
}

void SessionLease::release() {
    if (registry_ && session_) {
        registry_->release(hostId_, std::move(session_), poolId_, generation_, discarded_);
    }
    registry_ = nullptr;
}

// ConnectorRegistry implementation
ConnectorRegistry::ConnectorRegistry(size_t poolSize) : poolSize_(std::max<size_t>(poolSize, 1)) {}

ConnectorRegistry::~ConnectorRegistry() {
    closeAll();
}

void ConnectorRegistry::registerConnector(std::shared_ptr<core::IConnector> connector) {
    auto connectorId = connector->id();
    std::lock_guard lock(mutex_);
    connectors_[connectorId] = std::move(connector);
    spdlog::debug("Registered connector: {}", connectorId);
}

bool ConnectorRegistry::hasConnector(const std::string& connectorId) const {
    std::lock_guard lock(mutex_);
    return connectors_.contains(connectorId);
}

void ConnectorRegistry::configure(const std::string& hostId, const core::ConnectorConfig& config) {
    std::vector<std::unique_ptr<core::ISession>> stale;
    {
        std::lock_guard lock(mutex_);
        auto [it, inserted] = pools_.try_emplace(hostId);
        auto& pool = it->second;
        if (!inserted && pool.config == config) {
            return;
        }
        if (inserted) {
            pool.id = nextPoolId_++;
        }
        pool.config = config;
        if (!inserted) {
            ++pool.generation;
            stale = std::move(pool.idle);
            pool.idle.clear();
        }
    }
    closeSessions(stale);
    spdlog::debug("[{}] Connector {} configured for {}:{}", hostId, config.connectorId, config.address,
                  config.port);
}

void ConnectorRegistry::remove(const std::string& hostId) {
    std::vector<std::unique_ptr<core::ISession>> stale;
    {
        std::lock_guard lock(mutex_);
        auto it = pools_.find(hostId);
        if (it == pools_.end()) {
            return;
        }
        stale = std::move(it->second.idle);
        pools_.erase(it);
    }
    closeSessions(stale);
    available_.notify_all();
}

std::optional<core::ConnectorConfig> ConnectorRegistry::config(const std::string& hostId) const {
    std::lock_guard lock(mutex_);
    auto it = pools_.find(hostId);
    if (it == pools_.end()) {
        return std::nullopt;
    }
    return it->second.config;
}

SessionLease ConnectorRegistry::acquireSession(const std::string& hostId) {
    std::unique_lock lock(mutex_);

    auto findPool = [this, &hostId]() -> HostPool& {
        auto it = pools_.find(hostId);
        if (it == pools_.end()) {
            throw core::ConnectionError("No connector configured for host " + hostId);
        }
        return it->second;
    };

    auto timeout = std::chrono::seconds(findPool().config.connectTimeoutSeconds);
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        auto& pool = findPool();

        while (!pool.idle.empty()) {
            auto session = std::move(pool.idle.back());
            pool.idle.pop_back();
            if (session->isOpen()) {
                ++pool.leased;
                return SessionLease(this, hostId, std::move(session), pool.id, pool.generation);
            }
        }

        if (pool.leased + pool.opening < poolSize_) {
            auto connectorIt = connectors_.find(pool.config.connectorId);
            if (connectorIt == connectors_.end()) {
                throw core::ConnectionError("Unknown connector: " + pool.config.connectorId);
            }
            auto connector = connectorIt->second;
            auto config = pool.config;
            auto poolId = pool.id;
            auto generation = pool.generation;
            ++pool.opening;
            lock.unlock();

            std::unique_ptr<core::ISession> session;
            try {
                session = connector->openSession(config);
            } catch (...) {
                lock.lock();
                if (auto it = pools_.find(hostId); it != pools_.end() && it->second.id == poolId) {
                    --it->second.opening;
                }
                available_.notify_one();
                throw;
            }

            lock.lock();
            auto it = pools_.find(hostId);
            if (it == pools_.end() || it->second.id != poolId) {
                lock.unlock();
                session->close();
                throw core::ConnectionError("Host " + hostId + " was removed while connecting");
            }
            --it->second.opening;
            ++it->second.leased;
            return SessionLease(this, hostId, std::move(session), poolId, generation);
        }

        if (available_.wait_until(lock, deadline) == std::cv_status::timeout &&
            std::chrono::steady_clock::now() >= deadline) {
            throw core::ConnectionError("Timed out waiting for a free session to " + hostId);
        }
    }
}

core::ExecutionOutput ConnectorRegistry::execute(SessionLease& lease, const std::string& command,
                                                 std::chrono::milliseconds timeout) {
    if (!lease.valid()) {
        throw core::ConnectionError("Invalid session lease");
    }
    try {
        return lease.session().execute(command, timeout);
    } catch (const core::ConnectionError&) {
        lease.discard();
        throw;
    }
}

void ConnectorRegistry::invalidate(const std::string& hostId) {
    std::vector<std::unique_ptr<core::ISession>> stale;
    {
        std::lock_guard lock(mutex_);
        auto it = pools_.find(hostId);
        if (it == pools_.end()) {
            return;
        }
        ++it->second.generation;
        stale = std::move(it->second.idle);
        it->second.idle.clear();
    }
    if (!stale.empty()) {
        spdlog::debug("[{}] Closing {} idle sessions", hostId, stale.size());
    }
    closeSessions(stale);
}

void ConnectorRegistry::closeAll() {
    std::vector<std::unique_ptr<core::ISession>> stale;
    {
        std::lock_guard lock(mutex_);
        for (auto& [hostId, pool] : pools_) {
            ++pool.generation;
            for (auto& session : pool.idle) {
                stale.push_back(std::move(session));
            }
            pool.idle.clear();
        }
    }
    closeSessions(stale);
}

size_t ConnectorRegistry::idleSessions(const std::string& hostId) const {
    std::lock_guard lock(mutex_);
    auto it = pools_.find(hostId);
    return it == pools_.end() ? 0 : it->second.idle.size();
}

size_t ConnectorRegistry::leasedSessions(const std::string& hostId) const {
    std::lock_guard lock(mutex_);
    auto it = pools_.find(hostId);
    return it == pools_.end() ? 0 : it->second.leased;
}

void ConnectorRegistry::release(const std::string& hostId, std::unique_ptr<core::ISession> session,
                                uint64_t poolId, uint64_t generation, bool discarded) {
    {
        std::lock_guard lock(mutex_);
        auto it = pools_.find(hostId);
        if (it != pools_.end() && it->second.id == poolId) {
            auto& pool = it->second;
            if (pool.leased > 0) {
                --pool.leased;
            }
            if (!discarded && generation == pool.generation && session->isOpen()) {
                pool.idle.push_back(std::move(session));
            }
        }
    }
    available_.notify_one();

    if (session) {
        try {
            session->close();
        } catch (const std::exception& e) {
            spdlog::warn("[{}] Failed to close session: {}", hostId, e.what());
        }
    }
}

} // namespace hostkeeper::infra
