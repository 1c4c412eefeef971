#pragma once

#include "core/services/IConnector.hpp"
#include "core/types/EffectiveConfig.hpp"

#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hostkeeper::infra {

class ConnectorRegistry;

/**
 * @brief Exclusive use of one pooled session.
 *
 * Returns the session to its pool on destruction. A discarded lease closes
 * the session instead.
 */
class SessionLease {
public:
    SessionLease() = default;
    ~SessionLease();

    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;
    SessionLease(SessionLease&& other) noexcept;
    SessionLease& operator=(SessionLease&& other) noexcept;

    [[nodiscard]] bool valid() const { return session_ != nullptr; }
    [[nodiscard]] const std::string& hostId() const { return hostId_; }
    core::ISession& session() { return *session_; }

    /**
     * @brief Marks the session as unusable so it is closed on release.
     */
    void discard() { discarded_ = true; }

private:
    friend class ConnectorRegistry;

    SessionLease(ConnectorRegistry* registry, std::string hostId,
                 std::unique_ptr<core::ISession> session, uint64_t poolId, uint64_t generation);
    void release();

    ConnectorRegistry* registry_{nullptr};
    std::string hostId_;
    std::unique_ptr<core::ISession> session_;
    uint64_t poolId_{0};
    uint64_t generation_{0};
    bool discarded_{false};
};

/**
 * @brief Registered connectors plus a bounded session pool per host.
 *
 * Sessions are created lazily on acquire and reused afterwards. At most
 * poolSize sessions exist per host; further acquires wait up to the host's
 * connect timeout for one to be released.
 */
class ConnectorRegistry {
public:
    explicit ConnectorRegistry(size_t poolSize = 2);
    ~ConnectorRegistry();

    ConnectorRegistry(const ConnectorRegistry&) = delete;
    ConnectorRegistry& operator=(const ConnectorRegistry&) = delete;

    /**
     * @brief Registers a connector under its id, replacing any previous one.
     */
    void registerConnector(std::shared_ptr<core::IConnector> connector);
    bool hasConnector(const std::string& connectorId) const;

    /**
     * @brief Sets how to reach a host. A changed configuration invalidates existing sessions.
     */
    void configure(const std::string& hostId, const core::ConnectorConfig& config);
    void remove(const std::string& hostId);
    std::optional<core::ConnectorConfig> config(const std::string& hostId) const;

    /**
     * @brief Leases a session to the host, opening one if the pool has room.
     * @throws core::ConnectionError if the host is not configured, its connector is
     *         unknown, opening fails, or no session frees up within the connect timeout.
     */
    SessionLease acquireSession(const std::string& hostId);

    /**
     * @brief Runs a command on a leased session.
     *
     * A ConnectionError discards the lease's session before it propagates.
     * @throws core::ConnectionError, core::ExecutionError
     */
    core::ExecutionOutput execute(SessionLease& lease, const std::string& command,
                                  std::chrono::milliseconds timeout);

    /**
     * @brief Closes idle sessions of the host; leased ones are closed when returned.
     */
    void invalidate(const std::string& hostId);

    /**
     * @brief Closes every idle session of every host.
     */
    void closeAll();

    size_t idleSessions(const std::string& hostId) const;
    size_t leasedSessions(const std::string& hostId) const;
    size_t poolSize() const { return poolSize_; }

private:
    friend class SessionLease;

    struct HostPool {
        uint64_t id{0};  ///< Distinguishes a re-added host from its removed predecessor
        core::ConnectorConfig config;
        std::vector<std::unique_ptr<core::ISession>> idle;
        size_t leased{0};
        size_t opening{0};
        uint64_t generation{0};
    };

    void release(const std::string& hostId, std::unique_ptr<core::ISession> session,
                 uint64_t poolId, uint64_t generation, bool discarded);

    const size_t poolSize_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::map<std::string, std::shared_ptr<core::IConnector>> connectors_;
    std::map<std::string, HostPool> pools_;
    uint64_t nextPoolId_{1};
};

} // namespace hostkeeper::infra
