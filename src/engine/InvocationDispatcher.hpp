/**
 * @file InvocationDispatcher.hpp
 * @brief Asynchronous, per-host concurrency bounded execution of module invocations.
 */

#pragma once

#include "core/types/CommandResult.hpp"
#include "core/types/EngineEvent.hpp"
#include "core/types/HostFacts.hpp"
#include "core/types/Invocation.hpp"
#include "core/types/MonitorDataPoint.hpp"
#include "infrastructure/cache/CriticalityTracker.hpp"
#include "infrastructure/cache/HostStateCache.hpp"
#include "infrastructure/config/ConfigResolver.hpp"
#include "infrastructure/connectors/ConnectorRegistry.hpp"
#include "infrastructure/events/EventBus.hpp"
#include "infrastructure/modules/ModuleRegistry.hpp"
#include "infrastructure/runtime/AsioContext.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace hostkeeper::engine {

/**
 * @brief Tunables of the dispatcher, taken from the engine and cache sections of config.json.
 */
struct DispatcherSettings {
    size_t maxInFlightPerHost{2};
    std::chrono::milliseconds commandTimeout{std::chrono::seconds(30)};
    std::chrono::milliseconds retryBackoff{500};
    bool provideInitialValue{true};                          ///< Replay cached data on initialization
    std::chrono::seconds initialValueTimeToLive{604800};     ///< Older cache entries are not replayed
    std::chrono::seconds cacheTimeToLive{300};               ///< Freshness limit of cachedRefreshCategory
};

/**
 * @brief Turns (host, module, params) requests into asynchronous remote executions.
 *
 * Every request gets an invocation id immediately. Execution happens on the
 * AsioContext worker pool, at most DispatcherSettings::maxInFlightPerHost at a
 * time per host, the rest waiting in a FIFO queue. Every invocation completes
 * with exactly one published outcome (monitoring_data_received or
 * command_result_received) unless it was cancelled.
 *
 * A ConnectionError is retried once after the backoff with a fresh session.
 * The second failure marks the host Unreachable and fails everything queued
 * for it. Commands flagged non-idempotent are only retried when the failure
 * happened before the command was sent.
 *
 * All bookkeeping lives behind one mutex that is never held while talking to
 * a host, the cache or the event bus.
 *
 * @note The AsioContext must be stopped before the dispatcher is destroyed.
 */
class InvocationDispatcher {
public:
    static constexpr const char* PlatformMonitorId = "platform-info";
    static constexpr int MaxConnectionRetries = 1;

    InvocationDispatcher(infra::ConfigResolver& resolver, infra::ConnectorRegistry& connectors,
                         infra::ModuleRegistry& modules, infra::HostStateCache& cache,
                         infra::CriticalityTracker& tracker, infra::EventBus& events,
                         infra::AsioContext& context, DispatcherSettings settings = {});
    ~InvocationDispatcher();

    InvocationDispatcher(const InvocationDispatcher&) = delete;
    InvocationDispatcher& operator=(const InvocationDispatcher&) = delete;

    /**
     * @brief Starts (or restarts) the initialization of a host.
     *
     * With usable cached data the host becomes InitializedFromCache and the
     * cached values are replayed under fresh invocation ids before the live
     * refresh starts. The live refresh runs platform-info first, then every
     * applicable monitor; host_initialized follows the last of them.
     *
     * @return Ids of the replayed cache entries followed by the platform-info
     *         invocation. Empty if an initialization is already in progress.
     */
    std::vector<core::InvocationId> initializeHost(const std::string& hostId);

    /**
     * @brief Requests a module execution.
     *
     * Commands needing confirmation are held until confirmExecution(). Commands
     * with missing input publish input_dialog_opened and are not kept; the
     * caller invokes again with the completed params.
     *
     * @return Invocation id, 0 after stop().
     */
    core::InvocationId invoke(const std::string& hostId, const std::string& moduleId,
                              std::vector<std::string> params = {});

    /**
     * @brief Like invoke() but skips the confirmation step.
     */
    core::InvocationId invokeConfirmed(const std::string& hostId, const std::string& moduleId,
                                       std::vector<std::string> params = {});

    /**
     * @brief Releases an invocation held for confirmation.
     * @return False if no invocation with this id awaits confirmation.
     */
    bool confirmExecution(core::InvocationId id);

    /**
     * @brief Refreshes every applicable monitor of a category, all categories when empty.
     */
    std::vector<core::InvocationId> refreshCategory(const std::string& hostId, const std::string& category);

    /**
     * @brief Serves monitors whose cached value is younger than the cache time-to-live
     *        from the cache and refreshes the rest.
     */
    std::vector<core::InvocationId> cachedRefreshCategory(const std::string& hostId,
                                                          const std::string& category);

    /**
     * @brief Best-effort cancellation.
     *
     * A started remote command keeps running; only its result is suppressed
     * and its slot is handed to the next queued invocation.
     *
     * @return False if the invocation is unknown or already completed.
     */
    bool cancel(core::InvocationId id);

    /**
     * @brief Drops queued, held and queued-for-retry work of a host, e.g. after it was removed.
     */
    void dropHost(const std::string& hostId);

    /**
     * @brief Rejects new work and cancels every invocation. Does not wait.
     *
     * Commands already running on a host finish, but their results are dropped.
     */
    void stop();

    bool isStopped() const { return stopped_; }

    /**
     * @brief Ids of enabled, applicable modules of a host.
     */
    std::vector<std::string> applicableModules(const std::string& hostId, const std::string& category,
                                               core::ModuleKind kind) const;

    /**
     * @brief Host level commands (not bound to a monitor row).
     */
    std::vector<std::string> commands(const std::string& hostId) const;

    /**
     * @brief Commands acting on the rows of a multivalue monitor at the given depth.
     */
    std::vector<std::string> childCommands(const std::string& hostId, const std::string& category,
                                           const std::string& monitorId, int level) const;

    std::optional<core::Invocation> invocation(core::InvocationId id) const;
    size_t inFlight(const std::string& hostId) const;
    size_t queued(const std::string& hostId) const;
    bool isInitializing(const std::string& hostId) const;

    const DispatcherSettings& settings() const { return settings_; }

private:
    struct HostQueue {
        std::deque<core::InvocationId> pending;
        size_t inFlight{0};
        bool initializing{false};
        size_t initRemaining{0};  ///< Initialization invocations not yet finished
        bool unreachable{false};  ///< Unreachable error already published
    };

    struct Outcome {
        std::optional<core::MonitorDataPoint> data;
        std::optional<core::HostFacts> facts;
        std::optional<core::CommandResult> result;
        bool connectionLost{false};
        bool retryable{false};
    };

    core::InvocationId nextId() { return nextId_.fetch_add(1); }

    core::InvocationId submit(const std::string& hostId, const std::string& moduleId,
                              std::vector<std::string> params, bool confirmed);
    void enqueue(std::vector<core::Invocation> invocations);
    void enqueueLocked(core::Invocation invocation, std::vector<core::InvocationId>& admitted);
    std::vector<core::InvocationId> admitLocked(const std::string& hostId);
    void dispatch(const std::vector<core::InvocationId>& ids);

    void run(core::InvocationId id);
    Outcome execute(const core::Invocation& invocation);
    void scheduleRetry(const core::Invocation& invocation);
    void finish(const core::Invocation& invocation, Outcome outcome);
    void release(const core::Invocation& invocation, std::vector<core::Invocation> followUps);
    void markUnreachable(const core::Invocation& invocation, const std::string& reason);
    void markReachable(const std::string& hostId);
    void completeInitialization(const std::string& hostId);

    void deliver(const core::Invocation& invocation, const Outcome& outcome);
    void reject(const core::Invocation& invocation, const core::CommandResult& result);
    void publishDialogEvents(const core::Invocation& invocation);

    /**
     * @brief Publishes cached entries under fresh invocation ids.
     * @param onlyMonitors Restricts the replay to these monitors and skips command results.
     */
    std::vector<core::InvocationId> replayCache(const std::string& hostId,
                                                const std::optional<std::set<std::string>>& onlyMonitors = {});
    std::vector<core::Invocation> initialMonitors(const std::string& hostId);
    core::Invocation makeInvocation(const std::string& hostId, const std::string& moduleId,
                                    core::ModuleKind kind, std::vector<std::string> params = {});

    infra::ConfigResolver& resolver_;
    infra::ConnectorRegistry& connectors_;
    infra::ModuleRegistry& modules_;
    infra::HostStateCache& cache_;
    infra::CriticalityTracker& tracker_;
    infra::EventBus& events_;
    infra::AsioContext& context_;
    const DispatcherSettings settings_;

    std::atomic<core::InvocationId> nextId_{1};
    std::atomic<bool> stopped_{false};

    mutable std::mutex mutex_;
    std::map<core::InvocationId, core::Invocation> invocations_;
    std::map<std::string, HostQueue> hosts_;
    std::map<core::InvocationId, std::shared_ptr<asio::steady_timer>> retryTimers_;
};

} // namespace hostkeeper::engine
