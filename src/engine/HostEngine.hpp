/**
 * @file HostEngine.hpp
 * @brief Facade owning the engine components and exposing the consumer operations.
 */

#pragma once

#include "engine/InvocationDispatcher.hpp"
#include "infrastructure/cache/CriticalityTracker.hpp"
#include "infrastructure/cache/HostStateCache.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/config/ConfigResolver.hpp"
#include "infrastructure/connectors/ConnectorRegistry.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/events/EventBus.hpp"
#include "infrastructure/modules/ModuleRegistry.hpp"
#include "infrastructure/runtime/AsioContext.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hostkeeper::engine {

/**
 * @brief Wires configuration, connectors, modules, cache, events and the dispatcher together.
 *
 * Typical use:
 * @code
 * infra::DefinitionLoader loader(configDir);
 * HostEngine engine(config.config(), [loader] { return loader.load(); }, database);
 * engine.subscribe([](const core::EngineEvent& e) { ... });
 * engine.start();
 * auto id = engine.execute("web-1", "systemd-service-restart", {"nginx.service"});
 * @endcode
 */
class HostEngine {
public:
    /**
     * @param config Engine settings from config.json.
     * @param definitions Source of template, group and host definitions.
     * @param database Cache persistence; without one the cache lives in memory only.
     */
    HostEngine(const infra::EngineConfig& config, infra::ConfigResolver::DefinitionSource definitions,
               std::shared_ptr<infra::Database> database = nullptr);
    ~HostEngine();

    HostEngine(const HostEngine&) = delete;
    HostEngine& operator=(const HostEngine&) = delete;

    /**
     * @brief Adds a transport. Must be called before start(); the ssh connector is added by start() if missing.
     */
    void registerConnector(std::shared_ptr<core::IConnector> connector);

    /**
     * @brief Loads the cache and definitions, starts the worker pool and the periodic timers.
     * @return False if the definitions could not be loaded. The engine runs with no hosts then.
     */
    bool start();

    /**
     * @brief Stops dispatching, saves the cache and joins the workers. Safe to call twice.
     */
    void stop();

    bool isRunning() const { return running_; }

    /**
     * @brief Reloads the definitions and applies the changes to connectors, cache and hosts.
     *
     * Changed hosts are re-initialized while the engine runs; removed hosts are
     * dropped. On a ConfigError the previous configuration stays active.
     */
    bool reconfigure();

    // Consumer operations

    std::vector<core::InvocationId> initializeHost(const std::string& hostId);
    size_t forceInitializeHosts();

    core::InvocationId execute(const std::string& hostId, const std::string& commandId,
                               std::vector<std::string> params = {});
    core::InvocationId executeConfirmed(const std::string& hostId, const std::string& commandId,
                                        std::vector<std::string> params = {});
    bool confirmExecution(core::InvocationId id);
    bool cancel(core::InvocationId id);

    std::vector<core::InvocationId> refreshMonitorsOfCategory(const std::string& hostId,
                                                              const std::string& category);
    std::vector<core::InvocationId> cachedRefreshMonitorsOfCategory(const std::string& hostId,
                                                                    const std::string& category);

    std::vector<std::string> getCommands(const std::string& hostId) const;
    std::vector<std::string> getChildCommands(const std::string& hostId, const std::string& category,
                                              const std::string& monitorId, int level) const;
    std::vector<std::string> getMonitors(const std::string& hostId, const std::string& category = {}) const;
    std::optional<core::HostState> getHostState(const std::string& hostId) const;
    std::vector<std::string> hostIds() const;

    int64_t subscribe(infra::EventBus::EventCallback callback);
    void unsubscribe(int64_t subscriptionId);

    /**
     * @brief Writes the host cache now.
     */
    bool saveCache();

    infra::EventBus& events() { return *events_; }
    InvocationDispatcher& dispatcher() { return *dispatcher_; }
    infra::HostStateCache& cache() { return *cache_; }
    infra::ModuleRegistry& modules() { return *modules_; }
    infra::ConnectorRegistry& connectors() { return *connectors_; }
    infra::ConfigResolver& resolver() { return *resolver_; }
    const infra::EngineConfig& config() const { return config_; }

private:
    void applyConfigurationChange(const std::vector<std::string>& changedHosts);
    void scheduleAutoRefresh();
    void schedulePersist();
    void autoRefresh();

    static std::string connectorIdFor(const core::EffectiveConfig& config);

    const infra::EngineConfig config_;

    std::unique_ptr<infra::EventBus> events_;
    std::unique_ptr<infra::AsioContext> asio_;
    std::unique_ptr<infra::ConfigResolver> resolver_;
    std::unique_ptr<infra::ConnectorRegistry> connectors_;
    std::unique_ptr<infra::ModuleRegistry> modules_;
    std::unique_ptr<infra::HostStateCache> cache_;
    std::unique_ptr<infra::CriticalityTracker> tracker_;
    std::unique_ptr<InvocationDispatcher> dispatcher_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};

    std::mutex timersMutex_;
    std::shared_ptr<asio::steady_timer> autoRefreshTimer_;
    std::shared_ptr<asio::steady_timer> persistTimer_;
};

} // namespace hostkeeper::engine
