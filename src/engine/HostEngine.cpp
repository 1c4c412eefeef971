#include "engine/HostEngine.hpp"

#include "core/types/Errors.hpp"
#include "infrastructure/connectors/SshConnector.hpp"
#include "infrastructure/database/HostCacheRepository.hpp"
#include "infrastructure/modules/builtin/BuiltinModules.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace hostkeeper::engine {

namespace {

DispatcherSettings dispatcherSettings(const infra::EngineConfig& config) {
    DispatcherSettings settings;
    settings.maxInFlightPerHost = static_cast<size_t>(std::max(1, config.engine.maxInFlightPerHost));
    settings.commandTimeout = std::chrono::seconds(config.engine.commandTimeoutSeconds);
    settings.retryBackoff = std::chrono::milliseconds(config.engine.retryBackoffMs);
    settings.provideInitialValue = config.cache.enableCache && config.cache.provideInitialValue;
    settings.initialValueTimeToLive = std::chrono::seconds(config.cache.initialValueTimeToLiveSeconds);
    settings.cacheTimeToLive = std::chrono::seconds(config.cache.timeToLiveSeconds);
    return settings;
}

} // namespace

HostEngine::HostEngine(const infra::EngineConfig& config, infra::ConfigResolver::DefinitionSource definitions,
                       std::shared_ptr<infra::Database> database)
    : config_(config) {
    events_ = std::make_unique<infra::EventBus>(static_cast<size_t>(std::max(1, config_.events.queueCapacity)),
                                                infra::overflowPolicyFromString(config_.events.overflowPolicy));
    asio_ = std::make_unique<infra::AsioContext>(static_cast<size_t>(std::max(1, config_.engine.workerThreads)));
    resolver_ = std::make_unique<infra::ConfigResolver>(
        std::move(definitions), infra::groupMergeOrderFromString(config_.engine.groupMergeOrder));
    connectors_ = std::make_unique<infra::ConnectorRegistry>(
        static_cast<size_t>(std::max(1, config_.connectors.sessionPoolSize)));

    modules_ = std::make_unique<infra::ModuleRegistry>();
    infra::registerBuiltinModules(*modules_);

    std::shared_ptr<infra::HostCacheRepository> repository;
    if (database && config_.cache.enableCache) {
        repository = std::make_shared<infra::HostCacheRepository>(database);
    }
    cache_ = std::make_unique<infra::HostStateCache>(repository);
    cache_->setPersistenceEnabled(config_.cache.enableCache);
    cache_->setSummaryExcludedMonitors(modules_->summaryExcludedMonitors());

    tracker_ = std::make_unique<infra::CriticalityTracker>(*cache_, *events_);
    dispatcher_ = std::make_unique<InvocationDispatcher>(*resolver_, *connectors_, *modules_, *cache_, *tracker_,
                                                         *events_, *asio_, dispatcherSettings(config_));

    resolver_->addChangeListener(
        [this](const std::vector<std::string>& changedHosts) { applyConfigurationChange(changedHosts); });
}

HostEngine::~HostEngine() {
    stop();
}

void HostEngine::registerConnector(std::shared_ptr<core::IConnector> connector) {
    connectors_->registerConnector(std::move(connector));
}

bool HostEngine::start() {
    if (running_ || stopped_) {
        return running_;
    }

    if (!connectors_->hasConnector("ssh")) {
        infra::SshSettings ssh;
        ssh.binary = config_.connectors.sshBinary;
        ssh.controlPersistSeconds = config_.connectors.controlPersistSeconds;
        ssh.strictHostKeyChecking = config_.connectors.strictHostKeyChecking;
        connectors_->registerConnector(std::make_shared<infra::SshConnector>(ssh));
    }

    if (config_.cache.enableCache && !cache_->load()) {
        spdlog::warn("Host cache could not be loaded, starting empty");
    }

    asio_->start();
    running_ = true;

    const bool configured = reconfigure();
    spdlog::info("Engine started with {} hosts", resolver_->hostIds().size());

    if (config_.engine.refreshHostsOnStart) {
        forceInitializeHosts();
    }
    scheduleAutoRefresh();
    schedulePersist();
    return configured;
}

void HostEngine::stop() {
    if (stopped_.exchange(true)) {
        return;
    }

    spdlog::info("Engine stopping...");
    dispatcher_->stop();
    {
        std::lock_guard lock(timersMutex_);
        if (autoRefreshTimer_) {
            autoRefreshTimer_->cancel();
        }
        if (persistTimer_) {
            persistTimer_->cancel();
        }
    }

    asio_->stop();
    running_ = false;

    if (config_.cache.enableCache) {
        saveCache();
    }
    connectors_->closeAll();

    events_->flush();
    events_->stop();
    spdlog::info("Engine stopped");
}

bool HostEngine::reconfigure() {
    try {
        auto changed = resolver_->reloadAll();
        spdlog::info("Configuration loaded, {} hosts changed", changed.size());

        if (running_) {
            auto current = resolver_->hostIds();
            for (const auto& hostId : changed) {
                if (std::find(current.begin(), current.end(), hostId) != current.end() &&
                    cache_->status(hostId) != core::HostStatus::Uninitialized) {
                    dispatcher_->initializeHost(hostId);
                }
            }
        }
        return true;
    } catch (const core::ConfigError& e) {
        spdlog::error("Configuration rejected, keeping the previous one: {}", e.what());
        events_->publish(core::EngineEvent::error(core::Criticality::Critical,
                                                  std::string("Configuration error: ") + e.what()));
        return false;
    }
}

void HostEngine::applyConfigurationChange(const std::vector<std::string>& changedHosts) {
    auto snapshot = resolver_->snapshot();

    for (const auto& hostId : changedHosts) {
        auto it = snapshot->hosts.find(hostId);
        if (it == snapshot->hosts.end()) {
            spdlog::info("[{}] Host removed", hostId);
            dispatcher_->dropHost(hostId);
            connectors_->remove(hostId);
            cache_->removeHost(hostId);
            tracker_->reset(hostId);
            continue;
        }

        const auto& config = it->second;
        connectors_->configure(hostId, core::ConnectorConfig::fromEffective(config, connectorIdFor(config)));
        cache_->setHostInfo(hostId, config.address, config.fqdn);

        std::set<std::string> criticalMonitors;
        for (const auto& [monitorId, moduleConfig] : config.settings.monitors) {
            if (moduleConfig.isCritical.value_or(false)) {
                criticalMonitors.insert(monitorId);
            }
        }
        cache_->setCriticalMonitors(hostId, std::move(criticalMonitors));
        spdlog::debug("[{}] Configuration applied", hostId);
    }

    // Every host may block maxInFlightPerHost workers at once; one more keeps timers running.
    const size_t perHost = static_cast<size_t>(std::max(1, config_.engine.maxInFlightPerHost));
    asio_->ensureThreads(std::max(static_cast<size_t>(std::max(1, config_.engine.workerThreads)),
                                  snapshot->hosts.size() * perHost + 1));

    auto event = core::EngineEvent::forHost(core::EventType::ConfigurationChanged, {});
    event.hostIds = changedHosts;
    events_->publish(std::move(event));
}

std::string HostEngine::connectorIdFor(const core::EffectiveConfig& config) {
    const auto& connectors = config.settings.connectors;
    if (connectors.empty() || connectors.contains("ssh")) {
        return "ssh";
    }
    return connectors.begin()->first;
}

std::vector<core::InvocationId> HostEngine::initializeHost(const std::string& hostId) {
    return dispatcher_->initializeHost(hostId);
}

size_t HostEngine::forceInitializeHosts() {
    size_t started = 0;
    for (const auto& hostId : resolver_->hostIds()) {
        if (!dispatcher_->initializeHost(hostId).empty()) {
            ++started;
        }
    }
    spdlog::info("Initializing {} hosts", started);
    return started;
}

core::InvocationId HostEngine::execute(const std::string& hostId, const std::string& commandId,
                                       std::vector<std::string> params) {
    return dispatcher_->invoke(hostId, commandId, std::move(params));
}

core::InvocationId HostEngine::executeConfirmed(const std::string& hostId, const std::string& commandId,
                                                std::vector<std::string> params) {
    return dispatcher_->invokeConfirmed(hostId, commandId, std::move(params));
}

bool HostEngine::confirmExecution(core::InvocationId id) {
    return dispatcher_->confirmExecution(id);
}

bool HostEngine::cancel(core::InvocationId id) {
    return dispatcher_->cancel(id);
}

std::vector<core::InvocationId> HostEngine::refreshMonitorsOfCategory(const std::string& hostId,
                                                                      const std::string& category) {
    return dispatcher_->refreshCategory(hostId, category);
}

std::vector<core::InvocationId> HostEngine::cachedRefreshMonitorsOfCategory(const std::string& hostId,
                                                                            const std::string& category) {
    return dispatcher_->cachedRefreshCategory(hostId, category);
}

std::vector<std::string> HostEngine::getCommands(const std::string& hostId) const {
    return dispatcher_->commands(hostId);
}

std::vector<std::string> HostEngine::getChildCommands(const std::string& hostId, const std::string& category,
                                                      const std::string& monitorId, int level) const {
    return dispatcher_->childCommands(hostId, category, monitorId, level);
}

std::vector<std::string> HostEngine::getMonitors(const std::string& hostId, const std::string& category) const {
    return dispatcher_->applicableModules(hostId, category, core::ModuleKind::Monitor);
}

std::optional<core::HostState> HostEngine::getHostState(const std::string& hostId) const {
    return cache_->snapshot(hostId);
}

std::vector<std::string> HostEngine::hostIds() const {
    return resolver_->hostIds();
}

int64_t HostEngine::subscribe(infra::EventBus::EventCallback callback) {
    return events_->subscribe(std::move(callback));
}

void HostEngine::unsubscribe(int64_t subscriptionId) {
    events_->unsubscribe(subscriptionId);
}

bool HostEngine::saveCache() {
    if (!cache_->save()) {
        spdlog::warn("Saving the host cache failed");
        return false;
    }
    return true;
}

void HostEngine::scheduleAutoRefresh() {
    if (config_.engine.autoRefreshIntervalSeconds <= 0 || stopped_) {
        return;
    }

    std::lock_guard lock(timersMutex_);
    autoRefreshTimer_ =
        asio_->postAfter(std::chrono::seconds(config_.engine.autoRefreshIntervalSeconds), [this] {
            autoRefresh();
            scheduleAutoRefresh();
        });
}

void HostEngine::schedulePersist() {
    if (!config_.cache.enableCache || config_.cache.persistIntervalSeconds <= 0 || stopped_) {
        return;
    }

    std::lock_guard lock(timersMutex_);
    persistTimer_ = asio_->postAfter(std::chrono::seconds(config_.cache.persistIntervalSeconds), [this] {
        saveCache();
        schedulePersist();
    });
}

void HostEngine::autoRefresh() {
    for (const auto& hostId : resolver_->hostIds()) {
        auto status = cache_->status(hostId);
        if (dispatcher_->isInitializing(hostId) ||
            (status != core::HostStatus::Initialized && status != core::HostStatus::Unreachable)) {
            continue;
        }

        if (config_.cache.preferCache) {
            dispatcher_->cachedRefreshCategory(hostId, {});
        } else {
            dispatcher_->refreshCategory(hostId, {});
        }
    }
}

} // namespace hostkeeper::engine
