#include "engine/InvocationDispatcher.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace hostkeeper::engine {

using core::CommandResult;
using core::EngineEvent;
using core::EventType;
using core::Invocation;
using core::InvocationId;
using core::InvocationState;
using core::ModuleKind;

InvocationDispatcher::InvocationDispatcher(infra::ConfigResolver& resolver, infra::ConnectorRegistry& connectors,
                                           infra::ModuleRegistry& modules, infra::HostStateCache& cache,
                                           infra::CriticalityTracker& tracker, infra::EventBus& events,
                                           infra::AsioContext& context, DispatcherSettings settings)
    : resolver_(resolver), connectors_(connectors), modules_(modules), cache_(cache), tracker_(tracker),
      events_(events), context_(context), settings_(settings) {}

InvocationDispatcher::~InvocationDispatcher() {
    stop();
}

std::vector<InvocationId> InvocationDispatcher::initializeHost(const std::string& hostId) {
    if (stopped_) {
        return {};
    }

    core::EffectiveConfig config;
    try {
        config = resolver_.resolve(hostId);
    } catch (const core::ConfigError& e) {
        spdlog::warn("[{}] Cannot initialize: {}", hostId, e.what());
        events_.publish(EngineEvent::error(core::Criticality::Error, e.what(), hostId));
        return {};
    }

    {
        std::lock_guard lock(mutex_);
        auto& host = hosts_[hostId];
        if (host.initializing) {
            spdlog::debug("[{}] Initialization already in progress", hostId);
            return {};
        }
        host.initializing = true;
        host.initRemaining = 0;
    }

    cache_.setHostInfo(hostId, config.address, config.fqdn);
    std::set<std::string> criticalMonitors;
    for (const auto& [monitorId, moduleConfig] : config.settings.monitors) {
        if (moduleConfig.isCritical.value_or(false)) {
            criticalMonitors.insert(monitorId);
        }
    }
    cache_.setCriticalMonitors(hostId, std::move(criticalMonitors));

    std::vector<InvocationId> ids;
    if (settings_.provideInitialValue && cache_.hasCachedData(hostId, settings_.initialValueTimeToLive)) {
        cache_.setStatus(hostId, core::HostStatus::InitializedFromCache);
        spdlog::info("[{}] Initialized from cache", hostId);
        events_.publish(EngineEvent::forHost(EventType::HostInitializedFromCache, hostId));
        ids = replayCache(hostId);
    } else {
        cache_.setStatus(hostId, core::HostStatus::InitializingLive);
    }
    events_.publish(EngineEvent::forHost(EventType::UpdateReceived, hostId));

    std::vector<Invocation> live;
    if (modules_.monitor(PlatformMonitorId)) {
        auto platform = makeInvocation(hostId, PlatformMonitorId, ModuleKind::Monitor);
        platform.partOfInitialization = true;
        live.push_back(std::move(platform));
    } else {
        live = initialMonitors(hostId);
    }

    if (live.empty()) {
        {
            std::lock_guard lock(mutex_);
            hosts_[hostId].initializing = false;
        }
        completeInitialization(hostId);
        return ids;
    }

    for (const auto& invocation : live) {
        ids.push_back(invocation.id);
    }
    spdlog::debug("[{}] Starting live initialization", hostId);
    enqueue(std::move(live));
    return ids;
}

InvocationId InvocationDispatcher::invoke(const std::string& hostId, const std::string& moduleId,
                                          std::vector<std::string> params) {
    return submit(hostId, moduleId, std::move(params), false);
}

InvocationId InvocationDispatcher::invokeConfirmed(const std::string& hostId, const std::string& moduleId,
                                                   std::vector<std::string> params) {
    return submit(hostId, moduleId, std::move(params), true);
}

InvocationId InvocationDispatcher::submit(const std::string& hostId, const std::string& moduleId,
                                          std::vector<std::string> params, bool confirmed) {
    if (stopped_) {
        spdlog::warn("[{}] Dispatcher stopped, {} rejected", hostId, moduleId);
        return 0;
    }

    const auto* module = modules_.find(moduleId);
    auto invocation =
        makeInvocation(hostId, moduleId, module ? module->kind() : ModuleKind::Command, std::move(params));
    if (!module) {
        reject(invocation, CommandResult::error("Unknown module: " + moduleId));
        return invocation.id;
    }

    core::EffectiveConfig config;
    try {
        config = resolver_.resolve(hostId);
    } catch (const core::ConfigError& e) {
        reject(invocation, CommandResult::error(e.what()));
        return invocation.id;
    }

    if (auto command = modules_.command(moduleId)) {
        auto state = cache_.snapshot(hostId);
        auto context = infra::ModuleRegistry::makeContext(*command, config, state ? state->facts : core::HostFacts{},
                                                          invocation.params);
        size_t missing = 0;
        try {
            missing = modules_.validateInput(*command, context);
        } catch (const core::ValidationError& e) {
            reject(invocation, CommandResult::error(e.what()));
            return invocation.id;
        }

        if (missing > 0) {
            auto event = EngineEvent::forHost(EventType::InputDialogOpened, hostId);
            event.moduleId = moduleId;
            event.invocationId = invocation.id;
            event.inputSpecs = command->effectiveInputs(context.config);
            event.params = invocation.params;
            events_.publish(std::move(event));
            return invocation.id;
        }

        if (command->descriptor().capabilities().requiresConfirmation && !confirmed) {
            invocation.state = InvocationState::AwaitingConfirmation;
            auto event = EngineEvent::forHost(EventType::ConfirmationDialogOpened, hostId);
            event.moduleId = moduleId;
            event.invocationId = invocation.id;
            event.message = command->descriptor().confirmationText;
            event.params = invocation.params;
            {
                std::lock_guard lock(mutex_);
                invocations_[invocation.id] = invocation;
            }
            events_.publish(std::move(event));
            return invocation.id;
        }
    }

    const auto id = invocation.id;
    enqueue({std::move(invocation)});
    return id;
}

bool InvocationDispatcher::confirmExecution(InvocationId id) {
    if (stopped_) {
        return false;
    }

    Invocation confirmed;
    {
        std::lock_guard lock(mutex_);
        auto it = invocations_.find(id);
        if (it == invocations_.end() || it->second.state != InvocationState::AwaitingConfirmation) {
            return false;
        }
        confirmed = std::move(it->second);
        invocations_.erase(it);
    }

    confirmed.state = InvocationState::Pending;
    enqueue({std::move(confirmed)});
    return true;
}

std::vector<InvocationId> InvocationDispatcher::refreshCategory(const std::string& hostId,
                                                                const std::string& category) {
    if (stopped_) {
        return {};
    }

    std::vector<Invocation> invocations;
    std::vector<InvocationId> ids;
    for (const auto& monitorId : applicableModules(hostId, category, ModuleKind::Monitor)) {
        invocations.push_back(makeInvocation(hostId, monitorId, ModuleKind::Monitor));
        ids.push_back(invocations.back().id);
    }
    enqueue(std::move(invocations));
    return ids;
}

std::vector<InvocationId> InvocationDispatcher::cachedRefreshCategory(const std::string& hostId,
                                                                      const std::string& category) {
    if (stopped_) {
        return {};
    }

    const auto state = cache_.snapshot(hostId);
    const auto now = std::chrono::system_clock::now();

    std::set<std::string> fresh;
    std::vector<Invocation> stale;
    for (const auto& monitorId : applicableModules(hostId, category, ModuleKind::Monitor)) {
        if (state) {
            auto it = state->monitorData.find(monitorId);
            if (it != state->monitorData.end() && now - it->second.timestamp < settings_.cacheTimeToLive) {
                fresh.insert(monitorId);
                continue;
            }
        }
        stale.push_back(makeInvocation(hostId, monitorId, ModuleKind::Monitor));
    }

    std::vector<InvocationId> ids;
    if (!fresh.empty()) {
        ids = replayCache(hostId, fresh);
    }
    for (const auto& invocation : stale) {
        ids.push_back(invocation.id);
    }
    spdlog::debug("[{}] Cached refresh: {} from cache, {} live", hostId, fresh.size(), stale.size());
    enqueue(std::move(stale));
    return ids;
}

bool InvocationDispatcher::cancel(InvocationId id) {
    std::vector<InvocationId> admitted;
    std::string hostId;
    bool initDone = false;
    {
        std::lock_guard lock(mutex_);
        auto it = invocations_.find(id);
        if (it == invocations_.end()) {
            return false;
        }

        hostId = it->second.hostId;
        auto& host = hosts_[hostId];
        if (it->second.state == InvocationState::Pending) {
            host.pending.erase(std::remove(host.pending.begin(), host.pending.end(), id), host.pending.end());
        } else if (it->second.state == InvocationState::Executing && host.inFlight > 0) {
            --host.inFlight;
        }

        if (auto timer = retryTimers_.find(id); timer != retryTimers_.end()) {
            timer->second->cancel();
            retryTimers_.erase(timer);
        }

        if (it->second.partOfInitialization && host.initializing && host.initRemaining > 0 &&
            --host.initRemaining == 0) {
            host.initializing = false;
            initDone = true;
        }

        invocations_.erase(it);
        admitted = admitLocked(hostId);
    }

    spdlog::debug("[{}] Invocation {} cancelled", hostId, id);
    if (initDone) {
        completeInitialization(hostId);
    }
    dispatch(admitted);
    return true;
}

void InvocationDispatcher::dropHost(const std::string& hostId) {
    std::lock_guard lock(mutex_);
    auto hostIt = hosts_.find(hostId);
    if (hostIt == hosts_.end()) {
        return;
    }
    auto& host = hostIt->second;

    for (auto it = invocations_.begin(); it != invocations_.end();) {
        const auto& invocation = it->second;
        auto timer = retryTimers_.find(invocation.id);
        if (invocation.hostId != hostId ||
            (invocation.state == InvocationState::Executing && timer == retryTimers_.end())) {
            ++it;
            continue;
        }
        if (timer != retryTimers_.end()) {
            timer->second->cancel();
            retryTimers_.erase(timer);
            --host.inFlight;
        }
        it = invocations_.erase(it);
    }

    host.pending.clear();
    host.initializing = false;
    host.initRemaining = 0;
    if (host.inFlight == 0) {
        hosts_.erase(hostIt);
    }
    spdlog::debug("[{}] Dropped queued invocations", hostId);
}

void InvocationDispatcher::stop() {
    if (stopped_.exchange(true)) {
        return;
    }

    std::lock_guard lock(mutex_);
    for (auto& [id, timer] : retryTimers_) {
        timer->cancel();
        invocations_.erase(id);
    }
    retryTimers_.clear();

    // Running executions finish on their worker, finish() then drops the result.
    size_t executing = 0;
    for (const auto& [id, invocation] : invocations_) {
        if (invocation.state == InvocationState::Executing) {
            ++executing;
        }
    }
    invocations_.clear();
    for (auto& [hostId, host] : hosts_) {
        host.pending.clear();
        host.inFlight = 0;
        host.initializing = false;
        host.initRemaining = 0;
    }
    spdlog::info("Invocation dispatcher stopped, dropping results of {} executing invocations", executing);
}

std::vector<std::string> InvocationDispatcher::applicableModules(const std::string& hostId,
                                                                 const std::string& category,
                                                                 ModuleKind kind) const {
    try {
        auto config = resolver_.resolve(hostId);
        auto state = cache_.snapshot(hostId);
        return modules_.applicableModules(config, state ? state->facts : core::HostFacts{}, category, kind);
    } catch (const core::ConfigError& e) {
        spdlog::warn("[{}] {}", hostId, e.what());
        return {};
    }
}

std::vector<std::string> InvocationDispatcher::commands(const std::string& hostId) const {
    std::vector<std::string> result;
    for (const auto& commandId : applicableModules(hostId, {}, ModuleKind::Command)) {
        auto command = modules_.command(commandId);
        if (command && command->descriptor().display.parentId.empty()) {
            result.push_back(commandId);
        }
    }
    return result;
}

std::vector<std::string> InvocationDispatcher::childCommands(const std::string& hostId,
                                                             const std::string& category,
                                                             const std::string& monitorId, int level) const {
    std::vector<std::string> result;
    for (const auto& commandId : applicableModules(hostId, category, ModuleKind::Command)) {
        auto command = modules_.command(commandId);
        if (!command) {
            continue;
        }
        const auto& display = command->descriptor().display;
        if (display.parentId == monitorId && display.multivalueLevel == level) {
            result.push_back(commandId);
        }
    }
    return result;
}

std::optional<Invocation> InvocationDispatcher::invocation(InvocationId id) const {
    std::lock_guard lock(mutex_);
    auto it = invocations_.find(id);
    if (it == invocations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t InvocationDispatcher::inFlight(const std::string& hostId) const {
    std::lock_guard lock(mutex_);
    auto it = hosts_.find(hostId);
    return it != hosts_.end() ? it->second.inFlight : 0;
}

size_t InvocationDispatcher::queued(const std::string& hostId) const {
    std::lock_guard lock(mutex_);
    auto it = hosts_.find(hostId);
    return it != hosts_.end() ? it->second.pending.size() : 0;
}

bool InvocationDispatcher::isInitializing(const std::string& hostId) const {
    std::lock_guard lock(mutex_);
    auto it = hosts_.find(hostId);
    return it != hosts_.end() && it->second.initializing;
}

void InvocationDispatcher::enqueue(std::vector<Invocation> invocations) {
    if (invocations.empty()) {
        return;
    }

    for (const auto& invocation : invocations) {
        publishDialogEvents(invocation);
    }

    std::vector<InvocationId> admitted;
    {
        std::lock_guard lock(mutex_);
        for (auto& invocation : invocations) {
            enqueueLocked(std::move(invocation), admitted);
        }
    }
    dispatch(admitted);
}

void InvocationDispatcher::enqueueLocked(Invocation invocation, std::vector<InvocationId>& admitted) {
    const auto hostId = invocation.hostId;
    auto& host = hosts_[hostId];
    if (invocation.partOfInitialization) {
        ++host.initRemaining;
    }
    invocation.state = InvocationState::Pending;
    host.pending.push_back(invocation.id);
    invocations_[invocation.id] = std::move(invocation);

    auto more = admitLocked(hostId);
    admitted.insert(admitted.end(), more.begin(), more.end());
}

std::vector<InvocationId> InvocationDispatcher::admitLocked(const std::string& hostId) {
    std::vector<InvocationId> admitted;
    auto hostIt = hosts_.find(hostId);
    if (hostIt == hosts_.end()) {
        return admitted;
    }

    auto& host = hostIt->second;
    const size_t limit = std::max<size_t>(1, settings_.maxInFlightPerHost);
    while (host.inFlight < limit && !host.pending.empty()) {
        auto id = host.pending.front();
        host.pending.pop_front();

        auto it = invocations_.find(id);
        if (it == invocations_.end()) {
            continue;
        }
        it->second.state = InvocationState::Executing;
        ++host.inFlight;
        admitted.push_back(id);
    }
    return admitted;
}

void InvocationDispatcher::dispatch(const std::vector<InvocationId>& ids) {
    for (auto id : ids) {
        context_.post([this, id] { run(id); });
    }
}

void InvocationDispatcher::run(InvocationId id) {
    Invocation invocation;
    {
        std::lock_guard lock(mutex_);
        auto it = invocations_.find(id);
        if (it == invocations_.end()) {
            return;
        }
        invocation = it->second;
    }

    auto outcome = execute(invocation);

    if (outcome.connectionLost && outcome.retryable && !stopped_) {
        const auto reason = outcome.result ? outcome.result->errorText() : std::string("connection failed");
        if (invocation.attempt < MaxConnectionRetries) {
            spdlog::warn("[{}] {} failed to connect, retrying: {}", invocation.hostId, invocation.moduleId, reason);
            connectors_.invalidate(invocation.hostId);
            scheduleRetry(invocation);
            return;
        }
        markUnreachable(invocation, reason);
        return;
    }

    finish(invocation, std::move(outcome));
}

InvocationDispatcher::Outcome InvocationDispatcher::execute(const Invocation& invocation) {
    Outcome outcome;
    const core::Module* module = nullptr;
    bool sent = false;

    try {
        const auto config = resolver_.resolve(invocation.hostId);
        module = modules_.find(invocation.moduleId);
        if (!module) {
            throw core::ValidationError("Unknown module: " + invocation.moduleId);
        }

        const auto state = cache_.snapshot(invocation.hostId);
        const auto facts = state ? state->facts : core::HostFacts{};
        std::optional<core::MonitorDataPoint> priorData;
        if (invocation.kind == ModuleKind::Monitor) {
            priorData = cache_.monitorData(invocation.hostId, invocation.moduleId);
        }
        const auto context =
            infra::ModuleRegistry::makeContext(*module, config, facts, invocation.params, std::move(priorData));

        auto command = modules_.command(invocation.moduleId);
        if (command && modules_.validateInput(*command, context) > 0) {
            throw core::ValidationError("Missing input for " + invocation.moduleId);
        }

        const auto commandLine = modules_.buildCommand(*module, context);
        spdlog::debug("[{}] {}: {}", invocation.hostId, invocation.moduleId, commandLine);

        auto lease = connectors_.acquireSession(invocation.hostId);
        sent = true;

        core::ExecutionOutput output;
        try {
            output = connectors_.execute(lease, commandLine, settings_.commandTimeout);
        } catch (const core::ExecutionError& e) {
            if (!module->descriptor().acceptsNonZeroExit) {
                throw;
            }
            output = core::ExecutionOutput{e.stdoutText(), e.stderrText(), e.exitCode()};
        }

        if (command) {
            outcome.result = modules_.parseCommand(*command, output, context);
        } else {
            auto monitor = modules_.monitor(invocation.moduleId);
            outcome.data = modules_.parseMonitor(*monitor, output, context);
            outcome.facts = monitor->discoverFacts(output);
        }
    } catch (const core::ConnectionError& e) {
        outcome.connectionLost = true;
        outcome.retryable = !sent || !module || module->descriptor().idempotent;
        outcome.result = CommandResult::error(e.what());
    } catch (const core::ExecutionError& e) {
        auto text = core::trimmed(e.stderrText());
        outcome.result = CommandResult::error(text.empty() ? std::string(e.what()) : text);
    } catch (const core::ParseError& e) {
        outcome.data.reset();
        outcome.facts.reset();
        outcome.result = CommandResult::parseFailure(e.what());
    } catch (const std::exception& e) {
        outcome.result = CommandResult::error(e.what());
    }
    return outcome;
}

void InvocationDispatcher::scheduleRetry(const Invocation& invocation) {
    std::lock_guard lock(mutex_);
    auto it = invocations_.find(invocation.id);
    if (it == invocations_.end()) {
        return;
    }

    const int attempt = ++it->second.attempt;
    const auto delay = settings_.retryBackoff * (1 << (attempt - 1));
    const auto id = invocation.id;
    retryTimers_[id] = context_.postAfter(delay, [this, id] {
        {
            std::lock_guard lock(mutex_);
            retryTimers_.erase(id);
        }
        run(id);
    });
}

void InvocationDispatcher::finish(const Invocation& invocation, Outcome outcome) {
    bool active = false;
    {
        std::lock_guard lock(mutex_);
        active = invocations_.contains(invocation.id);
    }

    if (outcome.connectionLost) {
        connectors_.invalidate(invocation.hostId);
    } else {
        markReachable(invocation.hostId);
    }

    std::vector<Invocation> followUps;
    if (active) {
        deliver(invocation, outcome);
        if (invocation.partOfInitialization && invocation.moduleId == PlatformMonitorId) {
            followUps = initialMonitors(invocation.hostId);
        }
    } else {
        spdlog::debug("[{}] Dropping result of cancelled or stopped invocation {}", invocation.hostId,
                      invocation.id);
    }

    release(invocation, std::move(followUps));
}

void InvocationDispatcher::release(const Invocation& invocation, std::vector<Invocation> followUps) {
    std::vector<InvocationId> admitted;
    bool initDone = false;
    {
        std::lock_guard lock(mutex_);
        auto it = invocations_.find(invocation.id);
        if (it == invocations_.end()) {
            return;
        }
        invocations_.erase(it);

        auto& host = hosts_[invocation.hostId];
        if (host.inFlight > 0) {
            --host.inFlight;
        }

        if (invocation.partOfInitialization && host.initializing) {
            for (auto& followUp : followUps) {
                enqueueLocked(std::move(followUp), admitted);
            }
            if (host.initRemaining > 0 && --host.initRemaining == 0) {
                host.initializing = false;
                initDone = true;
            }
        }

        auto more = admitLocked(invocation.hostId);
        admitted.insert(admitted.end(), more.begin(), more.end());
    }

    if (initDone) {
        completeInitialization(invocation.hostId);
    }
    dispatch(admitted);
}

void InvocationDispatcher::markUnreachable(const Invocation& invocation, const std::string& reason) {
    const auto& hostId = invocation.hostId;
    std::vector<Invocation> failed;
    bool notify = false;
    {
        std::lock_guard lock(mutex_);
        auto& host = hosts_[hostId];

        auto it = invocations_.find(invocation.id);
        if (it != invocations_.end()) {
            failed.push_back(std::move(it->second));
            invocations_.erase(it);
            if (host.inFlight > 0) {
                --host.inFlight;
            }
        }

        for (auto id : host.pending) {
            auto queued = invocations_.find(id);
            if (queued != invocations_.end()) {
                failed.push_back(std::move(queued->second));
                invocations_.erase(queued);
            }
        }
        host.pending.clear();
        host.initializing = false;
        host.initRemaining = 0;

        notify = !host.unreachable;
        host.unreachable = true;
    }

    cache_.setStatus(hostId, core::HostStatus::Unreachable);
    connectors_.invalidate(hostId);
    spdlog::error("[{}] Host unreachable: {}", hostId, reason);

    for (const auto& failedInvocation : failed) {
        Outcome outcome;
        outcome.connectionLost = true;
        outcome.result = CommandResult::error("Host unreachable: " + reason);
        deliver(failedInvocation, outcome);
    }

    if (notify) {
        events_.publish(EngineEvent::error(core::Criticality::Error,
                                           "Host " + hostId + " is unreachable: " + reason, hostId));
    }
    events_.publish(EngineEvent::forHost(EventType::UpdateReceived, hostId));
}

void InvocationDispatcher::markReachable(const std::string& hostId) {
    {
        std::lock_guard lock(mutex_);
        auto it = hosts_.find(hostId);
        if (it == hosts_.end() || !it->second.unreachable) {
            return;
        }
        it->second.unreachable = false;
    }

    if (cache_.status(hostId) == core::HostStatus::Unreachable) {
        cache_.setStatus(hostId, core::HostStatus::Initialized);
        spdlog::info("[{}] Host reachable again", hostId);
        events_.publish(EngineEvent::forHost(EventType::UpdateReceived, hostId));
    }
}

void InvocationDispatcher::completeInitialization(const std::string& hostId) {
    if (cache_.status(hostId) != core::HostStatus::Unreachable) {
        cache_.setStatus(hostId, core::HostStatus::Initialized);
    }
    spdlog::info("[{}] Host initialized", hostId);
    events_.publish(EngineEvent::forHost(EventType::HostInitialized, hostId));
    events_.publish(EngineEvent::forHost(EventType::UpdateReceived, hostId));
}

void InvocationDispatcher::deliver(const Invocation& invocation, const Outcome& outcome) {
    const auto& hostId = invocation.hostId;

    if (outcome.data) {
        if (outcome.facts) {
            cache_.setFacts(hostId, *outcome.facts);
            spdlog::debug("[{}] Platform {} {} ({})", hostId, outcome.facts->distribution, outcome.facts->version,
                          outcome.facts->architecture);
        }

        cache_.recordMonitorData(hostId, invocation.moduleId, *outcome.data);

        auto event = EngineEvent::forHost(EventType::MonitoringDataReceived, hostId);
        event.moduleId = invocation.moduleId;
        event.invocationId = invocation.id;
        event.criticality = outcome.data->worstCriticality();
        event.data = outcome.data;
        events_.publish(std::move(event));

        tracker_.observe(hostId, invocation.moduleId);
        events_.publish(EngineEvent::forHost(EventType::UpdateReceived, hostId));
        return;
    }

    auto result = outcome.result.value_or(CommandResult::error("No result"))
                      .withInvocation(invocation.id, invocation.moduleId);
    if (auto command = modules_.command(invocation.moduleId)) {
        result = result.withFlags(command->descriptor().showInNotification, command->descriptor().opensDetails);
    }

    cache_.recordCommandResult(hostId, invocation.moduleId, result);
    if (result.isError()) {
        spdlog::warn("[{}] {} failed: {}", hostId, invocation.moduleId, result.errorText());
    }

    auto event = EngineEvent::forHost(EventType::CommandResultReceived, hostId);
    event.moduleId = invocation.moduleId;
    event.invocationId = invocation.id;
    event.criticality = result.criticality();
    event.result = result;
    events_.publish(std::move(event));

    if (result.isError() && invocation.kind == ModuleKind::Command && !outcome.connectionLost) {
        auto criticality =
            result.criticality() == core::Criticality::NoData ? core::Criticality::Warning : result.criticality();
        events_.publish(EngineEvent::error(criticality, invocation.moduleId + ": " + result.errorText(), hostId));
    }
    events_.publish(EngineEvent::forHost(EventType::UpdateReceived, hostId));
}

void InvocationDispatcher::reject(const Invocation& invocation, const CommandResult& result) {
    spdlog::warn("[{}] {} rejected: {}", invocation.hostId, invocation.moduleId, result.errorText());

    auto event = EngineEvent::forHost(EventType::CommandResultReceived, invocation.hostId);
    event.moduleId = invocation.moduleId;
    event.invocationId = invocation.id;
    event.criticality = result.criticality();
    event.result = result.withInvocation(invocation.id, invocation.moduleId);
    events_.publish(std::move(event));
    events_.publish(EngineEvent::error(result.criticality(), invocation.moduleId + ": " + result.errorText(),
                                       invocation.hostId));
}

void InvocationDispatcher::publishDialogEvents(const Invocation& invocation) {
    auto command = modules_.command(invocation.moduleId);
    if (!command) {
        return;
    }

    const auto& descriptor = command->descriptor();
    for (auto [enabled, type] : {std::pair{descriptor.opensDetails, EventType::DetailsDialogOpened},
                                 std::pair{descriptor.opensTextView, EventType::TextDialogOpened}}) {
        if (!enabled) {
            continue;
        }
        auto event = EngineEvent::forHost(type, invocation.hostId);
        event.moduleId = invocation.moduleId;
        event.invocationId = invocation.id;
        events_.publish(std::move(event));
    }
}

std::vector<InvocationId> InvocationDispatcher::replayCache(const std::string& hostId,
                                                            const std::optional<std::set<std::string>>& onlyMonitors) {
    std::vector<InvocationId> ids;
    auto state = cache_.snapshot(hostId);
    if (!state) {
        return ids;
    }

    for (const auto& [monitorId, data] : state->monitorData) {
        if (onlyMonitors && !onlyMonitors->contains(monitorId)) {
            continue;
        }
        auto event = EngineEvent::forHost(EventType::MonitoringDataReceived, hostId);
        event.moduleId = monitorId;
        event.invocationId = nextId();
        event.criticality = data.worstCriticality();
        event.data = data;
        event.data->fromCache = true;
        ids.push_back(event.invocationId);
        events_.publish(std::move(event));
    }

    if (!onlyMonitors) {
        for (const auto& [moduleId, result] : state->commandResults) {
            auto event = EngineEvent::forHost(EventType::CommandResultReceived, hostId);
            event.moduleId = moduleId;
            event.invocationId = nextId();
            event.criticality = result.criticality();
            event.result = result.markedFromCache().withInvocation(event.invocationId, moduleId);
            ids.push_back(event.invocationId);
            events_.publish(std::move(event));
        }
        tracker_.observe(hostId, state->mostSevereMonitor());
    }
    return ids;
}

std::vector<Invocation> InvocationDispatcher::initialMonitors(const std::string& hostId) {
    std::vector<Invocation> invocations;
    for (const auto& monitorId : applicableModules(hostId, {}, ModuleKind::Monitor)) {
        auto invocation = makeInvocation(hostId, monitorId, ModuleKind::Monitor);
        invocation.partOfInitialization = true;
        invocations.push_back(std::move(invocation));
    }
    return invocations;
}

Invocation InvocationDispatcher::makeInvocation(const std::string& hostId, const std::string& moduleId,
                                                ModuleKind kind, std::vector<std::string> params) {
    Invocation invocation;
    invocation.id = nextId();
    invocation.hostId = hostId;
    invocation.moduleId = moduleId;
    invocation.kind = kind;
    invocation.params = std::move(params);
    return invocation;
}

} // namespace hostkeeper::engine
