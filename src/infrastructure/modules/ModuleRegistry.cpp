#include "infrastructure/modules/ModuleRegistry.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

#include <mutex>

namespace hostkeeper::infra {

bool ModuleRegistry::registerMonitor(std::shared_ptr<const core::MonitorModule> module) {
    std::unique_lock lock(mutex_);
    const auto& id = module->id();
    if (monitors_.contains(id) || commands_.contains(id)) {
        spdlog::warn("Module {} is already registered", id);
        return false;
    }
    spdlog::debug("Registered monitor {} {}", id, module->descriptor().version);
    monitors_.emplace(id, std::move(module));
    return true;
}

bool ModuleRegistry::registerCommand(std::shared_ptr<const core::CommandModule> module) {
    std::unique_lock lock(mutex_);
    const auto& id = module->id();
    if (monitors_.contains(id) || commands_.contains(id)) {
        spdlog::warn("Module {} is already registered", id);
        return false;
    }
    spdlog::debug("Registered command {} {}", id, module->descriptor().version);
    commands_.emplace(id, std::move(module));
    return true;
}

std::shared_ptr<const core::MonitorModule> ModuleRegistry::monitor(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = monitors_.find(id);
    return it == monitors_.end() ? nullptr : it->second;
}

std::shared_ptr<const core::CommandModule> ModuleRegistry::command(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = commands_.find(id);
    return it == commands_.end() ? nullptr : it->second;
}

const core::Module* ModuleRegistry::find(const std::string& id) const {
    std::shared_lock lock(mutex_);
    if (auto it = monitors_.find(id); it != monitors_.end()) {
        return it->second.get();
    }
    if (auto it = commands_.find(id); it != commands_.end()) {
        return it->second.get();
    }
    return nullptr;
}

std::vector<std::string> ModuleRegistry::monitorIds() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, module] : monitors_) {
        ids.push_back(id);
    }
    return ids;
}

std::set<std::string> ModuleRegistry::summaryExcludedMonitors() const {
    std::shared_lock lock(mutex_);
    std::set<std::string> ids;
    for (const auto& [id, module] : monitors_) {
        if (module->descriptor().display.ignoreFromSummary) {
            ids.insert(id);
        }
    }
    return ids;
}

std::vector<std::string> ModuleRegistry::commandIds() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, module] : commands_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::string> ModuleRegistry::applicableModules(const core::EffectiveConfig& config,
                                                           const core::HostFacts& facts,
                                                           const std::string& category,
                                                           core::ModuleKind kind) const {
    auto accepts = [&](const core::Module& module, const core::ModuleConfig* moduleConfig) {
        const auto& descriptor = module.descriptor();
        if (descriptor.internal || !moduleConfig || !moduleConfig->isEnabled()) {
            return false;
        }
        if (!category.empty() && descriptor.display.category != category) {
            return false;
        }
        return module.appliesTo(facts);
    };

    std::vector<std::string> ids;
    std::shared_lock lock(mutex_);
    if (kind == core::ModuleKind::Monitor) {
        for (const auto& [id, module] : monitors_) {
            if (accepts(*module, config.monitor(id))) {
                ids.push_back(id);
            }
        }
    } else {
        for (const auto& [id, module] : commands_) {
            if (accepts(*module, config.command(id))) {
                ids.push_back(id);
            }
        }
    }
    return ids;
}

core::ModuleContext ModuleRegistry::makeContext(const core::Module& module,
                                                const core::EffectiveConfig& config,
                                                const core::HostFacts& facts,
                                                std::vector<std::string> params,
                                                std::optional<core::MonitorDataPoint> priorData) {
    core::ModuleContext context;
    context.hostId = config.hostId;
    context.params = std::move(params);
    context.facts = facts;
    context.hostSettings = config.settings.hostSettings;
    context.priorData = std::move(priorData);

    const auto* moduleConfig = module.kind() == core::ModuleKind::Monitor ? config.monitor(module.id())
                                                                          : config.command(module.id());
    if (moduleConfig) {
        context.config = *moduleConfig;
    }
    return context;
}

std::string ModuleRegistry::buildCommand(const core::Module& module,
                                         const core::ModuleContext& context) const {
    try {
        return module.buildCommand(context);
    } catch (const core::ValidationError&) {
        throw;
    } catch (const std::exception& e) {
        throw core::ValidationError(module.id() + ": " + e.what());
    }
}

core::MonitorDataPoint ModuleRegistry::parseMonitor(const core::MonitorModule& module,
                                                    const core::ExecutionOutput& output,
                                                    const core::ModuleContext& context) const {
    try {
        return module.parse(output, context);
    } catch (const core::ParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw core::ParseError(module.id() + ": " + e.what());
    }
}

core::CommandResult ModuleRegistry::parseCommand(const core::CommandModule& module,
                                                 const core::ExecutionOutput& output,
                                                 const core::ModuleContext& context) const {
    try {
        return module.parse(output, context);
    } catch (const core::ParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw core::ParseError(module.id() + ": " + e.what());
    }
}

size_t ModuleRegistry::validateInput(const core::CommandModule& module,
                                     const core::ModuleContext& context) const {
    return module.validateInput(context.params, context.config);
}

} // namespace hostkeeper::infra
