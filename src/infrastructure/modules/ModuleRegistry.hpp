#pragma once

#include "core/modules/Module.hpp"
#include "core/types/EffectiveConfig.hpp"

#include <map>
#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace hostkeeper::infra {

/**
 * @brief Lookup table of monitor and command modules keyed by module id.
 *
 * Filled once at startup (see registerBuiltinModules()). Module ids are unique
 * across both kinds.
 */
class ModuleRegistry {
public:
    /**
     * @brief Registers a monitor.
     * @return False if a module with the same id already exists.
     */
    bool registerMonitor(std::shared_ptr<const core::MonitorModule> module);

    /**
     * @brief Registers a command.
     * @return False if a module with the same id already exists.
     */
    bool registerCommand(std::shared_ptr<const core::CommandModule> module);

    std::shared_ptr<const core::MonitorModule> monitor(const std::string& id) const;
    std::shared_ptr<const core::CommandModule> command(const std::string& id) const;

    /**
     * @brief Looks up a module of either kind, nullptr if unknown.
     */
    const core::Module* find(const std::string& id) const;

    std::vector<std::string> monitorIds() const;
    std::vector<std::string> commandIds() const;

    /**
     * @brief Monitors whose display options exclude them from the host aggregate.
     */
    std::set<std::string> summaryExcludedMonitors() const;

    /**
     * @brief Modules enabled in the host's configuration whose platform predicate accepts the facts.
     *
     * Internal modules are never listed. An empty category matches all categories.
     */
    std::vector<std::string> applicableModules(const core::EffectiveConfig& config,
                                               const core::HostFacts& facts,
                                               const std::string& category,
                                               core::ModuleKind kind) const;

    /**
     * @brief Assembles the context a module sees for one host.
     */
    static core::ModuleContext makeContext(const core::Module& module, const core::EffectiveConfig& config,
                                           const core::HostFacts& facts,
                                           std::vector<std::string> params,
                                           std::optional<core::MonitorDataPoint> priorData = std::nullopt);

    /**
     * @brief Builds the remote command line.
     * @throws core::ValidationError if the module rejects the parameters.
     */
    std::string buildCommand(const core::Module& module, const core::ModuleContext& context) const;

    /**
     * @brief Parses monitor output.
     * @throws core::ParseError on malformed output.
     */
    core::MonitorDataPoint parseMonitor(const core::MonitorModule& module,
                                        const core::ExecutionOutput& output,
                                        const core::ModuleContext& context) const;

    /**
     * @brief Parses command output.
     * @throws core::ParseError on malformed output.
     */
    core::CommandResult parseCommand(const core::CommandModule& module,
                                     const core::ExecutionOutput& output,
                                     const core::ModuleContext& context) const;

    /**
     * @brief Checks command params against its input specs.
     * @return Number of missing inputs.
     * @throws core::ValidationError if a value is rejected.
     */
    size_t validateInput(const core::CommandModule& module, const core::ModuleContext& context) const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<const core::MonitorModule>> monitors_;
    std::map<std::string, std::shared_ptr<const core::CommandModule>> commands_;
};

} // namespace hostkeeper::infra
