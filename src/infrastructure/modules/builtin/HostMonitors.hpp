#pragma once

#include "core/modules/Module.hpp"

#include <chrono>

namespace hostkeeper::infra::builtin {

/**
 * @brief Internal monitor discovering OS, distribution, architecture and subsystems.
 *
 * Runs first during host initialization; its facts decide which other
 * modules apply to the host.
 */
class PlatformInfoMonitor : public core::MonitorModule {
public:
    PlatformInfoMonitor();

    std::string buildCommand(const core::ModuleContext& context) const override;
    core::MonitorDataPoint parse(const core::ExecutionOutput& output,
                                 const core::ModuleContext& context) const override;
    std::optional<core::HostFacts> discoverFacts(const core::ExecutionOutput& output) const override;

    /**
     * @throws core::ParseError if the output has no uname line.
     */
    static core::HostFacts parseFacts(const std::string& output);
};

class UptimeMonitor : public core::MonitorModule {
public:
    UptimeMonitor();

    std::string buildCommand(const core::ModuleContext& context) const override;
    core::MonitorDataPoint parse(const core::ExecutionOutput& output,
                                 const core::ModuleContext& context) const override;

    /**
     * @brief Whole days between a "YYYY-MM-DD HH:MM:SS" boot time and now.
     * @throws core::ParseError on a malformed timestamp.
     */
    static int64_t daysSince(const std::string& bootTime, std::chrono::system_clock::time_point now);
};

/**
 * @brief Load average relative to the CPU count.
 *
 * Settings: warning_threshold (load per CPU, default 1.0), error_threshold (default 2.0).
 */
class LoadMonitor : public core::MonitorModule {
public:
    LoadMonitor();

    std::string buildCommand(const core::ModuleContext& context) const override;
    core::MonitorDataPoint parse(const core::ExecutionOutput& output,
                                 const core::ModuleContext& context) const override;
};

/**
 * @brief Used memory in percent.
 *
 * Settings: warning_threshold (default 80), error_threshold (90), critical_threshold (95).
 */
class MemoryMonitor : public core::MonitorModule {
public:
    MemoryMonitor();

    std::string buildCommand(const core::ModuleContext& context) const override;
    core::MonitorDataPoint parse(const core::ExecutionOutput& output,
                                 const core::ModuleContext& context) const override;
};

/**
 * @brief Usage of each mounted filesystem, one child per mount point.
 *
 * Same threshold settings as MemoryMonitor. "ignored_filesystems" is a comma
 * separated list of mount points to skip.
 */
class FilesystemMonitor : public core::MonitorModule {
public:
    FilesystemMonitor();

    std::string buildCommand(const core::ModuleContext& context) const override;
    core::MonitorDataPoint parse(const core::ExecutionOutput& output,
                                 const core::ModuleContext& context) const override;
};

/**
 * @brief LVM physical volumes, Critical when a volume is missing.
 *
 * Not counted toward the host aggregate.
 */
class LvmPhysicalVolumeMonitor : public core::MonitorModule {
public:
    LvmPhysicalVolumeMonitor();

    std::string buildCommand(const core::ModuleContext& context) const override;
    core::MonitorDataPoint parse(const core::ExecutionOutput& output,
                                 const core::ModuleContext& context) const override;
};

/**
 * @brief Maps a usage percentage to a criticality using the warning/error/critical threshold settings.
 */
core::Criticality usageCriticality(double percent, const core::ModuleContext& context);

/**
 * @brief Splits a comma separated setting into trimmed, non-empty items.
 */
std::vector<std::string> splitList(const std::string& value);

} // namespace hostkeeper::infra::builtin
