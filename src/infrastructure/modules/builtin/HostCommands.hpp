#pragma once

#include "core/modules/Module.hpp"

namespace hostkeeper::infra::builtin {

/**
 * @brief Powers the host off or reboots it. Requires confirmation and is never resent.
 */
class PowerCommand : public core::CommandModule {
public:
    enum class Action { Shutdown, Reboot };

    explicit PowerCommand(Action action);

    std::string buildCommand(const core::ModuleContext& context) const override;

private:
    Action action_;
};

/**
 * @brief Paginated journal viewer.
 *
 * Params: [target, grep, page_number, page_size]. Target is "all" (or empty),
 * "dmesg", or a unit name. Page 1 holds the newest page_size lines.
 * Page numbers above MaxPage and page sizes above MaxPageSize are rejected.
 */
class LogsCommand : public core::CommandModule {
public:
    static constexpr int DefaultPageSize = 400;
    static constexpr int MaxPageSize = 10000;
    static constexpr int MaxPage = 1000;

    LogsCommand();

    std::string buildCommand(const core::ModuleContext& context) const override;
    core::CommandResult parse(const core::ExecutionOutput& output,
                              const core::ModuleContext& context) const override;
};

/**
 * @brief Upgrades all packages with the package manager found on the host.
 */
class PackagesUpdateCommand : public core::CommandModule {
public:
    PackagesUpdateCommand();

    std::string buildCommand(const core::ModuleContext& context) const override;
};

/**
 * @brief Changes the host name, asked from the operator through an input field.
 */
class SetHostnameCommand : public core::CommandModule {
public:
    static constexpr const char* HostnamePattern =
        "[A-Za-z0-9]([A-Za-z0-9-]{0,61}[A-Za-z0-9])?(\\.[A-Za-z0-9]([A-Za-z0-9-]{0,61}[A-Za-z0-9])?)*";

    SetHostnameCommand();

    std::string buildCommand(const core::ModuleContext& context) const override;
};

} // namespace hostkeeper::infra::builtin
