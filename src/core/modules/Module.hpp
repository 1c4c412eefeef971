/**
 * @file Module.hpp
 * @brief Monitor and command module definitions.
 *
 * A module turns parameters, host facts and prior monitor data into a remote
 * command string, and turns the command output back into a MonitorDataPoint
 * or a CommandResult. Modules are registered once at startup and are
 * stateless afterwards, so one instance serves every host concurrently.
 */

#pragma once

#include "core/services/IConnector.hpp"
#include "core/types/CommandResult.hpp"
#include "core/types/Definitions.hpp"
#include "core/types/HostFacts.hpp"
#include "core/types/InputSpec.hpp"
#include "core/types/Invocation.hpp"
#include "core/types/MonitorDataPoint.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hostkeeper::core {

/**
 * @brief How a monitor value is presented.
 */
enum class DisplayStyle : int { Text = 0, CriticalityLevel = 1, Icon = 2, ProgressBar = 3 };

[[nodiscard]] std::string displayStyleToString(DisplayStyle style);

/**
 * @brief Presentation metadata of a module.
 */
struct DisplayOptions {
    std::string text;                        ///< Human readable name
    std::string unit;
    std::string category;                    ///< e.g. "host", "systemd", "docker-compose"
    DisplayStyle style{DisplayStyle::Text};
    bool multivalue{false};                  ///< Monitor returns child data points
    bool ignoreFromSummary{false};           ///< Monitor does not count toward the host aggregate
    std::string parentId;                    ///< Monitor a child command acts on
    int multivalueLevel{0};                  ///< Child depth the command applies to, 0 for host level
    std::vector<std::string> dependsOnTags;  ///< Child rows must carry one of these tags
    std::vector<std::string> dependsOnNoTags;///< Child rows must carry none of these tags

    /**
     * @brief Checks the tag conditions against the tags of a child data point.
     */
    [[nodiscard]] bool acceptsTags(const std::vector<std::string>& tags) const;

    bool operator==(const DisplayOptions& other) const = default;
};

/**
 * @brief Capability set derived from a module descriptor.
 */
struct ModuleCapabilities {
    bool buildsCommand{true};
    bool parsesResult{true};
    bool requiresConfirmation{false};
    bool requiresInput{false};
};

/**
 * @brief Static metadata of a module.
 */
struct ModuleDescriptor {
    std::string id;
    ModuleKind kind{ModuleKind::Monitor};
    std::string version{"0.0.1"};
    std::string description;
    DisplayOptions display;
    bool internal{false};                         ///< Hidden from listings, run by the engine itself
    bool acceptsNonZeroExit{false};               ///< Parse output even when the exit status is non-zero
    bool idempotent{true};                        ///< Safe to resend after the connection dropped mid-command
    std::vector<std::string> requiredSubsystems;  ///< Any one of these must be present

    // Commands only
    std::string confirmationText;                 ///< Non-empty requires confirmation
    std::vector<InputSpec> inputs;                ///< Params asked from the operator
    size_t inputOffset{0};                        ///< Index of the first param bound to an input
    bool opensDetails{false};                     ///< Result is shown in a details dialog
    bool opensTextView{false};                    ///< Result is shown in a text dialog
    bool showInNotification{true};

    [[nodiscard]] ModuleCapabilities capabilities() const;
};

/**
 * @brief Everything a module may look at when building or parsing a command.
 */
struct ModuleContext {
    std::string hostId;
    std::vector<std::string> params;
    HostFacts facts;
    std::vector<std::string> hostSettings;
    ModuleConfig config;                     ///< Effective settings of this module for the host
    std::optional<MonitorDataPoint> priorData;

    /**
     * @brief True when the host is configured with the "use_sudo" flag.
     */
    [[nodiscard]] bool useSudo() const;

    [[nodiscard]] std::string param(size_t index, const std::string& fallback = {}) const;
    [[nodiscard]] std::string setting(const std::string& key, const std::string& fallback = {}) const {
        return config.setting(key, fallback);
    }

    /**
     * @brief Reads a numeric setting.
     * @throws ValidationError if the setting is present but not a number.
     */
    [[nodiscard]] double numericSetting(const std::string& key, double fallback) const;
};

/**
 * @brief Common base of monitor and command modules.
 */
class Module {
public:
    explicit Module(ModuleDescriptor descriptor);
    virtual ~Module() = default;

    Module(const Module&) = delete;
    Module& operator=(const Module&) = delete;

    [[nodiscard]] const ModuleDescriptor& descriptor() const { return descriptor_; }
    [[nodiscard]] const std::string& id() const { return descriptor_.id; }
    [[nodiscard]] ModuleKind kind() const { return descriptor_.kind; }

    /**
     * @brief Platform applicability predicate.
     *
     * Unknown facts accept every module. Known facts require a Linux host and,
     * when the descriptor lists subsystems, one of them.
     */
    [[nodiscard]] virtual bool appliesTo(const HostFacts& facts) const;

    /**
     * @brief Builds the remote command string. Pure and deterministic.
     * @throws ValidationError if the parameters are unusable.
     */
    [[nodiscard]] virtual std::string buildCommand(const ModuleContext& context) const = 0;

protected:
    ModuleDescriptor descriptor_;
};

class MonitorModule : public Module {
public:
    using Module::Module;

    /**
     * @brief Parses command output into a data point.
     * @throws ParseError if the output is malformed.
     */
    [[nodiscard]] virtual MonitorDataPoint parse(const ExecutionOutput& output,
                                                 const ModuleContext& context) const = 0;

    /**
     * @brief Extracts host facts from the output. Only platform discovery monitors override this.
     */
    [[nodiscard]] virtual std::optional<HostFacts> discoverFacts(const ExecutionOutput& output) const;
};

class CommandModule : public Module {
public:
    using Module::Module;

    /**
     * @brief Parses command output into a result. The default reports trimmed stdout as success.
     * @throws ParseError if the output is malformed.
     */
    [[nodiscard]] virtual CommandResult parse(const ExecutionOutput& output,
                                              const ModuleContext& context) const;

    /**
     * @brief Input specs with host configuration applied.
     *
     * A "validator" setting replaces the validator pattern of the first input.
     */
    [[nodiscard]] std::vector<InputSpec> effectiveInputs(const ModuleConfig& config) const;

    /**
     * @brief Checks params against the effective input specs.
     *
     * Input specs bind to the params starting at descriptor().inputOffset, in order.
     * @return Number of inputs still missing, 0 when complete.
     * @throws ValidationError if a supplied value is rejected.
     */
    [[nodiscard]] size_t validateInput(const std::vector<std::string>& params,
                                       const ModuleConfig& config = {}) const;
};

/**
 * @brief Removes leading and trailing whitespace.
 */
[[nodiscard]] std::string trimmed(const std::string& text);

/**
 * @brief Splits text into lines, dropping the trailing empty line.
 */
[[nodiscard]] std::vector<std::string> splitLines(const std::string& text);

/**
 * @brief Splits a line on runs of whitespace.
 */
[[nodiscard]] std::vector<std::string> splitFields(const std::string& line);

} // namespace hostkeeper::core
