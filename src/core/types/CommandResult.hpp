/**
 * @file CommandResult.hpp
 * @brief Outcome of a command invocation, or of a failed monitor refresh.
 */

#pragma once

#include "core/types/Criticality.hpp"
#include "core/types/Invocation.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace hostkeeper::core {

/**
 * @brief Immutable result record correlated to an invocation id.
 *
 * Constructed through the factory functions; with*() return modified copies.
 */
class CommandResult {
public:
    CommandResult() = default;

    static CommandResult success(std::string message, Criticality criticality = Criticality::Normal);
    static CommandResult warning(std::string message);
    static CommandResult error(std::string errorText, Criticality criticality = Criticality::Error);

    /**
     * @brief Result for output that did not match the module's expected shape.
     */
    static CommandResult parseFailure(std::string errorText);

    [[nodiscard]] CommandResult withInvocation(InvocationId id, std::string commandId) const;
    [[nodiscard]] CommandResult withFlags(bool showInNotification, bool opensDetailsDialog) const;
    [[nodiscard]] CommandResult markedFromCache() const;

    [[nodiscard]] InvocationId invocationId() const { return invocationId_; }
    [[nodiscard]] const std::string& commandId() const { return commandId_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] const std::string& errorText() const { return error_; }
    [[nodiscard]] Criticality criticality() const { return criticality_; }
    [[nodiscard]] bool showInNotification() const { return showInNotification_; }
    [[nodiscard]] bool opensDetailsDialog() const { return opensDetailsDialog_; }
    [[nodiscard]] bool fromCache() const { return fromCache_; }
    [[nodiscard]] std::chrono::system_clock::time_point timestamp() const { return timestamp_; }
    [[nodiscard]] bool isError() const { return !error_.empty(); }

    [[nodiscard]] nlohmann::json toJson() const;
    static CommandResult fromJson(const nlohmann::json& j);

    bool operator==(const CommandResult& other) const = default;

private:
    InvocationId invocationId_{0};
    std::string commandId_;
    std::string message_;
    std::string error_;
    Criticality criticality_{Criticality::Normal};
    bool showInNotification_{true};
    bool opensDetailsDialog_{false};
    bool fromCache_{false};
    std::chrono::system_clock::time_point timestamp_{std::chrono::system_clock::now()};
};

} // namespace hostkeeper::core
