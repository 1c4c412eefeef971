/**
 * @file IConnector.hpp
 * @brief Interfaces for remote-session transports.
 *
 * A connector knows how to open sessions to a host over one transport. The
 * ConnectorRegistry pools the sessions and hands them out to the dispatcher.
 */

#pragma once

#include "core/types/EffectiveConfig.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace hostkeeper::core {

/**
 * @brief Captured output of one remote command.
 */
struct ExecutionOutput {
    std::string stdoutText;
    std::string stderrText;
    int exitCode{0};

    [[nodiscard]] bool success() const { return exitCode == 0; }
};

/**
 * @brief An open session to one host.
 *
 * Sessions are used by one invocation at a time.
 */
class ISession {
public:
    virtual ~ISession() = default;

    /**
     * @brief Runs a command on the host and waits for it to finish.
     * @param command Remote command line.
     * @param timeout Upper bound for the whole execution.
     * @return Output of a command that exited with status 0.
     * @throws ConnectionError on transport failure or timeout.
     * @throws ExecutionError if the command exited with a non-zero status.
     */
    virtual ExecutionOutput execute(const std::string& command, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Returns false once the session is known to be unusable.
     */
    virtual bool isOpen() const = 0;

    virtual void close() = 0;
};

/**
 * @brief Factory for sessions over one transport (e.g. "ssh").
 */
class IConnector {
public:
    virtual ~IConnector() = default;

    /**
     * @brief Identifier under which the connector is registered.
     */
    virtual std::string id() const = 0;

    /**
     * @brief Opens a new session to the host described by the config.
     * @throws ConnectionError if the host cannot be reached or authentication fails.
     */
    virtual std::unique_ptr<ISession> openSession(const ConnectorConfig& config) = 0;
};

} // namespace hostkeeper::core
