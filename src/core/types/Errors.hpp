/**
 * @file Errors.hpp
 * @brief Exception types raised by the engine components.
 *
 * All per-invocation failures are converted to a CommandResult by the
 * dispatcher; these exceptions only travel between components.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace hostkeeper::core {

/**
 * @brief Structurally invalid definitions (unknown reference, nested group,
 * malformed validator pattern). A reload that raises it is aborted.
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Transient transport failure. The caller may retry with a fresh session.
 */
class ConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The remote command ran and exited with a non-zero status.
 */
class ExecutionError : public std::runtime_error {
public:
    ExecutionError(const std::string& message, int exitCode, std::string stdoutText,
                   std::string stderrText)
        : std::runtime_error(message)
        , exitCode_(exitCode)
        , stdout_(std::move(stdoutText))
        , stderr_(std::move(stderrText)) {}

    [[nodiscard]] int exitCode() const { return exitCode_; }
    [[nodiscard]] const std::string& stdoutText() const { return stdout_; }
    [[nodiscard]] const std::string& stderrText() const { return stderr_; }

private:
    int exitCode_;
    std::string stdout_;
    std::string stderr_;
};

/**
 * @brief Remote output did not have the shape a module expects.
 */
class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Operator-supplied input was rejected before anything was sent.
 */
class ValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace hostkeeper::core
