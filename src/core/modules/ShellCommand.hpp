/**
 * @file ShellCommand.hpp
 * @brief Builder for remote shell command lines with argument quoting.
 */

#pragma once

#include <initializer_list>
#include <string>
#include <vector>

namespace hostkeeper::core {

/**
 * @brief Builds a POSIX shell command line.
 *
 * Arguments are quoted when they contain anything outside a conservative safe
 * set, so operator-supplied values can never introduce shell syntax.
 *
 * @code
 * auto cmd = ShellCommand({"systemctl", "restart", unit}).useSudoIf(ctx.useSudo());
 * cmd.toString(); // "sudo systemctl restart 'my unit'"
 * @endcode
 */
class ShellCommand {
public:
    ShellCommand() = default;
    ShellCommand(std::initializer_list<std::string> arguments);

    ShellCommand& argument(const std::string& arg);
    ShellCommand& arguments(const std::vector<std::string>& args);

    /**
     * @brief Prefixes the first segment with sudo when the condition holds.
     */
    ShellCommand& useSudoIf(bool condition);

    /**
     * @brief Appends a pipeline stage.
     */
    ShellCommand& pipeTo(const ShellCommand& next);

    [[nodiscard]] bool empty() const { return segments_.empty() || segments_.front().empty(); }
    [[nodiscard]] std::string toString() const;

    /**
     * @brief Quotes a single argument for the shell.
     */
    [[nodiscard]] static std::string quote(const std::string& arg);

private:
    std::vector<std::vector<std::string>> segments_{{}};
    bool sudo_{false};
};

} // namespace hostkeeper::core
