#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace hostkeeper::infra {

/**
 * @brief Outcome of a local child process.
 */
struct ProcessResult {
    int exitCode{-1};
    std::string stdoutText;
    std::string stderrText;
    bool timedOut{false};       ///< Killed after the timeout expired
    bool failedToStart{false};  ///< Program could not be started at all

    [[nodiscard]] bool success() const { return !timedOut && !failedToStart && exitCode == 0; }
};

/**
 * @brief Runs local programs synchronously through QProcess.
 *
 * Usable from any thread, no Qt event loop required.
 */
class ProcessRunner {
public:
    static ProcessResult run(const std::string& program, const std::vector<std::string>& args,
                             std::chrono::milliseconds timeout);
};

} // namespace hostkeeper::infra
