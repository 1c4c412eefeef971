#include "infrastructure/connectors/ProcessRunner.hpp"

#include <QElapsedTimer>
#include <QProcess>
#include <QStringList>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace hostkeeper::infra {

ProcessResult ProcessRunner::run(const std::string& program, const std::vector<std::string>& args,
                                 std::chrono::milliseconds timeout) {
    QStringList arguments;
    for (const auto& arg : args) {
        arguments << QString::fromStdString(arg);
    }

    QProcess process;
    QElapsedTimer elapsed;
    elapsed.start();
    process.start(QString::fromStdString(program), arguments);

    ProcessResult result;
    const int timeoutMs = static_cast<int>(timeout.count());
    if (!process.waitForStarted(timeoutMs)) {
        result.failedToStart = true;
        result.stderrText = "Failed to start " + program + ": " + process.errorString().toStdString();
        return result;
    }

    const int remainingMs = std::max(0, timeoutMs - static_cast<int>(elapsed.elapsed()));
    if (!process.waitForFinished(remainingMs)) {
        process.kill();
        process.waitForFinished(500);
        result.timedOut = true;
        result.stdoutText = QString::fromUtf8(process.readAllStandardOutput()).toStdString();
        result.stderrText = "Command timed out.";
        spdlog::debug("{} timed out after {} ms", program, elapsed.elapsed());
        return result;
    }

    result.exitCode = process.exitStatus() == QProcess::NormalExit ? process.exitCode() : -1;
    result.stdoutText = QString::fromUtf8(process.readAllStandardOutput()).toStdString();
    result.stderrText = QString::fromUtf8(process.readAllStandardError()).toStdString();
    return result;
}

} // namespace hostkeeper::infra
