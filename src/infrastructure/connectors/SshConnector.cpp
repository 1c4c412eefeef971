#include "infrastructure/connectors/SshConnector.hpp"

#include "core/types/Errors.hpp"
#include "infrastructure/connectors/ProcessRunner.hpp"

#include <spdlog/spdlog.h>

namespace hostkeeper::infra {

namespace {

// ssh reserves exit status 255 for its own errors.
constexpr int SshErrorExitCode = 255;

constexpr const char* OptionPrefix = "ssh_option.";

} // namespace

SshConnector::SshConnector(SshSettings settings) : settings_(std::move(settings)) {
    if (settings_.controlDir.empty()) {
        settings_.controlDir = std::filesystem::temp_directory_path() / "hostkeeper-ssh";
    }
    std::error_code ec;
    std::filesystem::create_directories(settings_.controlDir, ec);
    if (ec) {
        spdlog::warn("Failed to create ssh control directory {}: {}", settings_.controlDir.string(),
                     ec.message());
    } else {
        std::filesystem::permissions(settings_.controlDir, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::replace, ec);
    }
}

std::unique_ptr<core::ISession> SshConnector::openSession(const core::ConnectorConfig& config) {
    auto controlPath = (settings_.controlDir / ("s" + std::to_string(nextSessionId_++))).string();
    auto session = std::make_unique<SshSession>(settings_, config, controlPath);

    // Establishes the master connection and surfaces authentication problems early.
    try {
        session->execute("true", std::chrono::seconds(config.connectTimeoutSeconds + 5));
    } catch (const core::ExecutionError& e) {
        throw core::ConnectionError("Unexpected response from " + config.address + ": " + e.what());
    }

    spdlog::debug("[{}] Opened ssh session {}", config.hostId, controlPath);
    return session;
}

std::vector<std::string> SshConnector::buildArguments(const SshSettings& settings,
                                                      const core::ConnectorConfig& config,
                                                      const std::string& controlPath,
                                                      const std::string& command) {
    std::vector<std::string> args = {
        "-o", "BatchMode=yes",
        "-o", "ConnectTimeout=" + std::to_string(config.connectTimeoutSeconds),
        "-o", std::string("StrictHostKeyChecking=") + (settings.strictHostKeyChecking ? "yes" : "no"),
        "-o", "ControlMaster=auto",
        "-o", "ControlPath=" + controlPath,
        "-o", "ControlPersist=" + std::to_string(settings.controlPersistSeconds),
        "-p", std::to_string(config.port),
    };

    if (!config.identityFile.empty()) {
        args.insert(args.end(), {"-i", config.identityFile, "-o", "IdentitiesOnly=yes"});
    }
    if (!config.username.empty()) {
        args.insert(args.end(), {"-l", config.username});
    }

    const std::string prefix = OptionPrefix;
    for (const auto& [key, value] : config.options) {
        if (key.rfind(prefix, 0) == 0 && key.size() > prefix.size()) {
            args.insert(args.end(), {"-o", key.substr(prefix.size()) + "=" + value});
        }
    }

    args.push_back("--");
    args.push_back(config.address);
    args.push_back(command);
    return args;
}

SshSession::SshSession(SshSettings settings, core::ConnectorConfig config, std::string controlPath)
    : settings_(std::move(settings)), config_(std::move(config)), controlPath_(std::move(controlPath)) {}

SshSession::~SshSession() {
    close();
}

core::ExecutionOutput SshSession::execute(const std::string& command, std::chrono::milliseconds timeout) {
    if (!isOpen()) {
        throw core::ConnectionError("Session to " + config_.address + " is closed");
    }

    auto args = SshConnector::buildArguments(settings_, config_, controlPath_, command);
    spdlog::debug("[{}] ssh: {}", config_.hostId, command);
    auto result = ProcessRunner::run(settings_.binary, args, timeout);

    if (result.failedToStart) {
        broken_ = true;
        throw core::ConnectionError(result.stderrText);
    }
    if (result.timedOut) {
        broken_ = true;
        throw core::ConnectionError("Command timed out on " + config_.address);
    }
    if (result.exitCode == SshErrorExitCode || result.exitCode < 0) {
        broken_ = true;
        auto message = result.stderrText.empty() ? std::string("ssh failed") : result.stderrText;
        while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
            message.pop_back();
        }
        throw core::ConnectionError(config_.address + ": " + message);
    }
    if (result.exitCode != 0) {
        throw core::ExecutionError("Command exited with status " + std::to_string(result.exitCode),
                                   result.exitCode, std::move(result.stdoutText),
                                   std::move(result.stderrText));
    }

    return {std::move(result.stdoutText), std::move(result.stderrText), result.exitCode};
}

void SshSession::close() {
    if (!open_.exchange(false)) {
        return;
    }

    std::vector<std::string> args = {"-o", "ControlPath=" + controlPath_, "-O", "exit", config_.address};
    auto result = ProcessRunner::run(settings_.binary, args, std::chrono::seconds(2));
    if (!result.success()) {
        spdlog::debug("[{}] Control master {} already gone", config_.hostId, controlPath_);
    }
}

} // namespace hostkeeper::infra
