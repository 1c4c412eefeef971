#pragma once

#include "core/services/IConnector.hpp"

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

namespace hostkeeper::infra {

/**
 * @brief Settings shared by all ssh sessions.
 */
struct SshSettings {
    std::string binary{"ssh"};
    std::filesystem::path controlDir;  ///< Directory for ControlMaster sockets
    int controlPersistSeconds{60};
    bool strictHostKeyChecking{true};
};

/**
 * @brief Connector running commands through the system OpenSSH client.
 *
 * Every session owns a ControlMaster socket, so the first command
 * authenticates and later commands of the session reuse that connection.
 * BatchMode is always on: missing keys fail instead of prompting.
 *
 * Connector settings read from the host configuration ("ssh" connector):
 * port, username, private_key_path, connection_timeout, plus any
 * "ssh_option.<Name>" which is passed as "-o <Name>=<value>".
 */
class SshConnector : public core::IConnector {
public:
    explicit SshConnector(SshSettings settings);

    std::string id() const override { return "ssh"; }
    std::unique_ptr<core::ISession> openSession(const core::ConnectorConfig& config) override;

    /**
     * @brief Builds the ssh argument list for one remote command.
     */
    static std::vector<std::string> buildArguments(const SshSettings& settings,
                                                   const core::ConnectorConfig& config,
                                                   const std::string& controlPath,
                                                   const std::string& command);

private:
    SshSettings settings_;
    std::atomic<uint64_t> nextSessionId_{1};
};

/**
 * @brief One multiplexed ssh connection to a host.
 */
class SshSession : public core::ISession {
public:
    SshSession(SshSettings settings, core::ConnectorConfig config, std::string controlPath);
    ~SshSession() override;

    core::ExecutionOutput execute(const std::string& command, std::chrono::milliseconds timeout) override;
    bool isOpen() const override { return open_ && !broken_; }
    void close() override;

private:
    SshSettings settings_;
    core::ConnectorConfig config_;
    std::string controlPath_;
    std::atomic<bool> open_{true};
    std::atomic<bool> broken_{false};  ///< Transport failed, the session must not be reused
};

} // namespace hostkeeper::infra
