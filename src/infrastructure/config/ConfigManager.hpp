#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace hostkeeper::infra {

/**
 * @brief Dispatcher and scheduling settings ("engine" section).
 */
struct EngineSettings {
    int workerThreads{4};                ///< Size of the asio thread pool.
    int maxInFlightPerHost{2};           ///< Concurrent invocations per host.
    int commandTimeoutSeconds{30};       ///< Upper bound for one remote execution.
    int retryBackoffMs{500};             ///< Base delay before retrying a failed connection.
    int autoRefreshIntervalSeconds{0};   ///< Periodic refresh of initialized hosts, 0 disables.
    bool refreshHostsOnStart{true};      ///< Initialize every host when the engine starts.
    std::string groupMergeOrder{"last_wins"}; ///< "last_wins" or "first_wins".
};

/**
 * @brief Session pooling and ssh client settings ("connectors" section).
 */
struct ConnectorSettings {
    int sessionPoolSize{2};              ///< Sessions kept per host.
    std::string sshBinary{"ssh"};        ///< OpenSSH client executable.
    int controlPersistSeconds{60};       ///< Lifetime of an idle ControlMaster connection.
    bool strictHostKeyChecking{true};    ///< Passed to ssh as StrictHostKeyChecking.
};

/**
 * @brief State cache settings ("cache" section).
 */
struct CacheSettings {
    bool enableCache{true};                     ///< Persist host state across restarts.
    bool provideInitialValue{true};             ///< Show cached data while hosts initialize.
    int initialValueTimeToLiveSeconds{604800};  ///< Older entries are not shown as initial values.
    bool preferCache{false};                    ///< Serve fresh cache entries instead of refreshing.
    int timeToLiveSeconds{300};                 ///< Age under which a cache entry counts as fresh.
    int persistIntervalSeconds{300};            ///< Periodic save, 0 saves only at shutdown.
};

/**
 * @brief Event delivery settings ("events" section).
 */
struct EventSettings {
    int queueCapacity{1024};                    ///< Bound of the event queue.
    std::string overflowPolicy{"drop_oldest"};  ///< "drop_oldest" or "block".
};

/**
 * @brief Logging settings ("logging" section).
 */
struct LoggingSettings {
    std::string level{"info"};       ///< Console log level.
    std::string fileLevel{"debug"};  ///< Log file level.
    bool logToFile{true};
};

/**
 * @brief Engine configuration as stored in config.json.
 */
struct EngineConfig {
    EngineSettings engine;
    ConnectorSettings connectors;
    CacheSettings cache;
    EventSettings events;
    LoggingSettings logging;
};

/**
 * @brief Manages engine configuration persistence.
 *
 * Loads and saves config.json in the configuration directory. Host, group
 * and template definitions live next to it and are read by the DefinitionLoader.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk, writing defaults if the file is missing.
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    EngineConfig& config() { return config_; }
    const EngineConfig& config() const { return config_; }

    std::filesystem::path configPath() const { return configPath_; }

    /**
     * @brief Returns the path to the state cache database.
     */
    std::filesystem::path databasePath() const;

    /**
     * @brief Returns the directory holding log files and ssh control sockets.
     */
    std::filesystem::path dataDir() const;

    const std::filesystem::path& configDir() const { return configDir_; }

    /**
     * @brief Checks value ranges and enumerated strings.
     * @return Empty string if valid, otherwise a description of the first problem.
     */
    std::string validate() const;

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    EngineConfig config_;
};

} // namespace hostkeeper::infra
