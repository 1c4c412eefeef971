#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace hostkeeper::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        auto problem = validate();
        if (!problem.empty()) {
            spdlog::error("Invalid configuration in {}: {}", configPath_.string(), problem);
            config_ = EngineConfig{};
            return false;
        }

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

std::string ConfigManager::validate() const {
    const auto& e = config_.engine;
    if (e.workerThreads < 1) {
        return "engine.worker_threads must be at least 1";
    }
    if (e.maxInFlightPerHost < 1) {
        return "engine.max_in_flight_per_host must be at least 1";
    }
    if (e.commandTimeoutSeconds < 1) {
        return "engine.command_timeout_seconds must be at least 1";
    }
    if (e.retryBackoffMs < 0 || e.autoRefreshIntervalSeconds < 0) {
        return "engine intervals must not be negative";
    }
    if (e.groupMergeOrder != "last_wins" && e.groupMergeOrder != "first_wins") {
        return "engine.group_merge_order must be \"last_wins\" or \"first_wins\"";
    }
    if (config_.connectors.sessionPoolSize < 1) {
        return "connectors.session_pool_size must be at least 1";
    }
    if (config_.cache.persistIntervalSeconds < 0 || config_.cache.timeToLiveSeconds < 0 ||
        config_.cache.initialValueTimeToLiveSeconds < 0) {
        return "cache intervals must not be negative";
    }
    if (config_.events.queueCapacity < 1) {
        return "events.queue_capacity must be at least 1";
    }
    if (config_.events.overflowPolicy != "drop_oldest" && config_.events.overflowPolicy != "block") {
        return "events.overflow_policy must be \"drop_oldest\" or \"block\"";
    }
    return {};
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // Engine
    j["engine"]["worker_threads"] = config_.engine.workerThreads;
    j["engine"]["max_in_flight_per_host"] = config_.engine.maxInFlightPerHost;
    j["engine"]["command_timeout_seconds"] = config_.engine.commandTimeoutSeconds;
    j["engine"]["retry_backoff_ms"] = config_.engine.retryBackoffMs;
    j["engine"]["auto_refresh_interval_seconds"] = config_.engine.autoRefreshIntervalSeconds;
    j["engine"]["refresh_hosts_on_start"] = config_.engine.refreshHostsOnStart;
    j["engine"]["group_merge_order"] = config_.engine.groupMergeOrder;

    // Connectors
    j["connectors"]["session_pool_size"] = config_.connectors.sessionPoolSize;
    j["connectors"]["ssh_binary"] = config_.connectors.sshBinary;
    j["connectors"]["control_persist_seconds"] = config_.connectors.controlPersistSeconds;
    j["connectors"]["strict_host_key_checking"] = config_.connectors.strictHostKeyChecking;

    // Cache
    j["cache"]["enable_cache"] = config_.cache.enableCache;
    j["cache"]["provide_initial_value"] = config_.cache.provideInitialValue;
    j["cache"]["initial_value_time_to_live"] = config_.cache.initialValueTimeToLiveSeconds;
    j["cache"]["prefer_cache"] = config_.cache.preferCache;
    j["cache"]["time_to_live"] = config_.cache.timeToLiveSeconds;
    j["cache"]["persist_interval_seconds"] = config_.cache.persistIntervalSeconds;

    // Events
    j["events"]["queue_capacity"] = config_.events.queueCapacity;
    j["events"]["overflow_policy"] = config_.events.overflowPolicy;

    // Logging
    j["logging"]["level"] = config_.logging.level;
    j["logging"]["file_level"] = config_.logging.fileLevel;
    j["logging"]["log_to_file"] = config_.logging.logToFile;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    // Engine
    if (j.contains("engine")) {
        const auto& e = j["engine"];
        config_.engine.workerThreads = e.value("worker_threads", 4);
        config_.engine.maxInFlightPerHost = e.value("max_in_flight_per_host", 2);
        config_.engine.commandTimeoutSeconds = e.value("command_timeout_seconds", 30);
        config_.engine.retryBackoffMs = e.value("retry_backoff_ms", 500);
        config_.engine.autoRefreshIntervalSeconds = e.value("auto_refresh_interval_seconds", 0);
        config_.engine.refreshHostsOnStart = e.value("refresh_hosts_on_start", true);
        config_.engine.groupMergeOrder = e.value("group_merge_order", "last_wins");
    }

    // Connectors
    if (j.contains("connectors")) {
        const auto& c = j["connectors"];
        config_.connectors.sessionPoolSize = c.value("session_pool_size", 2);
        config_.connectors.sshBinary = c.value("ssh_binary", "ssh");
        config_.connectors.controlPersistSeconds = c.value("control_persist_seconds", 60);
        config_.connectors.strictHostKeyChecking = c.value("strict_host_key_checking", true);
    }

    // Cache
    if (j.contains("cache")) {
        const auto& c = j["cache"];
        config_.cache.enableCache = c.value("enable_cache", true);
        config_.cache.provideInitialValue = c.value("provide_initial_value", true);
        config_.cache.initialValueTimeToLiveSeconds = c.value("initial_value_time_to_live", 604800);
        config_.cache.preferCache = c.value("prefer_cache", false);
        config_.cache.timeToLiveSeconds = c.value("time_to_live", 300);
        config_.cache.persistIntervalSeconds = c.value("persist_interval_seconds", 300);
    }

    // Events
    if (j.contains("events")) {
        const auto& ev = j["events"];
        config_.events.queueCapacity = ev.value("queue_capacity", 1024);
        config_.events.overflowPolicy = ev.value("overflow_policy", "drop_oldest");
    }

    // Logging
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config_.logging.level = l.value("level", "info");
        config_.logging.fileLevel = l.value("file_level", "debug");
        config_.logging.logToFile = l.value("log_to_file", true);
    }
}

std::filesystem::path ConfigManager::databasePath() const {
    return configDir_ / "hostkeeper.db";
}

std::filesystem::path ConfigManager::dataDir() const {
    return configDir_ / "data";
}

} // namespace hostkeeper::infra
