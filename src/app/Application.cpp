#include "app/Application.hpp"

#include "core/types/Errors.hpp"
#include "infrastructure/config/DefinitionLoader.hpp"
#include "infrastructure/connectors/SshConnector.hpp"

#include <QCommandLineParser>
#include <QStandardPaths>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>

namespace hostkeeper::app {

Application* Application::instance_ = nullptr;
std::atomic<int> Application::pendingSignal_{0};

Application::Application(int& argc, char** argv) {
    instance_ = this;

    qtApp_ = std::make_unique<QCoreApplication>(argc, argv);
    qtApp_->setApplicationName("hostkeeper");
    qtApp_->setApplicationVersion("1.0.0");
    qtApp_->setOrganizationName("HostKeeper");

    options_ = parseArguments();

    auto configDir = options_.configDir;
    if (configDir.empty()) {
        configDir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation).toStdString();
    }
    config_ = std::make_unique<infra::ConfigManager>(configDir);
    if (!config_->load()) {
        spdlog::warn("Continuing with default engine settings");
    }

    initializeLogging();
    if (!options_.checkOnly) {
        initializeComponents();
    }
}

Application::~Application() {
    spdlog::info("Application shutting down...");

    signalTimer_.stop();
    viewModel_.reset();
    if (engine_) {
        engine_->stop();
    }
    engine_.reset();
    database_.reset();

    spdlog::default_logger()->flush();
    instance_ = nullptr;
}

Options Application::parseArguments() {
    QCommandLineParser parser;
    parser.setApplicationDescription("Monitors and manages Linux hosts over ssh");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption({"c", "config-dir"}, "Directory holding config.json and the definitions.",
                                    "dir");
    QCommandLineOption levelOption({"l", "log-level"}, "Console log level (trace, debug, info, warn, error).",
                                   "level");
    QCommandLineOption checkOption("check", "Validate the host definitions and exit.");
    QCommandLineOption noRefreshOption("no-refresh", "Do not initialize the hosts at startup.");
    parser.addOption(configOption);
    parser.addOption(levelOption);
    parser.addOption(checkOption);
    parser.addOption(noRefreshOption);
    parser.process(*qtApp_);

    Options options;
    if (parser.isSet(configOption)) {
        options.configDir = parser.value(configOption).toStdString();
    }
    if (parser.isSet(levelOption)) {
        options.logLevel = parser.value(levelOption).toStdString();
    }
    options.checkOnly = parser.isSet(checkOption);
    options.skipInitialRefresh = parser.isSet(noRefreshOption);
    return options;
}

void Application::initializeLogging() {
    const auto& logging = config_->config().logging;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(spdlog::level::from_str(options_.logLevel.value_or(logging.level)));
    std::vector<spdlog::sink_ptr> sinks{consoleSink};

    std::filesystem::path logPath;
    if (logging.logToFile && !options_.checkOnly) {
        std::error_code ec;
        std::filesystem::create_directories(config_->dataDir(), ec);
        logPath = config_->dataDir() / "hostkeeperd.log";

        auto fileSink =
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath.string(), 5 * 1024 * 1024, 3);
        fileSink->set_level(spdlog::level::from_str(logging.fileLevel));
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>("hostkeeper", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    spdlog::info("HostKeeper {} starting...", qtApp_->applicationVersion().toStdString());
    if (!logPath.empty()) {
        spdlog::info("Log file: {}", logPath.string());
    }
}

void Application::initializeComponents() {
    auto engineConfig = config_->config();
    if (options_.skipInitialRefresh) {
        engineConfig.engine.refreshHostsOnStart = false;
    }

    // Database
    if (engineConfig.cache.enableCache) {
        database_ = std::make_shared<infra::Database>(config_->databasePath().string());
        database_->runMigrations();
    }

    // Engine
    infra::DefinitionLoader loader(config_->configDir());
    engine_ = std::make_unique<engine::HostEngine>(
        engineConfig, [loader] { return loader.load(); }, database_);

    infra::SshSettings ssh;
    ssh.binary = engineConfig.connectors.sshBinary;
    ssh.controlDir = config_->dataDir() / "ssh";
    ssh.controlPersistSeconds = engineConfig.connectors.controlPersistSeconds;
    ssh.strictHostKeyChecking = engineConfig.connectors.strictHostKeyChecking;
    engine_->registerConnector(std::make_shared<infra::SshConnector>(ssh));

    // ViewModel
    viewModel_ = std::make_unique<viewmodels::HostEngineViewModel>(*engine_);
    connectViewModel();

    spdlog::info("Application components initialized");
}

void Application::connectViewModel() {
    auto* vm = viewModel_.get();

    QObject::connect(vm, &viewmodels::HostEngineViewModel::hostInitialized, [](const QString& hostId) {
        spdlog::info("[{}] Host initialized", hostId.toStdString());
    });
    QObject::connect(vm, &viewmodels::HostEngineViewModel::hostInitializedFromCache, [](const QString& hostId) {
        spdlog::info("[{}] Showing cached state until the live refresh completes", hostId.toStdString());
    });
    QObject::connect(vm, &viewmodels::HostEngineViewModel::monitorStateChanged,
                     [](const QString& hostId, const QString& monitorId, core::Criticality criticality) {
                         const auto problem =
                             core::severityRank(criticality) >= core::severityRank(core::Criticality::Warning);
                         const auto level = problem ? spdlog::level::warn : spdlog::level::info;
                         spdlog::log(level, "[{}] State changed to {} by {}", hostId.toStdString(),
                                     core::criticalityToString(criticality), monitorId.toStdString());
                     });
    QObject::connect(vm, &viewmodels::HostEngineViewModel::commandResultReceived,
                     [](const QString& hostId, const core::CommandResult& result) {
                         spdlog::debug("[{}] {} finished: {}", hostId.toStdString(), result.commandId(),
                                       core::criticalityToString(result.criticality()));
                     });
    QObject::connect(vm, &viewmodels::HostEngineViewModel::errorReceived,
                     [](core::Criticality criticality, const QString& message) {
                         const auto level =
                             criticality == core::Criticality::Critical ? spdlog::level::err : spdlog::level::warn;
                         spdlog::log(level, "{}", message.toStdString());
                     });
    QObject::connect(vm, &viewmodels::HostEngineViewModel::confirmationDialogOpened,
                     [](const QString& hostId, const QString& commandId, core::InvocationId, const QString&) {
                         spdlog::info("[{}] {} awaits confirmation, not executed", hostId.toStdString(),
                                      commandId.toStdString());
                     });
    QObject::connect(vm, &viewmodels::HostEngineViewModel::configurationChanged, [](const QStringList& hostIds) {
        spdlog::info("Configuration changed for {} hosts", hostIds.size());
    });
}

int Application::checkDefinitions() {
    try {
        infra::ConfigResolver resolver(
            [loader = infra::DefinitionLoader(config_->configDir())] { return loader.load(); },
            infra::groupMergeOrderFromString(config_->config().engine.groupMergeOrder));
        resolver.reloadAll();
        spdlog::info("Definitions are valid: {} hosts", resolver.hostIds().size());
        return 0;
    } catch (const core::ConfigError& e) {
        spdlog::error("Invalid definitions: {}", e.what());
        return 1;
    }
}

int Application::run() {
    if (options_.checkOnly) {
        return checkDefinitions();
    }

    installSignalHandlers();
    QObject::connect(&signalTimer_, &QTimer::timeout, [this]() { pollSignals(); });
    signalTimer_.start(200);

    if (!engine_->start()) {
        spdlog::warn("Engine started without a valid configuration");
    }

    return qtApp_->exec();
}

void Application::pollSignals() {
    switch (pendingSignal_.exchange(0)) {
    case SIGHUP:
        spdlog::info("Reloading host definitions");
        engine_->reconfigure();
        break;
    case SIGINT:
    case SIGTERM:
        spdlog::info("Termination requested");
        engine_->stop();
        qtApp_->quit();
        break;
    default:
        break;
    }
}

void Application::installSignalHandlers() {
    std::signal(SIGINT, &Application::handleSignal);
    std::signal(SIGTERM, &Application::handleSignal);
    std::signal(SIGHUP, &Application::handleSignal);
}

void Application::handleSignal(int signal) {
    pendingSignal_ = signal;
}

Application& Application::instance() {
    return *instance_;
}

} // namespace hostkeeper::app
