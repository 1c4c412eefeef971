#pragma once

#include "engine/HostEngine.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/database/Database.hpp"
#include "viewmodels/HostEngineViewModel.hpp"

#include <QCoreApplication>
#include <QTimer>

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace hostkeeper::app {

/**
 * @brief Command line options of hostkeeperd.
 */
struct Options {
    std::filesystem::path configDir;    ///< Empty selects the platform config location
    std::optional<std::string> logLevel; ///< Overrides logging.level from config.json
    bool checkOnly{false};              ///< Validate the definitions and exit
    bool skipInitialRefresh{false};     ///< Do not initialize hosts at startup
};

/**
 * @brief The hostkeeperd daemon: owns the engine and runs the Qt event loop.
 *
 * SIGINT and SIGTERM stop the daemon, SIGHUP reloads the host definitions.
 */
class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    int run();

    // Accessors
    infra::ConfigManager& config() { return *config_; }
    engine::HostEngine& engine() { return *engine_; }
    viewmodels::HostEngineViewModel& viewModel() { return *viewModel_; }

    static Application& instance();

private:
    Options parseArguments();
    void initializeLogging();
    void initializeComponents();
    void connectViewModel();
    int checkDefinitions();
    void pollSignals();

    static void installSignalHandlers();
    static void handleSignal(int signal);

    std::unique_ptr<QCoreApplication> qtApp_;
    Options options_;
    std::unique_ptr<infra::ConfigManager> config_;
    std::shared_ptr<infra::Database> database_;
    std::unique_ptr<engine::HostEngine> engine_;
    std::unique_ptr<viewmodels::HostEngineViewModel> viewModel_;
    QTimer signalTimer_;

    static Application* instance_;
    static std::atomic<int> pendingSignal_;
};

} // namespace hostkeeper::app
