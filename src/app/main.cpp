/// @file main.cpp
/// @brief fwr entry point.
///
/// Watches the files matched by the given patterns and runs the configured
/// command whenever one of them is updated, until SIGINT or SIGTERM.

#include "fwr/app/service_runner.hpp"
#include "fwr/dispatch/dispatcher.hpp"
#include "fwr/foundation/config_manager.hpp"
#include "fwr/foundation/console_logger.hpp"
#include "fwr/foundation/watch_logger.hpp"
#include "fwr/version.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stop_token>

namespace {

void installConsoleLogger() {
    auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
    static_cast<void>(
        registry.set_default_logger(std::make_shared<fwr::foundation::ConsoleLogger>()));
}

}  // namespace

int main(int argc, char* argv[]) {
    using fwr::foundation::LogCategory;

    auto options = fwr::app::parseArgs(argc, argv);
    if (!options) {
        std::cerr << "fwr: " << options.error().message() << "\n\n"
                  << fwr::app::usage("fwr");
        return EXIT_FAILURE;
    }
    if (options.value().showHelp) {
        std::cout << fwr::app::usage("fwr");
        return EXIT_SUCCESS;
    }
    if (options.value().showVersion) {
        std::cout << "fwr " << fwr::Version::string << "\n";
        return EXIT_SUCCESS;
    }

    installConsoleLogger();
    auto& logger = fwr::foundation::WatchLogger::instance();

    // Resolve config: --config flag > FWR_CONFIG_PATH env > ~/.fwr.yml > built-in.
    fwr::foundation::ConfigManager config;
    auto configPath = fwr::app::loadConfig(config, options.value().configPath);
    if (!configPath) {
        std::cerr << "Failed to load config: " << configPath.error().message() << "\n";
        return EXIT_FAILURE;
    }
    fwr::app::applyCliOverrides(config, options.value());

    auto settings = fwr::app::buildRunSettings(config);
    if (!settings) {
        std::cerr << "Invalid config: " << settings.error().message() << "\n";
        return EXIT_FAILURE;
    }
    logger.setAllCategoryLevels(settings.value().logLevel);

    if (configPath.value().empty()) {
        FWR_LOG_DEBUG(LogCategory::Config, "using built-in command table");
    } else {
        FWR_LOG_DEBUG(LogCategory::Config, "loaded " + configPath.value().string());
    }

    auto commands = fwr::app::buildCommandTable(config, options.value());
    if (!commands) {
        std::cerr << "Invalid command table: " << commands.error().message() << "\n";
        return EXIT_FAILURE;
    }
    if (commands.value().empty()) {
        FWR_LOG_WARN(LogCategory::Config, "command table is empty, nothing will run");
    }

    fwr::app::SignalHandler signals;
    std::stop_source stop;
    auto signalBridge = signals.forwardTo(stop);

    auto dispatcher = fwr::dispatch::Dispatcher::create(
        options.value().patterns, settings.value().maxWatchDirs, stop.get_token());
    if (!dispatcher) {
        std::cerr << "Failed to start watching: " << dispatcher.error().message() << "\n";
        return EXIT_FAILURE;
    }
    dispatcher.value()->notifier().setPendingPeriod(settings.value().pendingPeriodMs);

    auto runResult = dispatcher.value()->run(
        commands.value(), settings.value().timeout, settings.value().restart);
    dispatcher.value()->close();

    FWR_LOG_INFO(LogCategory::Core,
                 "stopped after " + std::to_string(dispatcher.value()->counter()) +
                     " command(s)");
    static_cast<void>(logger.flush());

    if (!runResult) {
        std::cerr << "fwr: " << runResult.error().message() << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
