// main.cpp
#include "system/backtest_runner.hpp"
#include "configs/system_config.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/startup_logs.hpp"
#include "threads/system_threads/logging_thread.hpp"
#include "trader/config_loader/config_loader.hpp"
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace AryaTrader::Logging;

namespace {

const char* const DEFAULT_CONFIG_PATH = "config/strategy_config.csv";

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [config.csv]" << std::endl;
}

// Runs the backtest with the logging thread alive; stops and joins it on every path.
int run_with_logging_thread(const AryaTrader::Config::SystemConfig& config, LoggingContext& logging_context) {
    std::shared_ptr<AsyncLogger> logger = initialize_application_foundation(config);
    AryaTrader::Threads::LoggingThread logging_thread_module(logger, logging_context, config);
    std::thread logging_thread(std::ref(logging_thread_module));

    int exit_code = 0;
    std::string fatal_error_message;
    try {
        StartupLogs::log_application_header();
        StartupLogs::log_strategy_configuration(config);
        StartupLogs::log_orders_configuration(config);
        AryaTrader::System::run_backtest(config);
    } catch (const std::exception& exception_error) {
        fatal_error_message = exception_error.what();
        StartupLogs::log_fatal_error(fatal_error_message);
        exit_code = 1;
    }

    shutdown_global_logger(*logger);
    logging_thread.join();

    if (exit_code != 0) {
        std::cerr << "Fatal error: " << fatal_error_message << std::endl;
    }
    return exit_code;
}

} // anonymous namespace

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

int main(int argc, char* argv[]) {
    if (argc > 2) {
        print_usage(argv[0]);
        return 1;
    }
    std::string config_path = argc == 2 ? argv[1] : DEFAULT_CONFIG_PATH;

    try {
        // Logging context must exist before the first log_message call
        LoggingContext logging_context;
        set_logging_context(logging_context);

        AryaTrader::Config::SystemConfig config;
        StartupLogs::log_configuration_source(config_path);
        AryaTrader::Config::load_system_config(config, config_path);

        return run_with_logging_thread(config, logging_context);
    } catch (const std::exception& exception_error) {
        std::cerr << "Fatal error: " << exception_error.what() << std::endl;
        return 1;
    }
}
