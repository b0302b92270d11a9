#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>
#include <fstream>
#include <memory>
#include <vector>
#include "logging/logger/async_logger.hpp"

// Log lines are queued during the run and written to a file afterwards to keep the test output readable
int main(int argc, char* argv[]) {
    AryaTrader::Logging::LoggingContext logging_context;
    AryaTrader::Logging::set_logging_context(logging_context);
    logging_context.async_logger = std::make_shared<AryaTrader::Logging::AsyncLogger>("arya_trader_tests.log");
    logging_context.async_logger->start();

    int test_result = Catch::Session().run(argc, argv);

    logging_context.async_logger->stop();
    std::vector<std::string> message_buffer;
    logging_context.async_logger->drain(message_buffer);
    std::ofstream log_file(logging_context.async_logger->get_file_path(), std::ios::trunc);
    for (const std::string& log_line : message_buffer) {
        log_file << log_line;
    }
    return test_result;
}
