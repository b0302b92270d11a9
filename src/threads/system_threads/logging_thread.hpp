#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <string>
#include <fstream>
#include <memory>
#include <vector>
#include "logging/logger/async_logger.hpp"
#include "configs/system_config.hpp"

namespace AryaTrader {
namespace Threads {

/**
 * Body of the logging thread: drains the async logger into the console and the run log file
 * until the logger is stopped, then writes whatever is still queued.
 */
class LoggingThread {
public:
    LoggingThread(std::shared_ptr<AryaTrader::Logging::AsyncLogger> logger,
                  AryaTrader::Logging::LoggingContext& context,
                  const AryaTrader::Config::SystemConfig& system_config);

    void operator()();

private:
    std::shared_ptr<AryaTrader::Logging::AsyncLogger> logger_ptr;
    AryaTrader::Logging::LoggingContext& logging_context;
    const AryaTrader::Config::SystemConfig& config;
    unsigned long lines_written;

    void drain_until_stopped(std::ofstream& log_file);
    void write_and_clear(std::vector<std::string>& line_buffer, std::ofstream& log_file);
};

} // namespace Threads
} // namespace AryaTrader

#endif // LOGGING_THREAD_HPP
