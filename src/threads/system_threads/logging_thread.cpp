#include "logging_thread.hpp"
#include <iostream>

using namespace AryaTrader::Threads;
using namespace AryaTrader::Logging;

LoggingThread::LoggingThread(std::shared_ptr<AsyncLogger> logger, LoggingContext& context,
                             const AryaTrader::Config::SystemConfig& system_config)
    : logger_ptr(logger), logging_context(context), config(system_config), lines_written(0) {}

void LoggingThread::operator()() {
    // Runs on its own std::thread, so nothing may escape
    try {
        set_logging_context(logging_context);
        set_log_thread_tag("LOGGER");

        std::ofstream log_file(logger_ptr->get_file_path(), std::ios::app);
        if (!log_file.is_open()) {
            std::cerr << "Cannot open run log " << logger_ptr->get_file_path() << " - logging to console only" << std::endl;
        }
        drain_until_stopped(log_file);
    } catch (const std::exception& exception) {
        std::cerr << "Logging thread terminated: " << exception.what() << std::endl;
    }
}

void LoggingThread::drain_until_stopped(std::ofstream& log_file) {
    std::vector<std::string> line_buffer;
    while (logger_ptr->is_running()) {
        logger_ptr->wait_and_drain(line_buffer, config.logging.logging_poll_interval_ms);
        write_and_clear(line_buffer, log_file);
    }
    // Lines queued between the last wait and stop()
    logger_ptr->drain(line_buffer);
    write_and_clear(line_buffer, log_file);
}

void LoggingThread::write_and_clear(std::vector<std::string>& line_buffer, std::ofstream& log_file) {
    if (line_buffer.empty()) {
        return;
    }
    write_log_lines(line_buffer, log_file);
    lines_written += line_buffer.size();
    line_buffer.clear();
}
