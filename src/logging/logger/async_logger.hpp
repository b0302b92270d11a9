#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <string>
#include <mutex>
#include <condition_variable>
#include <deque>
#include <atomic>
#include <thread>
#include <memory>
#include <map>
#include <vector>
#include <fstream>
#include "configs/system_config.hpp"

namespace AryaTrader {
namespace Logging {

constexpr int LOG_TAG_WIDTH = 6;
constexpr const char* MAIN_THREAD_TAG = "MAIN";
constexpr const char* RUN_FOLDER_ROOT = "backtest_runs";

/**
 * Line queue between the producing threads and the logging thread.
 * Lines arrive fully formatted from log_message(); the logging thread drains them in batches.
 */
class AsyncLogger {
public:
    explicit AsyncLogger(const std::string& log_file_path);

    void start();
    void stop();
    bool is_running() const { return running.load(); }

    void enqueue(const std::string& formatted_line);

    // Waits up to poll_interval_ms for a line (returns early on stop), then moves all pending lines into line_buffer
    void wait_and_drain(std::vector<std::string>& line_buffer, int poll_interval_ms);
    void drain(std::vector<std::string>& line_buffer);

    const std::string& get_file_path() const { return file_path; }
    unsigned long get_lines_enqueued() const;

private:
    std::string file_path;
    mutable std::mutex queue_mutex;
    std::condition_variable queue_condition;
    std::deque<std::string> pending_lines;
    std::atomic<bool> running;
    unsigned long lines_enqueued;

    void move_pending_lines(std::vector<std::string>& line_buffer);
};

// Logging state of one run, shared by all threads. Every thread installs it with set_logging_context().
struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::mutex console_mutex;
    std::string run_folder;
    std::mutex thread_tag_mutex;
    std::map<std::thread::id, std::string> thread_tags;
};

LoggingContext* get_logging_context();
void set_logging_context(LoggingContext& context);

// Tag printed after the timestamp, padded or cut to LOG_TAG_WIDTH
std::string format_thread_tag(const std::string& tag_value);
void set_log_thread_tag(const std::string& thread_tag_value);
std::string get_log_thread_tag();

// Queues the line when an async logger is installed, prints it directly otherwise.
// A non-empty log_file_path also appends the line to that file.
void log_message(const std::string& message, const std::string& log_file_path);

// Console plus log file output of drained lines, called from the logging thread
void write_log_lines(const std::vector<std::string>& log_lines, std::ofstream& log_file);

// Short git revision of the working directory, "unknown" outside a checkout
std::string get_build_identifier();

// Creates <root>/run_<YYYYmmdd-HHMMSS>_<build> and returns its path. Throws std::runtime_error on failure.
std::string create_run_folder(const std::string& root_folder);

// Path of a file inside the current run folder
std::string get_run_file_path(const std::string& base_filename);

// Creates the run folder and the async logger, and installs it in the current thread's context
std::shared_ptr<AsyncLogger> initialize_application_foundation(const AryaTrader::Config::SystemConfig& config);

void shutdown_global_logger(AsyncLogger& logger);

} // namespace Logging
} // namespace AryaTrader

#endif // ASYNC_LOGGER_HPP
