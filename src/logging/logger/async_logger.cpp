#include "async_logger.hpp"
#include "utils/time_utils.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <cstdio>
#include <filesystem>
#include <stdexcept>

namespace AryaTrader {
namespace Logging {

namespace {

thread_local LoggingContext* installed_logging_context = nullptr;

constexpr const char* RUN_FOLDER_TIME_FORMAT = "%Y%m%d-%H%M%S";

std::string file_name_of(const std::string& file_path) {
    return std::filesystem::path(file_path).filename().string();
}

} // anonymous namespace

// ========================================================================
// CONTEXT
// ========================================================================

LoggingContext* get_logging_context() {
    if (!installed_logging_context) {
        throw std::runtime_error("Logging context not installed on this thread");
    }
    return installed_logging_context;
}

void set_logging_context(LoggingContext& context) {
    installed_logging_context = &context;
}

std::string format_thread_tag(const std::string& tag_value) {
    std::string tag_string = tag_value.substr(0, LOG_TAG_WIDTH);
    tag_string.resize(LOG_TAG_WIDTH, ' ');
    return tag_string;
}

void set_log_thread_tag(const std::string& thread_tag_value) {
    LoggingContext* logging_context_ptr = get_logging_context();
    std::lock_guard<std::mutex> tag_lock(logging_context_ptr->thread_tag_mutex);
    logging_context_ptr->thread_tags[std::this_thread::get_id()] = format_thread_tag(thread_tag_value);
}

std::string get_log_thread_tag() {
    LoggingContext* logging_context_ptr = get_logging_context();
    std::lock_guard<std::mutex> tag_lock(logging_context_ptr->thread_tag_mutex);
    std::map<std::thread::id, std::string>::const_iterator tag_iterator = logging_context_ptr->thread_tags.find(std::this_thread::get_id());
    if (tag_iterator == logging_context_ptr->thread_tags.end()) {
        return format_thread_tag(MAIN_THREAD_TAG);
    }
    return tag_iterator->second;
}

// ========================================================================
// LINE OUTPUT
// ========================================================================

void log_message(const std::string& message, const std::string& log_file_path) {
    LoggingContext* logging_context_ptr = get_logging_context();

    std::string formatted_line = TimeUtils::get_current_human_readable_time() + " [" + get_log_thread_tag() + "]   " + message + "\n";

    if (logging_context_ptr->async_logger) {
        logging_context_ptr->async_logger->enqueue(formatted_line);
    } else {
        std::lock_guard<std::mutex> console_lock(logging_context_ptr->console_mutex);
        std::cout << formatted_line << std::flush;
    }

    if (log_file_path.empty()) {
        return;
    }
    std::ofstream extra_log_stream(log_file_path, std::ios::app);
    if (!extra_log_stream.is_open()) {
        std::cerr << "Cannot append to log file " << log_file_path << std::endl;
        return;
    }
    extra_log_stream << formatted_line;
}

void write_log_lines(const std::vector<std::string>& log_lines, std::ofstream& log_file) {
    LoggingContext* logging_context_ptr = get_logging_context();
    {
        std::lock_guard<std::mutex> console_lock(logging_context_ptr->console_mutex);
        for (const std::string& log_line : log_lines) {
            std::cout << log_line;
        }
        std::cout << std::flush;
    }

    if (!log_file.is_open()) {
        return;
    }
    for (const std::string& log_line : log_lines) {
        log_file << log_line;
    }
    log_file.flush();
}

// ========================================================================
// ASYNC LOGGER
// ========================================================================

AsyncLogger::AsyncLogger(const std::string& log_file_path)
    : file_path(log_file_path), queue_mutex(), queue_condition(), pending_lines(), running(false), lines_enqueued(0) {}

void AsyncLogger::start() {
    running.store(true);
}

void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        running.store(false);
    }
    queue_condition.notify_all();
}

void AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        pending_lines.push_back(formatted_line);
        lines_enqueued++;
    }
    queue_condition.notify_one();
}

void AsyncLogger::wait_and_drain(std::vector<std::string>& line_buffer, int poll_interval_ms) {
    std::unique_lock<std::mutex> queue_lock(queue_mutex);
    queue_condition.wait_for(queue_lock, std::chrono::milliseconds(poll_interval_ms),
                             [this] { return !pending_lines.empty() || !running.load(); });
    move_pending_lines(line_buffer);
}

void AsyncLogger::drain(std::vector<std::string>& line_buffer) {
    std::lock_guard<std::mutex> queue_lock(queue_mutex);
    move_pending_lines(line_buffer);
}

unsigned long AsyncLogger::get_lines_enqueued() const {
    std::lock_guard<std::mutex> queue_lock(queue_mutex);
    return lines_enqueued;
}

void AsyncLogger::move_pending_lines(std::vector<std::string>& line_buffer) {
    line_buffer.insert(line_buffer.end(), std::make_move_iterator(pending_lines.begin()), std::make_move_iterator(pending_lines.end()));
    pending_lines.clear();
}

// ========================================================================
// RUN FOLDER
// ========================================================================

std::string get_build_identifier() {
    FILE* git_pipe = popen("git rev-parse --short HEAD 2>/dev/null", "r");
    if (!git_pipe) {
        return "unknown";
    }

    std::string revision;
    char read_buffer[64];
    while (fgets(read_buffer, sizeof(read_buffer), git_pipe) != nullptr) {
        revision += read_buffer;
    }
    pclose(git_pipe);

    while (!revision.empty() && (revision.back() == '\n' || revision.back() == '\r')) {
        revision.pop_back();
    }
    return revision.empty() ? "unknown" : revision;
}

std::string create_run_folder(const std::string& root_folder) {
    std::time_t now = std::time(nullptr);
    std::tm local_tm;
    localtime_r(&now, &local_tm);

    std::ostringstream folder_stream;
    folder_stream << root_folder << "/run_" << std::put_time(&local_tm, RUN_FOLDER_TIME_FORMAT) << "_" << get_build_identifier();
    std::string run_folder = folder_stream.str();

    std::error_code filesystem_error;
    std::filesystem::create_directories(run_folder, filesystem_error);
    if (filesystem_error) {
        throw std::runtime_error("Failed to create run folder " + run_folder + ": " + filesystem_error.message());
    }
    return run_folder;
}

std::string get_run_file_path(const std::string& base_filename) {
    LoggingContext* logging_context_ptr = get_logging_context();
    if (logging_context_ptr->run_folder.empty()) {
        throw std::runtime_error("Run folder not created - call initialize_application_foundation first");
    }
    return logging_context_ptr->run_folder + "/" + file_name_of(base_filename);
}

std::shared_ptr<AsyncLogger> initialize_application_foundation(const AryaTrader::Config::SystemConfig& config) {
    LoggingContext* logging_context_ptr = get_logging_context();
    logging_context_ptr->run_folder = create_run_folder(RUN_FOLDER_ROOT);

    std::shared_ptr<AsyncLogger> logger_instance = std::make_shared<AsyncLogger>(get_run_file_path(config.logging.log_file));
    logger_instance->start();
    logging_context_ptr->async_logger = logger_instance;
    set_log_thread_tag(MAIN_THREAD_TAG);
    return logger_instance;
}

void shutdown_global_logger(AsyncLogger& logger) {
    logger.stop();
}

} // namespace Logging
} // namespace AryaTrader
