#include "binder_log.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace DocBinder {

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

bool Logger::openFile(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) file_.close();
    file_.open(path, std::ios::out | std::ios::trunc);
    return file_.is_open();
}

void Logger::closeFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) file_.close();
}

void Logger::setVerbose(bool verbose) {
    std::lock_guard<std::mutex> lock(mutex_);
    verbose_ = verbose;
}

void Logger::setConsole(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_ = enabled;
}

static std::string timestamp_now() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
#if defined(_WIN32)
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

void Logger::write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level == LogLevel::Warning) warnings_++;
    if (level == LogLevel::Error) errors_++;

    // The file always gets debug lines, the console only in verbose mode
    if (file_.is_open()) {
        file_ << timestamp_now() << " [LOG] " << log_level_name(level) << ": " << message << "\n";
        file_.flush();
    }

    if (!console_) return;
    if (level == LogLevel::Debug && !verbose_) return;

    if (level == LogLevel::Warning || level == LogLevel::Error) {
        std::cerr << log_level_name(level) << ": " << message << "\n";
    } else {
        std::cout << log_level_name(level) << ": " << message << "\n";
    }
}

int Logger::warningCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return warnings_;
}

int Logger::errorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_;
}

void Logger::resetCounters() {
    std::lock_guard<std::mutex> lock(mutex_);
    warnings_ = 0;
    errors_ = 0;
}

// ============================================================================
// Free functions
// ============================================================================

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "INFO";
}

void log_debug(const std::string& message) {
    Logger::instance().write(LogLevel::Debug, message);
}

void log_info(const std::string& message) {
    Logger::instance().write(LogLevel::Info, message);
}

void log_warning(const std::string& message) {
    Logger::instance().write(LogLevel::Warning, message);
}

void log_error(const std::string& message) {
    Logger::instance().write(LogLevel::Error, message);
}

} // namespace DocBinder
