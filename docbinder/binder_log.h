#ifndef DOCBINDER_BINDER_LOG_H
#define DOCBINDER_BINDER_LOG_H

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace DocBinder {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

// Console + log file sink shared by the whole run.
// Console lines look like "WARNING: ...", file lines carry a timestamp.
class Logger {
public:
    static Logger& instance();

    // Truncates the file; returns false if it cannot be opened
    bool openFile(const std::filesystem::path& path);
    void closeFile();

    void setVerbose(bool verbose);
    void setConsole(bool enabled);

    void write(LogLevel level, const std::string& message);

    // Counters for the run summary
    int warningCount() const;
    int errorCount() const;
    void resetCounters();

private:
    Logger() = default;

    mutable std::mutex mutex_;
    std::ofstream file_;
    bool verbose_ = false;
    bool console_ = true;
    int warnings_ = 0;
    int errors_ = 0;
};

const char* log_level_name(LogLevel level);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warning(const std::string& message);
void log_error(const std::string& message);

} // namespace DocBinder

#endif // DOCBINDER_BINDER_LOG_H
