#ifndef FLASHX_LOGGER_HPP
#define FLASHX_LOGGER_HPP

#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace flashx {

enum class LogLevel { DEBUG, INFO, WARNING, ERROR, CRITICAL };

// Process-wide logger. Silent until Initialize() is called.
class Logger {
public:
    // Empty path logs to stderr
    static void Initialize(const std::string& path, LogLevel min_level = LogLevel::INFO);
    static void Shutdown();
    static bool IsEnabled(LogLevel level);

    static void Log(LogLevel level, const std::string& message);
    static void Debug(const std::string& m) { Log(LogLevel::DEBUG, m); }
    static void Info(const std::string& m) { Log(LogLevel::INFO, m); }
    static void Warning(const std::string& m) { Log(LogLevel::WARNING, m); }
    static void Error(const std::string& m) { Log(LogLevel::ERROR, m); }
    static void Critical(const std::string& m) { Log(LogLevel::CRITICAL, m); }

    // "debug", "info", "warn"/"warning", "error", "critical"
    static LogLevel ParseLevel(const std::string& name);
    static const char* LevelToString(LogLevel level);

private:
    Logger() = default;

    static std::unique_ptr<Logger> instance_;
    static std::mutex instance_mutex_;

    std::ofstream log_file_;
    bool to_stderr_ = false;
    LogLevel min_level_ = LogLevel::INFO;
};

} // namespace flashx

#endif // FLASHX_LOGGER_HPP
