#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <string>

namespace posecheck {
namespace core {

/**
 * Logger severity levels
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * Process-wide logger for posecheck
 *
 * Lines go to stdout (stderr from ERROR up) and, when a file is open, to that
 * file as well. The LOG_* macros check the level before the message
 * expression is evaluated, so per-frame TRACE output costs nothing at INFO.
 */
class Logger {
public:
    static Logger& getInstance();

    void setLevel(LogLevel level) { minLevel_.store(level); }
    LogLevel getLevel() const { return minLevel_.load(); }
    bool isEnabled(LogLevel level) const { return level >= minLevel_.load(); }

    void setConsoleOutput(bool enable) { consoleOutput_.store(enable); }

    /**
     * Set level and sinks in one call
     * @param filename Appended to when fileOutput is set
     * @return false if the log file cannot be opened
     */
    bool initialize(LogLevel level, bool consoleOutput, bool fileOutput, const std::string& filename = "");

    /**
     * Open posecheck_session_<date>_<time>.log in logDirectory, creating the
     * directory if needed. Console output is switched on.
     */
    bool initializeWithTimestamp(const std::string& logDirectory, LogLevel level = LogLevel::INFO);

    void closeLogFile();

    /**
     * Path of the open log file, empty when logging to console only
     */
    std::string getCurrentLogFile() const;

    void flush();

    /**
     * Write one line if level is enabled
     */
    void log(LogLevel level, const std::string& message, const char* file = nullptr, int line = 0);

    static std::string levelToString(LogLevel level);

    /**
     * Parse a level name (case-insensitive, "WARN" accepted). Unknown names yield fallback.
     */
    static LogLevel levelFromString(const std::string& name, LogLevel fallback = LogLevel::INFO);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Caller holds mutex_
    bool openFile(const std::string& path);

    std::atomic<LogLevel> minLevel_{LogLevel::INFO};
    std::atomic<bool> consoleOutput_{true};

    mutable std::mutex mutex_;
    std::ofstream file_;
    std::string filePath_;
};

} // namespace core
} // namespace posecheck

#define POSECHECK_LOG_AT(level, msg) \
    do { \
        posecheck::core::Logger& posecheck_logger_ = posecheck::core::Logger::getInstance(); \
        if (posecheck_logger_.isEnabled(level)) { \
            posecheck_logger_.log(level, msg, __FILE__, __LINE__); \
        } \
    } while (0)

#define LOG_TRACE(msg) POSECHECK_LOG_AT(posecheck::core::LogLevel::TRACE, msg)
#define LOG_DEBUG(msg) POSECHECK_LOG_AT(posecheck::core::LogLevel::DEBUG, msg)
#define LOG_INFO(msg) POSECHECK_LOG_AT(posecheck::core::LogLevel::INFO, msg)
#define LOG_WARNING(msg) POSECHECK_LOG_AT(posecheck::core::LogLevel::WARNING, msg)
#define LOG_ERROR(msg) POSECHECK_LOG_AT(posecheck::core::LogLevel::ERROR, msg)
#define LOG_CRITICAL(msg) POSECHECK_LOG_AT(posecheck::core::LogLevel::CRITICAL, msg)
