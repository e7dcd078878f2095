#include "posecheck/core/Logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>

namespace posecheck {
namespace core {

namespace {

const std::array<const char*, 6> kLevelNames = {
    "TRACE", "DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL"
};

std::tm localTime(std::time_t seconds) {
    std::tm result{};
    localtime_r(&seconds, &result);
    return result;
}

// "2026-10-19 14:03:27.512"
std::string lineTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    const std::tm tm = localTime(std::chrono::system_clock::to_time_t(now));

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

std::string sessionFilename(const std::string& directory) {
    const std::tm tm = localTime(std::time(nullptr));

    std::ostringstream oss;
    oss << directory;
    if (!directory.empty() && directory.back() != '/') {
        oss << '/';
    }
    oss << "posecheck_session_" << std::put_time(&tm, "%Y-%m-%d_%H-%M-%S") << ".log";
    return oss.str();
}

// mkdir -p
bool makeDirectories(const std::string& directory) {
    if (directory.empty()) {
        return false;
    }

    std::string::size_type pos = (directory[0] == '/') ? 1 : 0;
    while (pos != std::string::npos) {
        pos = directory.find('/', pos);
        const std::string prefix = directory.substr(0, pos);
        if (pos != std::string::npos) {
            ++pos;
        }
        if (prefix.empty() || prefix.back() == '/') {
            continue;
        }

        struct stat st;
        if (stat(prefix.c_str(), &st) == 0) {
            if (!S_ISDIR(st.st_mode)) {
                std::cerr << "[Logger] " << prefix << " exists and is not a directory" << std::endl;
                return false;
            }
        } else if (mkdir(prefix.c_str(), 0755) != 0 && errno != EEXIST) {
            std::cerr << "[Logger] Cannot create " << prefix << ": " << std::strerror(errno) << std::endl;
            return false;
        }
    }
    return true;
}

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    closeLogFile();
}

bool Logger::openFile(const std::string& path) {
    if (file_.is_open()) {
        file_.close();
    }
    file_.open(path, std::ios::out | std::ios::app);
    filePath_ = file_.is_open() ? path : std::string();
    return file_.is_open();
}

bool Logger::initialize(LogLevel level, bool consoleOutput, bool fileOutput, const std::string& filename) {
    setLevel(level);
    setConsoleOutput(consoleOutput);

    if (!fileOutput || filename.empty()) {
        return true;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return openFile(filename);
}

bool Logger::initializeWithTimestamp(const std::string& logDirectory, LogLevel level) {
    setLevel(level);
    setConsoleOutput(true);

    if (!makeDirectories(logDirectory)) {
        return false;
    }

    const std::string path = sessionFilename(logDirectory);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!openFile(path)) {
        std::cerr << "[Logger] Cannot open " << path << ": " << std::strerror(errno) << std::endl;
        return false;
    }

    file_ << "# posecheck session started " << lineTimestamp()
          << ", level " << levelToString(level) << std::endl;
    return true;
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    filePath_.clear();
}

std::string Logger::getCurrentLogFile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return filePath_;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
    if (file_.is_open()) {
        file_.flush();
    }
}

void Logger::log(LogLevel level, const std::string& message, const char* file, int line) {
    if (!isEnabled(level)) {
        return;
    }

    std::string text = "[" + lineTimestamp() + "] [" + levelToString(level) + "] " + message;
    if (file != nullptr && line > 0) {
        const char* base = std::strrchr(file, '/');
        text += " (" + std::string(base != nullptr ? base + 1 : file) + ":" + std::to_string(line) + ")";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (consoleOutput_.load()) {
        std::ostream& out = (level >= LogLevel::ERROR) ? std::cerr : std::cout;
        out << text << '\n';
    }
    if (file_.is_open()) {
        file_ << text << '\n';
    }
}

std::string Logger::levelToString(LogLevel level) {
    const auto index = static_cast<std::size_t>(level);
    return index < kLevelNames.size() ? kLevelNames[index] : "UNKNOWN";
}

LogLevel Logger::levelFromString(const std::string& name, LogLevel fallback) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "WARN") {
        return LogLevel::WARNING;
    }

    for (std::size_t i = 0; i < kLevelNames.size(); ++i) {
        if (upper == kLevelNames[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    return fallback;
}

} // namespace core
} // namespace posecheck
