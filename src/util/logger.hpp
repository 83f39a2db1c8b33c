#ifndef DDSLEDGER_UTIL_LOGGER_HPP
#define DDSLEDGER_UTIL_LOGGER_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include "util/errors.hpp"

/**
 * @file logger.hpp
 * @brief A thread-safe logging utility for ddsledger.
 *
 * Usage:
 *   - Logger::getInstance().info("[DdsCoreService] published ...");
 *   - logger::debug("Debug message");
 *   - logger::enableFileOutput("ddsledger.log");
 *   - logger::setSink([](LogLevel lvl, const std::string &line) { ... });  // tests
 */

namespace ddsledger {
namespace util {
namespace logger {

/**
 * @brief Enumeration of log levels.
 */
enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/// Receives every line that passes the level filter, after console/file output.
using LogSink = std::function<void(LogLevel, const std::string &)>;

inline const char *logLevelName(LogLevel level)
{
    switch (level) {
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARN:     return "WARN";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Parse a level name ("debug", "INFO", "warning", ...).
 * @throw MalformedInputError for unknown names.
 */
inline LogLevel parseLogLevel(std::string name)
{
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (name == "DEBUG") return LogLevel::DEBUG;
    if (name == "INFO") return LogLevel::INFO;
    if (name == "WARN" || name == "WARNING") return LogLevel::WARN;
    if (name == "ERROR") return LogLevel::ERROR;
    if (name == "CRITICAL") return LogLevel::CRITICAL;
    throw MalformedInputError("logger: unknown log level '" + name + "'");
}

/**
 * @brief A singleton logger class that supports:
 *  - Thread-safe logging
 *  - Various log levels
 *  - Optional file output
 *  - An optional in-process sink (used by tests to observe warnings)
 */
class Logger {
public:
    /**
     * @brief Get the global Logger instance.
     */
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Set the minimal log level. Messages below this level are discarded.
     */
    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return logLevel_;
    }

    /**
     * @brief Enable output to a file.
     * @param filename The file path to write logs into.
     * @param append If true, appends to existing file; otherwise overwrites.
     * @return false if the file could not be opened (console output continues).
     */
    bool enableFileOutput(const std::string &filename, bool append = false)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
        }
        fileStream_ = std::make_unique<std::ofstream>(filename,
            append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc));
        if (!fileStream_->is_open()) {
            fileStream_.reset();
            std::cerr << "[Logger] Failed to open log file: " << filename << std::endl;
            return false;
        }
        return true;
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
            fileStream_.reset();
        }
    }

    /**
     * @brief Install (or clear, with an empty function) the line sink.
     */
    void setSink(LogSink sink)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    /**
     * @brief Silence stdout, e.g. for noisy test runs. File output and sink are unaffected.
     */
    void setConsoleOutput(bool enabled)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        consoleEnabled_ = enabled;
    }

    void debug(const std::string &msg)    { log(LogLevel::DEBUG, msg); }
    void info(const std::string &msg)     { log(LogLevel::INFO, msg); }
    void warn(const std::string &msg)     { log(LogLevel::WARN, msg); }
    void error(const std::string &msg)    { log(LogLevel::ERROR, msg); }
    void critical(const std::string &msg) { log(LogLevel::CRITICAL, msg); }

private:
    Logger()
        : logLevel_(LogLevel::INFO)
        , consoleEnabled_(true)
    {
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string &msg)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (level < logLevel_) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_buf);
#endif
        std::ostringstream line;
        line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "]["
             << logLevelName(level) << "] " << msg;
        const std::string text = line.str();

        if (consoleEnabled_) {
            std::cout << text << std::endl;
        }
        if (fileStream_) {
            (*fileStream_) << text << '\n';
            fileStream_->flush();
        }
        // the sink runs unlocked so that it may log itself
        LogSink sink = sink_;
        lock.unlock();
        if (sink) {
            sink(level, text);
        }
    }

    mutable std::mutex mutex_;
    LogLevel logLevel_;
    bool consoleEnabled_;
    std::unique_ptr<std::ofstream> fileStream_;
    LogSink sink_;
};

// ----------------------------------------------------------------------------
//  Convenience free functions (shortcuts)
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level)
{
    Logger::getInstance().setLogLevel(level);
}

inline bool enableFileOutput(const std::string &filename, bool append = false)
{
    return Logger::getInstance().enableFileOutput(filename, append);
}

inline void disableFileOutput()
{
    Logger::getInstance().disableFileOutput();
}

inline void setSink(LogSink sink)
{
    Logger::getInstance().setSink(std::move(sink));
}

inline void debug(const std::string &msg)
{
    Logger::getInstance().debug(msg);
}

inline void info(const std::string &msg)
{
    Logger::getInstance().info(msg);
}

inline void warn(const std::string &msg)
{
    Logger::getInstance().warn(msg);
}

inline void error(const std::string &msg)
{
    Logger::getInstance().error(msg);
}

inline void critical(const std::string &msg)
{
    Logger::getInstance().critical(msg);
}

} // namespace logger
} // namespace util
} // namespace ddsledger

#endif // DDSLEDGER_UTIL_LOGGER_HPP
