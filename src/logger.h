/**
 * Trilobot v0.8 - Logger
 *
 * Leveled logging with module tags, to the console and an optional
 * append-mode file. Each line carries the wall-clock time and the
 * seconds since the logger started, so pulse and hold durations of
 * the control loop can be read straight off the log.
 *
 *   2026-10-19 14:02:11.318 +   3.402s [INFO ] [Motion] Backing up: 5 pulses of 150 ms
 */

#ifndef LOGGER_H
#define LOGGER_H

#include <iostream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cctype>
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <string>

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void setLevel(LogLevel level) {
        m_level = level;
    }

    /**
     * Set level by name (any case). Returns false, level unchanged, for
     * unknown names.
     */
    bool setLevel(const std::string& name) {
        LogLevel parsed;
        if (!parseLevel(name, parsed)) return false;
        m_level = parsed;
        return true;
    }

    bool isEnabled(LogLevel level) const { return level >= m_level; }

    static bool parseLevel(const std::string& name, LogLevel& out) {
        std::string upper;
        for (char c : name) {
            upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }

        if (upper == "DEBUG") out = LogLevel::DEBUG;
        else if (upper == "INFO") out = LogLevel::INFO;
        else if (upper == "WARN" || upper == "WARNING") out = LogLevel::WARN;
        else if (upper == "ERROR") out = LogLevel::ERROR;
        else return false;
        return true;
    }

    /**
     * Console output on/off. The log file, if open, always receives lines.
     */
    void setConsole(bool enabled) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_console = enabled;
    }

    bool openFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_file.is_open()) {
            m_file.close();
        }
        m_file.open(path, std::ios::app);
        if (!m_file.is_open()) {
            std::cerr << "[Logger] Failed to open log file: " << path << std::endl;
            return false;
        }
        return true;
    }

    void log(LogLevel level, const char* tag, const char* fmt, ...) {
        if (level < m_level) return;

        char msg[1024];
        va_list args;
        va_start(args, fmt);
        vsnprintf(msg, sizeof(msg), fmt, args);
        va_end(args);

        char prefix[64];
        formatPrefix(level, prefix, sizeof(prefix));

        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_console) {
            // Warnings and errors go to stderr so they survive a redirected stdout
            std::ostream& out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
            out << prefix << " [" << tag << "] " << msg << std::endl;
        }

        if (m_file.is_open()) {
            m_file << prefix << " [" << tag << "] " << msg << std::endl;
        }
    }

private:
    Logger()
        : m_level(LogLevel::INFO)
        , m_console(true)
        , m_start(std::chrono::steady_clock::now())
    {
    }

    ~Logger() {
        if (m_file.is_open()) {
            m_file.close();
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void formatPrefix(LogLevel level, char* buf, size_t size) const {
        struct timespec ts;
        clock_gettime(CLOCK_REALTIME, &ts);
        struct tm tm_info;
        localtime_r(&ts.tv_sec, &tm_info);
        int ms = ts.tv_nsec / 1000000;

        double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - m_start).count();

        snprintf(buf, size, "%04d-%02d-%02d %02d:%02d:%02d.%03d +%8.3fs [%s]",
            tm_info.tm_year + 1900, tm_info.tm_mon + 1, tm_info.tm_mday,
            tm_info.tm_hour, tm_info.tm_min, tm_info.tm_sec, ms,
            elapsed, levelToString(level));
    }

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
        }
        return "?????";
    }

    LogLevel m_level;
    bool m_console;
    std::chrono::steady_clock::time_point m_start;
    std::ofstream m_file;
    std::mutex m_mutex;
};

#define LOG_DEBUG(tag, fmt, ...) Logger::instance().log(LogLevel::DEBUG, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  Logger::instance().log(LogLevel::INFO,  tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  Logger::instance().log(LogLevel::WARN,  tag, fmt, ##__VA_ARGS__)
#define LOG_ERROR(tag, fmt, ...) Logger::instance().log(LogLevel::ERROR, tag, fmt, ##__VA_ARGS__)

#endif // LOGGER_H
