#pragma once
#include <atomic>
#include <fstream>
#include <mutex>
#include <string>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

LogLevel parseLogLevel(const std::string& name);

// Process-wide log sink: append-mode file plus stdout mirror for the journal.
class Logger {
    std::ofstream file;
    std::mutex mtx;
    std::atomic<LogLevel> minLevel{LogLevel::Info};

    Logger() = default;

public:
    static Logger& instance();

    void open(const std::string& path);
    void setLevel(LogLevel level) { minLevel.store(level); }
    LogLevel level() const { return minLevel.load(); }
    bool enabled(LogLevel level) const { return level >= minLevel.load(); }

    void log(LogLevel level, const std::string& tag, const std::string& msg);
};

inline void logDebug(const std::string& tag, const std::string& msg) { Logger::instance().log(LogLevel::Debug, tag, msg); }
inline void logInfo(const std::string& tag, const std::string& msg) { Logger::instance().log(LogLevel::Info, tag, msg); }
inline void logWarn(const std::string& tag, const std::string& msg) { Logger::instance().log(LogLevel::Warn, tag, msg); }
inline void logError(const std::string& tag, const std::string& msg) { Logger::instance().log(LogLevel::Error, tag, msg); }
