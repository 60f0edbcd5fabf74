#include "Logger.hpp"
#include <ctime>
#include <iostream>
#include <algorithm>

LogLevel parseLogLevel(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    if (s == "debug") return LogLevel::Debug;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    return LogLevel::Info;
}

static const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(mtx);
    if (file.is_open()) file.close();
    file.open(path, std::ios::app);
    if (!file.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
    }
}

void Logger::log(LogLevel level, const std::string& tag, const std::string& msg) {
    if (!enabled(level)) return;

    time_t t = time(nullptr);
    struct tm tmBuf;
    localtime_r(&t, &tmBuf);
    char timestamp[64];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &tmBuf);

    std::lock_guard<std::mutex> lock(mtx);
    if (file.is_open()) {
        file << "[" << timestamp << "] " << levelName(level) << " [" << tag << "] " << msg << std::endl;
    }
    // Also print to stdout for systemd journal
    std::cout << levelName(level) << " [" << tag << "] " << msg << std::endl;
}
