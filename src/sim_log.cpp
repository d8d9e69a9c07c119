#include "sim_log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace {

std::atomic<int> g_logLevel{static_cast<int>(LogLevel::Info)};

std::mutex& logMutex() {
    static std::mutex m;
    return m;
}

} // namespace

void setLogLevel(LogLevel level) {
    g_logLevel.store(static_cast<int>(level));
}

LogLevel getLogLevel() {
    return static_cast<LogLevel>(g_logLevel.load());
}

bool logEnabled(LogLevel level) {
    return level != LogLevel::Off && static_cast<int>(level) >= g_logLevel.load();
}

void logLine(LogLevel level, const char* tag, const std::string& message) {
    if (!logEnabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(logMutex());
    std::ostream& out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    out << logLevelName(level) << " [" << (tag ? tag : "settlesim") << "] " << message << "\n";
    if (level >= LogLevel::Warn) {
        out.flush();
    }
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
    }
    return "INFO";
}

bool parseLogLevel(const std::string& text, LogLevel& out) {
    std::string value = text;
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (value == "debug") { out = LogLevel::Debug; return true; }
    if (value == "info") { out = LogLevel::Info; return true; }
    if (value == "warn" || value == "warning") { out = LogLevel::Warn; return true; }
    if (value == "error") { out = LogLevel::Error; return true; }
    if (value == "off" || value == "none") { out = LogLevel::Off; return true; }
    return false;
}
