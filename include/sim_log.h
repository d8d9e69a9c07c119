#pragma once

#include <string>

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

// Process-wide threshold. Lines below it are dropped.
void setLogLevel(LogLevel level);
LogLevel getLogLevel();
bool logEnabled(LogLevel level);

// Writes "[Tag] message" as one line. Debug/Info go to stdout, Warn/Error to stderr.
// Safe to call from OpenMP worker threads.
void logLine(LogLevel level, const char* tag, const std::string& message);

const char* logLevelName(LogLevel level);
bool parseLogLevel(const std::string& text, LogLevel& out);

inline void logDebug(const char* tag, const std::string& message) {
    logLine(LogLevel::Debug, tag, message);
}

inline void logInfo(const char* tag, const std::string& message) {
    logLine(LogLevel::Info, tag, message);
}

inline void logWarn(const char* tag, const std::string& message) {
    logLine(LogLevel::Warn, tag, message);
}

inline void logError(const char* tag, const std::string& message) {
    logLine(LogLevel::Error, tag, message);
}
