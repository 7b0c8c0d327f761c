/**
 * @file LogLevel.cpp
 * @brief Global log level storage and level names
 */

#include "LogLevel.h"

#include <algorithm>
#include <cctype>

LogLevel g_logLevel = LogLevel::INFO;

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "?";
}

bool parseLogLevel(const std::string& name, LogLevel& level) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "error") level = LogLevel::ERROR;
    else if (lower == "warn" || lower == "warning") level = LogLevel::WARN;
    else if (lower == "info") level = LogLevel::INFO;
    else if (lower == "debug") level = LogLevel::DEBUG;
    else return false;
    return true;
}
