/**
 * @file LogLevel.h
 * @brief Centralized log level system for assetsync
 *
 * Four levels (ERROR, WARN, INFO, DEBUG), filtered at runtime through
 * g_logLevel. Called from both the worker thread and the caller thread.
 *
 * Usage:
 *   LOG_ERROR("something failed: " << reason);
 *   LOG_WARN("ack not received after " << ms << "ms");
 *   LOG_INFO("Connected");
 *   LOG_DEBUG("[Component] detailed message");
 */

#ifndef ASSETSYNC_LOGLEVEL_H
#define ASSETSYNC_LOGLEVEL_H

#include <iostream>
#include <string>

enum class LogLevel { ERROR = 0, WARN = 1, INFO = 2, DEBUG = 3 };

extern LogLevel g_logLevel;

const char* logLevelName(LogLevel level);

// "error", "warn", "info" or "debug" (case-insensitive)
bool parseLogLevel(const std::string& name, LogLevel& level);

#define LOG_ERROR(x) do { \
    if (g_logLevel >= LogLevel::ERROR) { std::cerr << x << std::endl; } \
} while(0)
#define LOG_WARN(x) do { \
    if (g_logLevel >= LogLevel::WARN) { std::cout << "[WARN] " << x << std::endl; } \
} while(0)
#define LOG_INFO(x) do { \
    if (g_logLevel >= LogLevel::INFO) { std::cout << x << std::endl; } \
} while(0)
#define LOG_DEBUG(x) do { \
    if (g_logLevel >= LogLevel::DEBUG) { std::cout << x << std::endl; } \
} while(0)

#endif // ASSETSYNC_LOGLEVEL_H
