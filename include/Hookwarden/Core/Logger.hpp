/**
 * @file Logger.hpp
 * @brief Logging infrastructure for Hookwarden diagnostics
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * Thread-safe logging system with multiple severity levels, file rotation,
 * and structured output for trust-boundary event tracking.
 */

#pragma once

#ifndef HOOKWARDEN_CORE_LOGGER_HPP
#define HOOKWARDEN_CORE_LOGGER_HPP

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

namespace Hookwarden {
namespace Core {

/**
 * @brief Log severity levels
 */
enum class LogLevel : uint8_t {
    Trace = 0,      ///< Verbose tracing for deep debugging
    Debug = 1,      ///< Debug information for development
    Info = 2,       ///< General informational messages
    Warning = 3,    ///< Rejected requests and suspicious input
    Error = 4,      ///< Operator mistakes and failures
    Critical = 5,   ///< Boot-fatal events
    Off = 255       ///< Disable all logging
};

/**
 * @brief Log output targets
 */
enum class LogOutput : uint8_t {
    None = 0,
    Console = 1 << 0,   ///< Output to console/stdout
    File = 1 << 1,      ///< Output to rotating file
    Callback = 1 << 2,  ///< Call user-provided callback
    All = Console | File | Callback
};

inline LogOutput operator|(LogOutput a, LogOutput b) {
    return static_cast<LogOutput>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline LogOutput operator&(LogOutput a, LogOutput b) {
    return static_cast<LogOutput>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

inline bool hasFlag(LogOutput value, LogOutput flag) {
    return (static_cast<uint8_t>(value) & static_cast<uint8_t>(flag)) != 0;
}

/**
 * @brief Log callback function type
 * @param level Severity level of the message
 * @param message Formatted log message
 * @param timestamp Message timestamp
 *
 * Invoked synchronously while the logger lock is held; the callback must
 * not log through the same logger.
 */
using LogCallback = std::function<void(LogLevel level, std::string_view message,
                                       std::chrono::system_clock::time_point timestamp)>;

/**
 * @brief Parse a configuration log level ("debug", "info", "warn", "error")
 * @return false if the name is not recognised
 */
bool parseLogLevel(std::string_view name, LogLevel& level);

/**
 * @brief Thread-safe logger
 *
 * Every validator and loader takes a Logger& so callers decide where
 * diagnostics go. Instance() is the process-wide default used by the
 * preflight tool and the HOOKWARDEN_LOG_* macros.
 *
 * Features:
 * - Multiple severity levels with filtering
 * - Thread-safe console, rotating file and callback output (spdlog)
 * - Source location tagging
 * - Per-level statistics
 */
class Logger {
public:
    /**
     * @brief Get the process default logger instance
     */
    static Logger& Instance();

    /**
     * @brief Construct an independent logger
     * @param name Logger name reported by spdlog
     */
    explicit Logger(std::string name = "hookwarden");
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Initialize the logger
     * @param minLevel Minimum log level to record
     * @param outputs Output targets (console, file, callback)
     * @param logFilePath Path to log file (required if File output enabled)
     * @param maxFileSizeMB Maximum log file size in MB before rotation
     * @return true on success, false if already initialized or sinks failed
     */
    bool Initialize(LogLevel minLevel = LogLevel::Info,
                    LogOutput outputs = LogOutput::Console,
                    const std::string& logFilePath = "",
                    size_t maxFileSizeMB = 10);

    /**
     * @brief Shutdown the logger and flush all buffers
     */
    void Shutdown();

    void SetMinLevel(LogLevel level);
    LogLevel GetMinLevel() const;

    /**
     * @brief Set user callback for log messages (Callback output)
     */
    void SetCallback(LogCallback callback);

    /**
     * @brief Check if a log level is enabled
     */
    bool IsLevelEnabled(LogLevel level) const;

    /**
     * @brief Log a message at the specified level
     * @param level Severity level
     * @param message Message text
     * @param file Source file name (optional)
     * @param line Source line number (optional)
     */
    void Log(LogLevel level, std::string_view message,
             const char* file = nullptr, int line = 0);

    /**
     * @brief Log a printf-style formatted message
     */
    template<typename... Args>
    void LogFormat(LogLevel level, const char* format, Args&&... args) {
        if (!IsLevelEnabled(level)) return;

        char buffer[1024];
        int result = std::snprintf(buffer, sizeof(buffer), format, std::forward<Args>(args)...);

        if (result > 0 && static_cast<size_t>(result) < sizeof(buffer)) {
            Log(level, std::string_view(buffer, result));
        } else if (result > 0) {
            std::string largeBuffer(result + 1, '\0');
            std::snprintf(largeBuffer.data(), largeBuffer.size(), format, std::forward<Args>(args)...);
            largeBuffer.resize(result);
            Log(level, largeBuffer);
        }
    }

    // Short-hand helpers used throughout the validators
    void trace(std::string_view message) { Log(LogLevel::Trace, message); }
    void debug(std::string_view message) { Log(LogLevel::Debug, message); }
    void info(std::string_view message) { Log(LogLevel::Info, message); }
    void warn(std::string_view message) { Log(LogLevel::Warning, message); }
    void error(std::string_view message) { Log(LogLevel::Error, message); }
    void critical(std::string_view message) { Log(LogLevel::Critical, message); }

    /**
     * @brief Flush all buffers to disk
     */
    void Flush();

    /**
     * @brief Total number of messages logged at each level
     */
    struct Statistics {
        size_t trace;
        size_t debug;
        size_t info;
        size_t warning;
        size_t error;
        size_t critical;
        size_t dropped;  ///< Messages dropped due to level filtering
    };

    Statistics GetStatistics() const;
    void ResetStatistics();

private:
    static const char* LevelToString(LogLevel level);

    std::string name_;

    // Configuration
    LogLevel minLevel_ = LogLevel::Info;
    LogOutput outputs_ = LogOutput::Console;
    std::string logFilePath_;
    size_t maxFileSizeBytes_ = 10 * 1024 * 1024;
    LogCallback callback_;

    // State
    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> spdlogger_;
    bool initialized_ = false;

    // Statistics
    mutable std::mutex statsMutex_;
    Statistics stats_{};
};

} // namespace Core
} // namespace Hookwarden

// ============================================================================
// Convenience Macros (process default logger)
// ============================================================================

#ifndef HOOKWARDEN_DISABLE_LOGGING

#define HOOKWARDEN_LOG_DEBUG(msg) \
    ::Hookwarden::Core::Logger::Instance().Log(::Hookwarden::Core::LogLevel::Debug, msg, __FILE__, __LINE__)

#define HOOKWARDEN_LOG_INFO(msg) \
    ::Hookwarden::Core::Logger::Instance().Log(::Hookwarden::Core::LogLevel::Info, msg, __FILE__, __LINE__)

#define HOOKWARDEN_LOG_WARNING(msg) \
    ::Hookwarden::Core::Logger::Instance().Log(::Hookwarden::Core::LogLevel::Warning, msg, __FILE__, __LINE__)

#define HOOKWARDEN_LOG_ERROR(msg) \
    ::Hookwarden::Core::Logger::Instance().Log(::Hookwarden::Core::LogLevel::Error, msg, __FILE__, __LINE__)

#define HOOKWARDEN_LOG_CRITICAL(msg) \
    ::Hookwarden::Core::Logger::Instance().Log(::Hookwarden::Core::LogLevel::Critical, msg, __FILE__, __LINE__)

#define HOOKWARDEN_LOG_INFO_F(fmt, ...) \
    ::Hookwarden::Core::Logger::Instance().LogFormat(::Hookwarden::Core::LogLevel::Info, fmt, __VA_ARGS__)

#define HOOKWARDEN_LOG_ERROR_F(fmt, ...) \
    ::Hookwarden::Core::Logger::Instance().LogFormat(::Hookwarden::Core::LogLevel::Error, fmt, __VA_ARGS__)

#else
#define HOOKWARDEN_LOG_DEBUG(msg) ((void)0)
#define HOOKWARDEN_LOG_INFO(msg) ((void)0)
#define HOOKWARDEN_LOG_WARNING(msg) ((void)0)
#define HOOKWARDEN_LOG_ERROR(msg) ((void)0)
#define HOOKWARDEN_LOG_CRITICAL(msg) ((void)0)
#define HOOKWARDEN_LOG_INFO_F(fmt, ...) ((void)0)
#define HOOKWARDEN_LOG_ERROR_F(fmt, ...) ((void)0)
#endif // HOOKWARDEN_DISABLE_LOGGING

#endif // HOOKWARDEN_CORE_LOGGER_HPP
