/**
 * @file Logger.cpp
 * @brief Implementation of the logging infrastructure
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * This implementation uses spdlog for thread-safe logging with automatic
 * log rotation.
 */

#include "Hookwarden/Core/Logger.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <iostream>
#include <vector>

namespace Hookwarden {
namespace Core {

namespace {

spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warning:  return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
        default:                 return spdlog::level::info;
    }
}

LogLevel FromSpdlogLevel(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warning;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Critical;
        case spdlog::level::off:      return LogLevel::Off;
        default:                      return LogLevel::Info;
    }
}

/**
 * @brief Sink forwarding each record to a LogCallback
 *
 * The callback is resolved through a getter so that SetCallback() after
 * Initialize() takes effect.
 */
template<typename Mutex>
class ForwardingSink final : public spdlog::sinks::base_sink<Mutex> {
public:
    explicit ForwardingSink(std::function<const LogCallback*()> resolve)
        : resolve_(std::move(resolve)) {}

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        const LogCallback* callback = resolve_();
        if (callback && *callback) {
            (*callback)(FromSpdlogLevel(msg.level),
                        std::string_view(msg.payload.data(), msg.payload.size()),
                        msg.time);
        }
    }

    void flush_() override {}

private:
    std::function<const LogCallback*()> resolve_;
};

} // namespace

bool parseLogLevel(std::string_view name, LogLevel& level) {
    if (name == "trace")   { level = LogLevel::Trace;    return true; }
    if (name == "debug")   { level = LogLevel::Debug;    return true; }
    if (name == "info")    { level = LogLevel::Info;     return true; }
    if (name == "warn")    { level = LogLevel::Warning;  return true; }
    if (name == "error")   { level = LogLevel::Error;    return true; }
    if (name == "critical"){ level = LogLevel::Critical; return true; }
    return false;
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::Logger(std::string name)
    : name_(std::move(name)) {}

Logger::~Logger() {
    Shutdown();
}

bool Logger::Initialize(LogLevel minLevel, LogOutput outputs,
                        const std::string& logFilePath, size_t maxFileSizeMB) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return false;
    }

    minLevel_ = minLevel;
    outputs_ = outputs;
    logFilePath_ = logFilePath;
    maxFileSizeBytes_ = maxFileSizeMB * 1024 * 1024;

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (hasFlag(outputs_, LogOutput::Console)) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(ToSpdlogLevel(minLevel_));
            sinks.push_back(console_sink);
        }

        if (hasFlag(outputs_, LogOutput::File) && !logFilePath_.empty()) {
            std::filesystem::path logPath(logFilePath_);
            if (logPath.has_parent_path()) {
                std::filesystem::create_directories(logPath.parent_path());
            }

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFilePath_,
                maxFileSizeBytes_,
                3 // Keep 3 rotated files
            );
            file_sink->set_level(ToSpdlogLevel(minLevel_));
            sinks.push_back(file_sink);
        }

        if (hasFlag(outputs_, LogOutput::Callback)) {
            // Log() holds mutex_ while sinks run, so callback_ is stable here
            auto callback_sink = std::make_shared<ForwardingSink<std::mutex>>(
                [this]() -> const LogCallback* { return &callback_; });
            callback_sink->set_level(ToSpdlogLevel(minLevel_));
            sinks.push_back(callback_sink);
        }

        if (sinks.empty()) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(ToSpdlogLevel(minLevel_));
            sinks.push_back(console_sink);
        }

        spdlogger_ = std::make_shared<spdlog::logger>(name_, sinks.begin(), sinks.end());

        // [timestamp] [level] [thread] message
        spdlogger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        spdlogger_->set_level(ToSpdlogLevel(minLevel_));
        spdlogger_->flush_on(spdlog::level::warn);

        initialized_ = true;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        spdlogger_.reset();
        return false;
    }
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return;
    }

    if (spdlogger_) {
        spdlogger_->flush();
        spdlogger_.reset();
    }

    initialized_ = false;
}

void Logger::SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    minLevel_ = level;
    if (spdlogger_) {
        spdlogger_->set_level(ToSpdlogLevel(level));
        for (auto& sink : spdlogger_->sinks()) {
            sink->set_level(ToSpdlogLevel(level));
        }
    }
}

LogLevel Logger::GetMinLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return minLevel_;
}

void Logger::SetCallback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

bool Logger::IsLevelEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_ && level >= minLevel_ && level != LogLevel::Off;
}

void Logger::Log(LogLevel level, std::string_view message,
                 const char* file, int line) {
    if (!IsLevelEnabled(level)) {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.dropped++;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        switch (level) {
            case LogLevel::Trace:    stats_.trace++; break;
            case LogLevel::Debug:    stats_.debug++; break;
            case LogLevel::Info:     stats_.info++; break;
            case LogLevel::Warning:  stats_.warning++; break;
            case LogLevel::Error:    stats_.error++; break;
            case LogLevel::Critical: stats_.critical++; break;
            default: break;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!spdlogger_) {
        return;
    }

    std::string formattedMsg;
    if (file && line > 0) {
        const char* filename = file;
        for (const char* p = file; *p; ++p) {
            if (*p == '/' || *p == '\\') {
                filename = p + 1;
            }
        }
        formattedMsg = std::string("(") + filename + ":" + std::to_string(line) + ") " + std::string(message);
    } else {
        formattedMsg = std::string(message);
    }

    spdlogger_->log(ToSpdlogLevel(level), formattedMsg);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (spdlogger_) {
        spdlogger_->flush();
    }
}

Logger::Statistics Logger::GetStatistics() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

void Logger::ResetStatistics() {
    std::lock_guard<std::mutex> lock(statsMutex_);
    stats_ = Statistics{};
}

const char* Logger::LevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO ";
        case LogLevel::Warning:  return "WARN ";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRIT ";
        default:                 return "UNKN ";
    }
}

} // namespace Core
} // namespace Hookwarden
