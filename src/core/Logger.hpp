#pragma once

/**
 * Logger.hpp
 *
 * Centralized logging system with multiple log levels and sinks.
 * Uses spdlog as the underlying logging library.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <memory>
#include <string>
#include <vector>
#include <filesystem>

namespace wum::core {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Logger class - Thread-safe singleton logger
 *
 * Messages logged before initialize() are dropped, which keeps library
 * users (and the test suite) silent unless they opt in.
 */
class Logger {
public:
    /**
     * Get singleton instance
     * @return Reference to Logger instance
     */
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    /**
     * Initialize the logger
     * @param level Minimum log level
     * @param logDir Log file directory (empty = console only)
     * @param maxFileSize Rotation threshold of the file sink in bytes
     * @param maxFiles Number of rotated files kept
     */
    void initialize(LogLevel level = LogLevel::Info,
                    const std::string& logDir = "",
                    size_t maxFileSize = 1024 * 1024 * 10,
                    size_t maxFiles = 3) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            // Console sink with colors
            auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            consoleSink->set_level(toSpdlogLevel(level));
            consoleSink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            if (!logDir.empty()) {
                std::filesystem::path logPath = std::filesystem::path(logDir) / "wum.log";
                std::filesystem::create_directories(logPath.parent_path());

                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logPath.string(), maxFileSize, maxFiles, false);
                fileSink->set_level(spdlog::level::trace);
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(fileSink);
            }

            m_logger = std::make_shared<spdlog::logger>("wum", sinks.begin(), sinks.end());
            m_logger->set_level(toSpdlogLevel(level));
            m_logger->flush_on(spdlog::level::warn);

            spdlog::set_default_logger(m_logger);
            spdlog::flush_every(std::chrono::seconds(3));

        } catch (const spdlog::spdlog_ex& ex) {
            m_logger = fallbackLogger();
            m_logger->error("Logger initialization failed: {}", ex.what());
        } catch (const std::filesystem::filesystem_error& ex) {
            m_logger = fallbackLogger();
            m_logger->error("Cannot create log directory: {}", ex.what());
        }
    }

    /**
     * Set log level
     * @param level New log level
     */
    void setLevel(LogLevel level) {
        if (m_logger) {
            m_logger->set_level(toSpdlogLevel(level));
        }
    }

    /**
     * Flush all log sinks
     */
    void flush() {
        if (m_logger) {
            m_logger->flush();
        }
    }

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->error(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->critical(fmt, std::forward<Args>(args)...);
        }
    }

    /**
     * Parse a level name from configuration ("debug", "info", ...)
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::Info) {
        auto level = spdlog::level::from_str(name);
        if (level == spdlog::level::off && name != "off") {
            return fallback;
        }
        switch (level) {
            case spdlog::level::trace:    return LogLevel::Trace;
            case spdlog::level::debug:    return LogLevel::Debug;
            case spdlog::level::info:     return LogLevel::Info;
            case spdlog::level::warn:     return LogLevel::Warn;
            case spdlog::level::err:      return LogLevel::Error;
            case spdlog::level::critical: return LogLevel::Critical;
            default:                      return LogLevel::Off;
        }
    }

private:
    Logger() = default;
    ~Logger() {
        if (m_logger) {
            m_logger->flush();
        }
        spdlog::shutdown();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
            default:                 return spdlog::level::info;
        }
    }

private:
    // Registered once; initialize() may run again after a failure
    static std::shared_ptr<spdlog::logger> fallbackLogger() {
        auto logger = spdlog::get("wum_fallback");
        return logger ? logger : spdlog::stderr_color_mt("wum_fallback");
    }

    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace wum::core

// Convenience macros
#define WUM_LOG_TRACE(...)    wum::core::Logger::instance().trace(__VA_ARGS__)
#define WUM_LOG_DEBUG(...)    wum::core::Logger::instance().debug(__VA_ARGS__)
#define WUM_LOG_INFO(...)     wum::core::Logger::instance().info(__VA_ARGS__)
#define WUM_LOG_WARN(...)     wum::core::Logger::instance().warn(__VA_ARGS__)
#define WUM_LOG_ERROR(...)    wum::core::Logger::instance().error(__VA_ARGS__)
#define WUM_LOG_CRITICAL(...) wum::core::Logger::instance().critical(__VA_ARGS__)
