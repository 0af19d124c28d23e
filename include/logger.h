#pragma once

#include <string>
#include <memory>

namespace calcvox {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive).
 * @return Parsed level, or fallback when the name is not recognized
 */
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

/**
 * @brief Process-wide, thread-safe logger
 *
 * Safe to call from the audio callback threads and the transport handshake
 * thread as well as the event loop. Falls back to plain console output
 * when initialize() has not been called (tests).
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                           const std::string& output_file = "");

    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    static void set_level(LogLevel level);
    static LogLevel get_level();

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

// Component-specific logging macros
#define LOG_SESSION(msg) calcvox::Logger::info(std::string("[Session] ") + (msg))
#define LOG_CAPTURE(msg) calcvox::Logger::debug(std::string("[Capture] ") + (msg))
#define LOG_PLAYBACK(msg) calcvox::Logger::debug(std::string("[Playback] ") + (msg))
#define LOG_TOOLS(msg) calcvox::Logger::info(std::string("[Tools] ") + (msg))
#define LOG_TRANSPORT(msg) calcvox::Logger::info(std::string("[Transport] ") + (msg))
#define LOG_AUDIO(msg) calcvox::Logger::debug(std::string("[Audio] ") + (msg))

} // namespace calcvox
