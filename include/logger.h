#pragma once

#include <string>
#include <memory>

namespace guild_voice {

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
 * @brief Process-wide, thread-safe logger
 *
 * Voice sessions are touched from transport callback threads, tool worker
 * threads and the idle reaper at the same time, so every write is
 * serialized. Output goes to the console and optionally to a log file.
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

    /**
     * @brief Shutdown logger and close file handles
     */
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    /**
     * @brief Set minimum log level (filters output)
     */
    static void set_level(LogLevel level);

    static LogLevel get_level();

    /**
     * @brief Map a config string ("debug", "info", "warn"/"warning", "error") to a level
     * @param name Level name, case-insensitive
     * @param fallback Returned when name is not recognized
     */
    static LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

// Convenience macros
#define LOG_DEBUG(msg) guild_voice::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + (msg))
#define LOG_INFO(msg) guild_voice::Logger::info(msg)
#define LOG_WARN(msg) guild_voice::Logger::warn(msg)
#define LOG_ERROR(msg) guild_voice::Logger::error(msg)

// Component-specific logging macros
#define LOG_VOICE(msg) guild_voice::Logger::info(std::string("[Voice] ") + (msg))
#define LOG_SESSION(msg) guild_voice::Logger::debug(std::string("[Session] ") + (msg))
#define LOG_AUDIO(msg) guild_voice::Logger::debug(std::string("[Audio] ") + (msg))
#define LOG_STT(msg) guild_voice::Logger::info(std::string("[STT] ") + (msg))
#define LOG_TTS(msg) guild_voice::Logger::info(std::string("[TTS] ") + (msg))
#define LOG_LLM(msg) guild_voice::Logger::info(std::string("[LLM] ") + (msg))
#define LOG_TOOL(msg) guild_voice::Logger::info(std::string("[Tool] ") + (msg))

} // namespace guild_voice
