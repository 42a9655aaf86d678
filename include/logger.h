#pragma once

#include <string>
#include <ostream>
#include <memory>

namespace domo_nlu {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Process-wide logger shared by the pipeline stages and worker threads
 *
 * Lines look like "[LEVEL] 2026-03-01 12:00:00.123: message". ERROR always goes
 * to stderr; other levels go to stdout unless console_to_stderr is set, which
 * the CLI does so stdout carries nothing but interpretation results.
 * Before initialize() only WARN and ERROR are printed, to stderr.
 */
class Logger {
public:
    /**
     * @brief Install the sink; a second call is ignored until shutdown()
     * @param min_level Minimum level to output
     * @param output_file Optional file path for log output (empty = console only)
     * @param console_to_stderr Send every console line to stderr (keeps stdout for program output)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                          const std::string& output_file = "",
                          bool console_to_stderr = false);

    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    static void set_level(LogLevel level);
    static LogLevel get_level();

    /**
     * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive)
     * @param name Level name from config or command line
     * @param fallback Returned when the name is not recognized
     */
    static LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
    static const char* level_string(LogLevel level);
};

#define LOG_DEBUG(msg) domo_nlu::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) domo_nlu::Logger::info(msg)
#define LOG_WARN(msg) domo_nlu::Logger::warn(msg)
#define LOG_ERROR(msg) domo_nlu::Logger::error(msg)

// Per-stage macros; request tracing is DEBUG only
#define LOG_NORM(msg) domo_nlu::Logger::debug(std::string("[Normalizer] ") + (msg))
#define LOG_NEG(msg) domo_nlu::Logger::debug(std::string("[Negation] ") + (msg))
#define LOG_INTENT(msg) domo_nlu::Logger::debug(std::string("[Intent] ") + (msg))
#define LOG_ENTITY(msg) domo_nlu::Logger::debug(std::string("[Entity] ") + (msg))
#define LOG_GATE(msg) domo_nlu::Logger::info(std::string("[Gate] ") + (msg))
#define LOG_FALLBACK(msg) domo_nlu::Logger::info(std::string("[Fallback] ") + (msg))
#define LOG_VOCAB(msg) domo_nlu::Logger::info(std::string("[Vocabulary] ") + (msg))
#define LOG_TRACE(request_id, stage, data) domo_nlu::Logger::debug(std::string("[trace] request_id=") + std::to_string(request_id) + " stage=" + (stage) + " " + (data))

} // namespace domo_nlu
