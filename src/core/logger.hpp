#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <fstream>
#include <mutex>

namespace sproc_mapper::core {

/**
 * @brief Log levels for diagnostics
 */
enum class LogLevel {
    TRACE,   // Every ODBC call and bound parameter
    DEBUG,   // Call plans, row counts, branch decisions
    INFO,    // Informational messages
    WARN,    // Field mapping failures, refused statement hints
    ERROR,   // Errors
    FATAL    // Fatal errors
};

/**
 * @brief Parse a level name ("trace", "Debug", "WARN", ...).
 * @return std::nullopt for unknown names
 */
std::optional<LogLevel> parse_log_level(std::string_view name);

const char* log_level_name(LogLevel level) noexcept;

/**
 * @brief Thread-safe process-wide logger
 *
 * Per-field mapping failures are reported here as warnings; they are
 * advisory and never change the result of a call.
 *
 * Usage:
 *   Logger::instance().set_level(LogLevel::DEBUG);
 *   Logger::instance().set_output("sproc_mapper.log");
 *
 *   LOG_DEBUG("Executing {CALL GetUsers(?)}");
 *   LOG_WARN("Error: parsing age");
 *   LOG_IF(rows.empty(), "Empty row set, mapper skipped");
 */
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    /**
     * @brief Set output file (empty for console only). The file is opened for append.
     */
    void set_output(std::string_view filename);

    void set_console_enabled(bool enabled);

    /**
     * @brief Apply SPROC_MAPPER_LOG_LEVEL and SPROC_MAPPER_LOG_FILE if set
     */
    void configure_from_environment();

    void log(LogLevel level, std::string_view file, int line,
             std::string_view function, std::string_view message);

    /**
     * @brief Log a conditional branch decision at DEBUG level
     */
    void log_branch(bool condition, std::string_view file, int line,
                    std::string_view function,
                    std::string_view true_msg,
                    std::string_view false_msg = "");

private:
    Logger() = default;
    ~Logger();

    bool enabled(LogLevel level) const;
    static std::string timestamp();

    LogLevel min_level_ = LogLevel::INFO;
    bool console_enabled_ = true;
    std::ofstream file_stream_;
    mutable std::mutex mutex_;
};

} // namespace sproc_mapper::core

// Convenience macros - simple string-based logging
#define LOG_TRACE(msg) \
    sproc_mapper::core::Logger::instance().log( \
        sproc_mapper::core::LogLevel::TRACE, __FILE__, __LINE__, __func__, msg)

#define LOG_DEBUG(msg) \
    sproc_mapper::core::Logger::instance().log( \
        sproc_mapper::core::LogLevel::DEBUG, __FILE__, __LINE__, __func__, msg)

#define LOG_INFO(msg) \
    sproc_mapper::core::Logger::instance().log( \
        sproc_mapper::core::LogLevel::INFO, __FILE__, __LINE__, __func__, msg)

#define LOG_WARN(msg) \
    sproc_mapper::core::Logger::instance().log( \
        sproc_mapper::core::LogLevel::WARN, __FILE__, __LINE__, __func__, msg)

#define LOG_ERROR(msg) \
    sproc_mapper::core::Logger::instance().log( \
        sproc_mapper::core::LogLevel::ERROR, __FILE__, __LINE__, __func__, msg)

#define LOG_FATAL(msg) \
    sproc_mapper::core::Logger::instance().log( \
        sproc_mapper::core::LogLevel::FATAL, __FILE__, __LINE__, __func__, msg)

// Log branch decisions (IF statements)
#define LOG_IF(condition, true_msg, ...) \
    sproc_mapper::core::Logger::instance().log_branch( \
        (condition), __FILE__, __LINE__, __func__, \
        true_msg, ##__VA_ARGS__)
