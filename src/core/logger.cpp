#include "logger.hpp"
#include "string_utils.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace sproc_mapper::core {

std::optional<LogLevel> parse_log_level(std::string_view name) {
    auto lower = to_lower(trim(name));
    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info")  return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;
    return std::nullopt;
}

const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (file_stream_.is_open()) {
        file_stream_.close();
    }
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::set_output(std::string_view filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_stream_.is_open()) {
        file_stream_.close();
    }

    if (!filename.empty()) {
        file_stream_.open(std::string(filename), std::ios::app);
    }
}

void Logger::set_console_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_enabled_ = enabled;
}

void Logger::configure_from_environment() {
    if (const char* level_env = std::getenv("SPROC_MAPPER_LOG_LEVEL")) {
        if (auto parsed = parse_log_level(level_env)) {
            set_level(*parsed);
        } else {
            LOG_WARN(std::string("Ignoring unknown SPROC_MAPPER_LOG_LEVEL: ") + level_env);
        }
    }

    if (const char* file_env = std::getenv("SPROC_MAPPER_LOG_FILE")) {
        set_output(file_env);
    }
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
}

void Logger::log(LogLevel level, std::string_view file, int line,
                 std::string_view function, std::string_view message) {
    if (!enabled(level)) {
        return;
    }

    // Format: [TIMESTAMP] [LEVEL] [file:line] [function] message
    std::ostringstream oss;
    oss << "[" << timestamp() << "] "
        << "[" << std::setw(5) << log_level_name(level) << "] "
        << "[" << file << ":" << line << "] "
        << "[" << function << "] "
        << message;
    std::string formatted = oss.str();

    std::lock_guard<std::mutex> lock(mutex_);

    if (console_enabled_) {
        auto& stream = level >= LogLevel::WARN ? std::cerr : std::cout;
        stream << formatted << std::endl;
    }

    if (file_stream_.is_open()) {
        file_stream_ << formatted << std::endl;
    }
}

void Logger::log_branch(bool condition, std::string_view file, int line,
                        std::string_view function,
                        std::string_view true_msg,
                        std::string_view false_msg) {
    if (!enabled(LogLevel::DEBUG)) {
        return;
    }

    std::ostringstream oss;
    oss << "BRANCH: " << (condition ? "TRUE" : "FALSE") << " - ";

    if (condition) {
        oss << true_msg;
    } else if (!false_msg.empty()) {
        oss << false_msg;
    } else {
        oss << "condition false";
    }

    log(LogLevel::DEBUG, file, line, function, oss.str());
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
#ifdef _WIN32
    localtime_s(&local_tm, &time_t_now);
#else
    localtime_r(&time_t_now, &local_tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

} // namespace sproc_mapper::core
