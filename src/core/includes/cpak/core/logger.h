#pragma once

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

// ANSI color codes for terminal output
namespace cpak::color {
inline constexpr const char* RESET = "\033[0m";
inline constexpr const char* RED = "\033[0;31m";
inline constexpr const char* GREEN = "\033[0;32m";
inline constexpr const char* YELLOW = "\033[0;33m";
inline constexpr const char* BLUE = "\033[0;34m";
inline constexpr const char* CYAN = "\033[0;36m";
inline constexpr const char* BOLD_RED = "\033[1;31m";
inline constexpr const char* BOLD_BLUE = "\033[1;34m";
}  // namespace cpak::color

// Wrap text in color codes
// Usage: LOGI("Packed ", COLORED(BLUE, id))
#define COLORED(color_arg, text) \
    cpak::color::color_arg, text, cpak::color::RESET

#ifndef PROJECT_ROOT
#define PROJECT_ROOT ""
#define PROJECT_ROOT_LENGTH 0
#endif

#define CPAK_RELATIVE_FILEPATH                                 \
    (strncmp(__FILE__, PROJECT_ROOT, PROJECT_ROOT_LENGTH) == 0 \
         ? &(__FILE__[PROJECT_ROOT_LENGTH])                    \
         : __FILE__)

namespace cpak {

enum class LogLevel {
    NONE = -2,     // Special level to disable all logging
    INHERIT = -1,  // Special level for partitions to inherit global level
    ERROR = 0,
    WARNING = 1,
    INFO = 2,
    DEBUG = 3
};

class Logger
{
private:
    static LogLevel current_level_;
    static std::mutex log_mutex_;
    static std::ostream* output_stream_;
    static std::ostream* error_stream_;

    static bool
    should_log(LogLevel level);

    static std::string
    format_timestamp()
    {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
            1000;

        std::tm tm_now;
#ifdef _WIN32
        localtime_s(&tm_now, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_now);
#endif

        std::ostringstream oss;
        oss << "[" << std::setfill('0') << std::setw(2) << tm_now.tm_hour << ":"
            << std::setw(2) << tm_now.tm_min << ":" << std::setw(2)
            << tm_now.tm_sec << "." << std::setw(3) << ms.count() << "] ";

        return oss.str();
    }

public:
    static void
    set_level(LogLevel level);

    static bool
    set_level(const std::string& level);

    static LogLevel
    get_level();

    // Redirect output (nullptr restores std::cout / std::cerr)
    static void
    set_output_stream(std::ostream* output_stream);

    static void
    set_error_stream(std::ostream* error_stream);

    static void
    reset_streams();

    template <typename... Args>
    static void
    log(LogLevel level, const Args&... args)
    {
        if (!should_log(level))
            return;
        emit(level, args...);
    }

    // Writes unconditionally; callers have already checked their level
    template <typename... Args>
    static void
    emit(LogLevel level, const Args&... args)
    {
        // Format before taking the lock
        std::ostringstream oss;
        oss << format_timestamp();

        switch (level)
        {
            case LogLevel::ERROR:
                oss << "[ERROR] ";
                break;
            case LogLevel::WARNING:
                oss << "[WARN]  ";
                break;
            case LogLevel::INFO:
                oss << "[INFO]  ";
                break;
            case LogLevel::DEBUG:
                oss << "[DEBUG] ";
                break;
            case LogLevel::NONE:
            case LogLevel::INHERIT:
                return;
        }

        (oss << ... << args);

        std::lock_guard<std::mutex> lock(log_mutex_);
        std::ostream* out = (level <= LogLevel::WARNING)
            ? (error_stream_ ? error_stream_ : &std::cerr)
            : (output_stream_ ? output_stream_ : &std::cout);
        *out << oss.str() << std::endl;
    }
};

/**
 * Named logging channel with its own level. A partition left at INHERIT
 * follows the global Logger level.
 */
class LogPartition
{
public:
    LogPartition(const std::string& name, LogLevel level = LogLevel::INHERIT)
        : name_(name), level_(level)
    {
    }

    const std::string&
    name() const
    {
        return name_;
    }

    LogLevel
    level() const
    {
        return (level_ == LogLevel::INHERIT) ? Logger::get_level() : level_;
    }

    void
    set_level(LogLevel level)
    {
        level_ = level;
    }

    bool
    should_log(LogLevel message_level) const
    {
        LogLevel effective_level = level();
        return effective_level != LogLevel::NONE &&
            message_level <= effective_level;
    }

private:
    std::string name_;
    LogLevel level_;
};

}  // namespace cpak

#define LOGE(...)                   \
    cpak::Logger::log(              \
        cpak::LogLevel::ERROR,      \
        __VA_ARGS__,                \
        " (",                       \
        CPAK_RELATIVE_FILEPATH,     \
        ":",                        \
        __LINE__,                   \
        ")")
#define LOGW(...)                                             \
    if (cpak::Logger::get_level() >= cpak::LogLevel::WARNING) \
    cpak::Logger::log(                                        \
        cpak::LogLevel::WARNING,                              \
        __VA_ARGS__,                                          \
        " (",                                                 \
        CPAK_RELATIVE_FILEPATH,                               \
        ":",                                                  \
        __LINE__,                                             \
        ")")
#define LOGI(...)                                          \
    if (cpak::Logger::get_level() >= cpak::LogLevel::INFO) \
    cpak::Logger::log(                                     \
        cpak::LogLevel::INFO,                              \
        __VA_ARGS__,                                       \
        " (",                                              \
        CPAK_RELATIVE_FILEPATH,                            \
        ":",                                               \
        __LINE__,                                          \
        ")")
#define LOGD(...)                                           \
    if (cpak::Logger::get_level() >= cpak::LogLevel::DEBUG) \
    cpak::Logger::log(                                      \
        cpak::LogLevel::DEBUG,                              \
        __VA_ARGS__,                                        \
        " (",                                               \
        CPAK_RELATIVE_FILEPATH,                             \
        ":",                                                \
        __LINE__,                                           \
        ")")

// Partition-aware variants: PLOGI(partition, "message ", value)
#define CPAK_PARTITION_LOG(level, partition, ...) \
    if ((partition).should_log(level))            \
    cpak::Logger::emit(                           \
        level,                                    \
        "[",                                      \
        (partition).name(),                       \
        "] ",                                     \
        __VA_ARGS__,                              \
        " (",                                     \
        CPAK_RELATIVE_FILEPATH,                   \
        ":",                                      \
        __LINE__,                                 \
        ")")

#define PLOGE(partition, ...) \
    CPAK_PARTITION_LOG(cpak::LogLevel::ERROR, partition, __VA_ARGS__)
#define PLOGW(partition, ...) \
    CPAK_PARTITION_LOG(cpak::LogLevel::WARNING, partition, __VA_ARGS__)
#define PLOGI(partition, ...) \
    CPAK_PARTITION_LOG(cpak::LogLevel::INFO, partition, __VA_ARGS__)
#define PLOGD(partition, ...) \
    CPAK_PARTITION_LOG(cpak::LogLevel::DEBUG, partition, __VA_ARGS__)

// Object-aware variants for classes with a `log_partition_` member
#define OLOGE(...) PLOGE(this->log_partition_, __VA_ARGS__)
#define OLOGW(...) PLOGW(this->log_partition_, __VA_ARGS__)
#define OLOGI(...) PLOGI(this->log_partition_, __VA_ARGS__)
#define OLOGD(...) PLOGD(this->log_partition_, __VA_ARGS__)
