#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "cpak/core/logger.h"

namespace cpak {

LogLevel Logger::current_level_ = LogLevel::ERROR;
std::mutex Logger::log_mutex_;
std::ostream* Logger::output_stream_ = nullptr;  // nullptr = use std::cout
std::ostream* Logger::error_stream_ = nullptr;   // nullptr = use std::cerr

bool
Logger::should_log(LogLevel level)
{
    return current_level_ != LogLevel::NONE && level <= current_level_;
}

namespace {
std::string
get_level_string(const LogLevel& level)
{
    switch (level)
    {
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::NONE:
            return "NONE";
        case LogLevel::INHERIT:
            return "INHERIT";
        default:
            throw std::runtime_error("Invalid log level");
    }
}
}  // namespace

void
Logger::set_level(LogLevel level)
{
    current_level_ = level;
    if (should_log(LogLevel::DEBUG))
    {
        emit(LogLevel::DEBUG, "Log level set to ", get_level_string(level));
    }
}

bool
Logger::set_level(const std::string& level_str)
{
    static const std::unordered_map<std::string, LogLevel> level_map = {
        {"none", LogLevel::NONE},
        {"error", LogLevel::ERROR},
        {"warn", LogLevel::WARNING},
        {"warning", LogLevel::WARNING},
        {"info", LogLevel::INFO},
        {"debug", LogLevel::DEBUG}};

    std::string lower_level_str = level_str;
    std::ranges::transform(lower_level_str, lower_level_str.begin(), ::tolower);

    const auto it = level_map.find(lower_level_str);
    if (it == level_map.end())
    {
        return false;
    }

    set_level(it->second);
    return true;
}

LogLevel
Logger::get_level()
{
    return current_level_;
}

void
Logger::set_output_stream(std::ostream* output_stream)
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    output_stream_ = output_stream;
}

void
Logger::set_error_stream(std::ostream* error_stream)
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    error_stream_ = error_stream;
}

void
Logger::reset_streams()
{
    std::lock_guard<std::mutex> lock(log_mutex_);
    output_stream_ = nullptr;
    error_stream_ = nullptr;
}

}  // namespace cpak
