#include <quantum/core/logger.hpp>
#include <quantum/support/str.hpp>

#include <iostream>

namespace quantum::core {

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::set_stream(std::ostream* out)
{
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ = out;
}

void Logger::log(LogLevel level, std::string_view channel, std::string_view message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < level_) return;

    std::ostream& out = stream_ ? *stream_ : (level >= LogLevel::Warning ? std::cerr : std::cout);
    out << "[" << level_name(level) << "] ";
    if (!channel.empty()) out << "[" << channel << "] ";
    out << message << std::endl;
}

std::string Logger::level_name(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug: return "Debug";
        case LogLevel::Info: return "Info";
        case LogLevel::Warning: return "Warning";
        case LogLevel::Error: return "Error";
    }
    return "Info";
}

LogLevel Logger::parse_level(std::string_view name)
{
    auto lower = support::str::to_lower(support::str::trim(name));
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error" || lower == "critical") return LogLevel::Error;
    return LogLevel::Info;
}

} // namespace quantum::core
