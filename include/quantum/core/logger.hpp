// include/quantum/core/logger.hpp
#pragma once
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>

namespace quantum::core {

enum class LogLevel { Debug = 0, Info, Warning, Error };

// Line-oriented logger writing "[Level] [channel] message" the same way the
// framework always printed its request lines. Info and below go to stdout,
// warnings and errors to stderr, unless a stream is installed.
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // Route every line to `out` (nullptr restores stdout/stderr).
    void set_stream(std::ostream* out);

    void log(LogLevel level, std::string_view channel, std::string_view message);

    void debug(std::string_view channel, std::string_view message) { log(LogLevel::Debug, channel, message); }
    void info(std::string_view channel, std::string_view message) { log(LogLevel::Info, channel, message); }
    void warning(std::string_view channel, std::string_view message) { log(LogLevel::Warning, channel, message); }
    void error(std::string_view channel, std::string_view message) { log(LogLevel::Error, channel, message); }

    static std::string level_name(LogLevel level);
    // Unknown names map to Info.
    static LogLevel parse_level(std::string_view name);

private:
    Logger() = default;

    mutable std::mutex mutex_;
    LogLevel level_ = LogLevel::Info;
    std::ostream* stream_ = nullptr;
};

inline Logger& logger() { return Logger::instance(); }

} // namespace quantum::core
