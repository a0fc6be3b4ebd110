#pragma once

#include <format>
#include <string>
#include <utility>

namespace salvo::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Log sink interface for custom log handlers
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void log(LogLevel level, const std::string& category, const std::string& message) = 0;
};

void log(LogLevel level, const char* message);
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Console output can be muted when a sink takes over (tests, tools)
void set_console_output(bool enabled);

// Register/unregister custom log sinks
void add_log_sink(ILogSink* sink);
void remove_log_sink(ILogSink* sink);

const char* log_level_name(LogLevel level);
bool parse_log_level(const std::string& name, LogLevel& out);

// Formatted logging. Formatting is skipped when the level is filtered out.
template<typename... Args>
void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
    if (level < get_log_level()) return;
    std::string message = std::format(fmt, std::forward<Args>(args)...);
    log(level, message.c_str());
}

} // namespace salvo::core
