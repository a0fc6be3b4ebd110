#include <salvo/core/log.hpp>
#include <algorithm>
#include <cstdio>
#include <vector>

namespace salvo::core {

static LogLevel s_log_level = LogLevel::Info;
static bool s_console_output = true;
static std::vector<ILogSink*> s_log_sinks;

void log(LogLevel level, const char* message) {
    if (level < s_log_level) return;
    if (s_console_output) {
        std::FILE* stream = level >= LogLevel::Warn ? stderr : stdout;
        std::fprintf(stream, "[%s] %s\n", log_level_name(level), message);
    }

    // Forward to registered sinks
    for (auto* sink : s_log_sinks) {
        if (sink) {
            sink->log(level, "salvo", message);
        }
    }
}

void set_log_level(LogLevel level) {
    s_log_level = level;
}

LogLevel get_log_level() {
    return s_log_level;
}

void set_console_output(bool enabled) {
    s_console_output = enabled;
}

void add_log_sink(ILogSink* sink) {
    if (!sink) return;
    s_log_sinks.push_back(sink);
}

void remove_log_sink(ILogSink* sink) {
    if (!sink) return;
    s_log_sinks.erase(
        std::remove(s_log_sinks.begin(), s_log_sinks.end(), sink),
        s_log_sinks.end()
    );
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Fatal: return "fatal";
    }
    return "unknown";
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    static const std::pair<const char*, LogLevel> table[] = {
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},
        {"error", LogLevel::Error},
        {"fatal", LogLevel::Fatal},
    };
    for (const auto& [key, level] : table) {
        if (name == key) {
            out = level;
            return true;
        }
    }
    return false;
}

} // namespace salvo::core
