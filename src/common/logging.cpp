#include "logging.hpp"

#include <cstdarg>
#include <cstdio>

static LogLevel current_level = static_cast<LogLevel>(GRIDSNAKE_LOG_LEVEL);

void set_log_level(LogLevel level) { current_level = level; }

bool is_log_level_enabled(LogLevel level)
{
        return static_cast<int>(level) <= static_cast<int>(current_level);
}

const char *log_level_to_str(LogLevel level)
{
        switch (level) {
        case LogLevel::Error:
                return "ERROR";
        case LogLevel::Warn:
                return "WARN";
        case LogLevel::Info:
                return "INFO";
        case LogLevel::Debug:
                return "DEBUG";
        case LogLevel::Trace:
                return "TRACE";
        }
        return "UNKNOWN";
}

void log_message(LogLevel level, const char *tag, const char *format, ...)
{
        if (!is_log_level_enabled(level)) {
                return;
        }

        std::fprintf(stderr, "[%s] %s: ", log_level_to_str(level), tag);

        va_list args;
        va_start(args, format);
        std::vfprintf(stderr, format, args);
        va_end(args);

        std::fputc('\n', stderr);
}
