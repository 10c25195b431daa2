#pragma once

/**
 * Levelled logging used across the game console. Each translation unit
 * defines its own `TAG` (e.g. `#define TAG "snake"`) and passes it as the first
 * argument of the macros below, the remaining arguments follow the printf
 * format conventions:
 *
 *   LOG_DEBUG(TAG, "Snake moved to {x: %d, y: %d}", head.x, head.y);
 *
 * Messages below the current threshold are discarded before formatting.
 */
enum class LogLevel : int {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3,
        Trace = 4,
};

#ifndef GRIDSNAKE_LOG_LEVEL
#define GRIDSNAKE_LOG_LEVEL 2
#endif

void set_log_level(LogLevel level);
bool is_log_level_enabled(LogLevel level);
const char *log_level_to_str(LogLevel level);

void log_message(LogLevel level, const char *tag, const char *format, ...);

#define LOG_ERROR(tag, ...) log_message(LogLevel::Error, tag, __VA_ARGS__)
#define LOG_WARN(tag, ...) log_message(LogLevel::Warn, tag, __VA_ARGS__)
#define LOG_INFO(tag, ...) log_message(LogLevel::Info, tag, __VA_ARGS__)
#define LOG_DEBUG(tag, ...) log_message(LogLevel::Debug, tag, __VA_ARGS__)
#define LOG_TRACE(tag, ...) log_message(LogLevel::Trace, tag, __VA_ARGS__)
