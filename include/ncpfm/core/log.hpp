#pragma once

#include <functional>
#include <string>

namespace ncpfm {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

const char* log_level_name(LogLevel level);

// Receives every line that passes the level threshold instead of stdout/stderr
using LogSink = std::function<void(LogLevel, const std::string&)>;

void set_log_level(LogLevel level);
LogLevel log_level();

// Install a sink (pass nullptr to restore stdout/stderr output)
void set_log_sink(LogSink sink);

void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

} // namespace ncpfm
