#include "ncpfm/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <vector>

namespace ncpfm {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_sink_mutex;
LogSink g_sink;

void vlog(LogLevel level, const char* fmt, va_list args) {
    if (level < g_level.load(std::memory_order_relaxed)) return;

    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (g_sink) {
        va_list copy;
        va_copy(copy, args);
        int len = vsnprintf(nullptr, 0, fmt, copy);
        va_end(copy);
        if (len < 0) return;
        std::vector<char> buf(static_cast<size_t>(len) + 1);
        vsnprintf(buf.data(), buf.size(), fmt, args);
        g_sink(level, std::string(buf.data(), static_cast<size_t>(len)));
        return;
    }

    FILE* out = stdout;
    if (level == LogLevel::Warning) {
        out = stderr;
        fprintf(out, "WARNING: ");
    } else if (level == LogLevel::Error) {
        out = stderr;
        fprintf(out, "ERROR: ");
    }
    vfprintf(out, fmt, args);
    fputc('\n', out);
    fflush(out);
}

} // anonymous namespace

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
    }
    return "info";
}

void set_log_level(LogLevel level) {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel log_level() {
    return g_level.load(std::memory_order_relaxed);
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

void log_debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Debug, fmt, args);
    va_end(args);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Info, fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Warning, fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Error, fmt, args);
    va_end(args);
}

} // namespace ncpfm
