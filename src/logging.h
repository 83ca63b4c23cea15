#pragma once

#include <cstdarg>
#include <cstdio>
#include <optional>
#include <string>

namespace logging {

enum class Level { Debug, Info, Warning, Error };

inline Level g_level = Level::Info;
inline FILE* g_sink = nullptr;  // nullptr means stdout

inline void setLevel(Level level) { g_level = level; }

// Redirect all log output (tests point this at a temp file).
inline void setSink(FILE* sink) { g_sink = sink; }

// Accepts "debug", "info", "warning"/"warn", "error" (case-sensitive).
std::optional<Level> parse_level(const std::string& name);

const char* level_name(Level level);

inline void vlog(Level level, const char* fmt, va_list args) {
    FILE* out = g_sink ? g_sink : stdout;
    std::fprintf(out, "[%s] ", level_name(level));
    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
}

inline void debug(const char* fmt, ...) {
    if (g_level > Level::Debug) return;
    va_list args;
    va_start(args, fmt);
    vlog(Level::Debug, fmt, args);
    va_end(args);
}

inline void info(const char* fmt, ...) {
    if (g_level > Level::Info) return;
    va_list args;
    va_start(args, fmt);
    vlog(Level::Info, fmt, args);
    va_end(args);
}

inline void warning(const char* fmt, ...) {
    if (g_level > Level::Warning) return;
    va_list args;
    va_start(args, fmt);
    vlog(Level::Warning, fmt, args);
    va_end(args);
}

inline void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(Level::Error, fmt, args);
    va_end(args);
}

}  // namespace logging

#define LOG_DEBUG(...) logging::debug(__VA_ARGS__)
#define LOG_INFO(...) logging::info(__VA_ARGS__)
#define LOG_WARNING(...) logging::warning(__VA_ARGS__)
#define LOG_ERROR(...) logging::error(__VA_ARGS__)
