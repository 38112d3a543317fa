#pragma once

#include <cstdio>
#include <cstdarg>
#include <ctime>
#include <mutex>
#include <string>

namespace util {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Fatal };

inline const char* level_name(LogLevel lvl) noexcept {
    switch (lvl) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Fatal: return "FATAL";
    }
    return "UNKNOWN";
}

// Accepts "trace", "debug", "info", "warn", "error", "fatal". Returns false on anything else.
inline bool level_from_string(const std::string& s, LogLevel& out) noexcept {
    if (s == "trace") { out = LogLevel::Trace; return true; }
    if (s == "debug") { out = LogLevel::Debug; return true; }
    if (s == "info") { out = LogLevel::Info; return true; }
    if (s == "warn") { out = LogLevel::Warn; return true; }
    if (s == "error") { out = LogLevel::Error; return true; }
    if (s == "fatal") { out = LogLevel::Fatal; return true; }
    return false;
}

namespace detail {

struct LogState {
    std::mutex mtx;
    LogLevel min_level{LogLevel::Info};
    FILE* mirror{nullptr};
};

inline LogState& log_state() {
    static LogState state;
    return state;
}

inline void write_line(FILE* sink, const char* stamp, LogLevel lvl, const char* fmt, va_list args) {
    std::fprintf(sink, "%s %s: ", stamp, level_name(lvl));
    std::vfprintf(sink, fmt, args);
    std::fprintf(sink, "\n");
}

inline void slow_log_impl(LogLevel lvl, const char* fmt, va_list args) {
    LogState& st = log_state();
    std::lock_guard<std::mutex> lock(st.mtx);
    if (lvl < st.min_level) {
        return;
    }
    char stamp[32] = "";
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    if (gmtime_r(&now, &tm) != nullptr) {
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &tm);
    }
    va_list copy;
    va_copy(copy, args);
    write_line(stderr, stamp, lvl, fmt, args);
    if (st.mirror != nullptr) {
        write_line(st.mirror, stamp, lvl, fmt, copy);
        std::fflush(st.mirror);
    }
    va_end(copy);
}

} // namespace detail

inline void set_min_level(LogLevel lvl) noexcept {
    auto& st = detail::log_state();
    std::lock_guard<std::mutex> lock(st.mtx);
    st.min_level = lvl;
}

inline LogLevel min_level() noexcept {
    auto& st = detail::log_state();
    std::lock_guard<std::mutex> lock(st.mtx);
    return st.min_level;
}

// Mirrors every record into `path` (append). An empty path closes the mirror.
inline bool set_mirror_file(const std::string& path) noexcept {
    auto& st = detail::log_state();
    std::lock_guard<std::mutex> lock(st.mtx);
    if (st.mirror != nullptr) {
        std::fclose(st.mirror);
        st.mirror = nullptr;
    }
    if (path.empty()) {
        return true;
    }
    st.mirror = std::fopen(path.c_str(), "a");
    return st.mirror != nullptr;
}

inline void log(LogLevel lvl, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::slow_log_impl(lvl, fmt, args);
    va_end(args);
}

} // namespace util
