// src/log.cpp
#include "log.h"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace qcb {

static std::atomic<LogLevel> g_log_level{LogLevel::INFO};
static std::atomic<uint32_t> g_log_categories{static_cast<uint32_t>(LogCategory::ALL)};
static std::atomic<bool> g_timestamps_enabled{true};

static std::mutex g_log_mutex;
static std::FILE* g_log_file = nullptr;   // guarded by g_log_mutex

static void format_timestamp(char* buf, size_t n) {
    const std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    std::snprintf(buf, n, "%04d-%02d-%02d %02d:%02d:%02d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
}

// stdio only; never throws.
static void write_line(const char* level, bool to_err, const std::string& msg) noexcept {
    char ts[32] = {0};
    const bool stamp = g_timestamps_enabled.load(std::memory_order_relaxed);
    if (stamp) format_timestamp(ts, sizeof(ts));

    std::lock_guard<std::mutex> lk(g_log_mutex);
    std::FILE* os = to_err ? stderr : stdout;
    if (stamp) std::fprintf(os, "[%s][%s] %s\n", level, ts, msg.c_str());
    else       std::fprintf(os, "[%s] %s\n", level, msg.c_str());
    if (g_log_file) {
        // the file always gets a timestamp
        if (!stamp) format_timestamp(ts, sizeof(ts));
        std::fprintf(g_log_file, "[%s][%s] %s\n", level, ts, msg.c_str());
    }
}

static inline bool enabled(LogLevel lvl, LogCategory cat) {
    return g_log_level.load(std::memory_order_relaxed) <= lvl &&
           (g_log_categories.load(std::memory_order_relaxed) & static_cast<uint32_t>(cat));
}

void log_info(const std::string& m)  { if (enabled(LogLevel::INFO, LogCategory::GENERAL)) write_line("INFO", false, m); }
void log_warn(const std::string& m)  { if (enabled(LogLevel::WARN, LogCategory::GENERAL)) write_line("WARN", false, m); }
void log_error(const std::string& m) { if (enabled(LogLevel::ERR, LogCategory::GENERAL)) write_line("ERROR", true, m); }

void log_trace(LogCategory cat, const std::string& s) { if (enabled(LogLevel::TRACE, cat)) write_line("TRACE", false, s); }
void log_debug(LogCategory cat, const std::string& s) { if (enabled(LogLevel::DEBUG, cat)) write_line("DEBUG", false, s); }
void log_info(LogCategory cat, const std::string& s)  { if (enabled(LogLevel::INFO, cat))  write_line("INFO", false, s); }
void log_warn(LogCategory cat, const std::string& s)  { if (enabled(LogLevel::WARN, cat))  write_line("WARN", false, s); }
void log_error(LogCategory cat, const std::string& s) { if (enabled(LogLevel::ERR, cat))   write_line("ERROR", true, s); }
void log_fatal(LogCategory cat, const std::string& s) { if (enabled(LogLevel::FATAL, cat)) write_line("FATAL", true, s); }

void log_set_level(LogLevel level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

void log_set_categories(uint32_t categories) {
    g_log_categories.store(categories, std::memory_order_relaxed);
}

void log_enable_timestamps(bool enable) {
    g_timestamps_enabled.store(enable, std::memory_order_relaxed);
}

LogLevel log_get_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

uint32_t log_get_categories() {
    return g_log_categories.load(std::memory_order_relaxed);
}

bool parse_log_level(const std::string& s, LogLevel& out) {
    if (s == "trace") out = LogLevel::TRACE;
    else if (s == "debug") out = LogLevel::DEBUG;
    else if (s == "info") out = LogLevel::INFO;
    else if (s == "warn") out = LogLevel::WARN;
    else if (s == "error") out = LogLevel::ERR;
    else if (s == "fatal") out = LogLevel::FATAL;
    else if (s == "none") out = LogLevel::NONE;
    else return false;
    return true;
}

bool log_enable_file(const std::string& filepath) {
    std::lock_guard<std::mutex> lk(g_log_mutex);
    if (g_log_file) {
        std::fclose(g_log_file);
        g_log_file = nullptr;
    }
    if (filepath.empty()) return true;
    g_log_file = std::fopen(filepath.c_str(), "a");
    return g_log_file != nullptr;
}

void log_flush() {
    std::lock_guard<std::mutex> lk(g_log_mutex);
    std::fflush(stdout);
    std::fflush(stderr);
    if (g_log_file) std::fflush(g_log_file);
}

void log_init(LogLevel level, uint32_t categories, const std::string& log_file) {
    g_log_level.store(level, std::memory_order_relaxed);
    g_log_categories.store(categories, std::memory_order_relaxed);
    if (!log_file.empty() && !log_enable_file(log_file)) {
        log_warn("log: cannot open " + log_file + ", console only");
    }
}

void log_shutdown() {
    log_flush();
    log_enable_file("");
}

}  // namespace qcb
