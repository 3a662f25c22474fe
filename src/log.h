// =============================================================================
// Leveled, categorized logging
// =============================================================================

#pragma once
#include <string>
#include <cstdint>

namespace qcb {

// Note: ERR instead of ERROR to avoid the Windows ERROR macro
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERR = 4,
    FATAL = 5,
    NONE = 6
};

enum class LogCategory : uint32_t {
    GENERAL    = 0x0001,
    PARSE      = 0x0002,
    SPV        = 0x0004,
    LEDGER     = 0x0008,
    REGISTRY   = 0x0010,
    REDEMPTION = 0x0020,
    CONSENSUS  = 0x0040,
    DB         = 0x0080,
    ALL        = 0xFFFF
};

// Configuration
void log_set_level(LogLevel level);
void log_set_categories(uint32_t categories);
void log_enable_timestamps(bool enable);
// Append every line to `filepath` as well as the console. Empty path
// closes the file. Returns false if the file cannot be opened.
bool log_enable_file(const std::string& filepath);

LogLevel log_get_level();
uint32_t log_get_categories();

// "trace", "debug", "info", "warn", "error", "fatal", "none"
bool parse_log_level(const std::string& s, LogLevel& out);

void log_info(const std::string& s);
void log_warn(const std::string& s);
void log_error(const std::string& s);

void log_trace(LogCategory cat, const std::string& s);
void log_debug(LogCategory cat, const std::string& s);
void log_info(LogCategory cat, const std::string& s);
void log_warn(LogCategory cat, const std::string& s);
void log_error(LogCategory cat, const std::string& s);
void log_fatal(LogCategory cat, const std::string& s);

// Conditional logging (avoids string construction if level is disabled)
#define QCB_LOG_TRACE(cat, msg) do { \
    if (qcb::log_get_level() <= qcb::LogLevel::TRACE && \
        (qcb::log_get_categories() & static_cast<uint32_t>(cat))) { \
        qcb::log_trace(cat, msg); \
    } \
} while(0)

#define QCB_LOG_DEBUG(cat, msg) do { \
    if (qcb::log_get_level() <= qcb::LogLevel::DEBUG && \
        (qcb::log_get_categories() & static_cast<uint32_t>(cat))) { \
        qcb::log_debug(cat, msg); \
    } \
} while(0)

#define QCB_LOG_INFO(cat, msg) do { \
    if (qcb::log_get_level() <= qcb::LogLevel::INFO && \
        (qcb::log_get_categories() & static_cast<uint32_t>(cat))) { \
        qcb::log_info(cat, msg); \
    } \
} while(0)

#define QCB_LOG_WARN(cat, msg) do { \
    if (qcb::log_get_level() <= qcb::LogLevel::WARN && \
        (qcb::log_get_categories() & static_cast<uint32_t>(cat))) { \
        qcb::log_warn(cat, msg); \
    } \
} while(0)

#define QCB_LOG_ERROR(cat, msg) do { \
    if (qcb::log_get_level() <= qcb::LogLevel::ERR && \
        (qcb::log_get_categories() & static_cast<uint32_t>(cat))) { \
        qcb::log_error(cat, msg); \
    } \
} while(0)

void log_flush();

void log_init(LogLevel level = LogLevel::INFO,
              uint32_t categories = static_cast<uint32_t>(LogCategory::ALL),
              const std::string& log_file = "");

// Flush and close the log file
void log_shutdown();

}  // namespace qcb
