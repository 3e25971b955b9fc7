#include <cstdarg>
#include <cstdio>
#include <midea/log.hpp>

namespace midea {

static log_fn_t g_log_fn = nullptr;
static LogLevel g_log_level = LogLevel::Info;

__attribute__((weak)) const char* MIDEA_LOG_TAG = "MIDEA";

void set_log_fn(log_fn_t fn) {
    g_log_fn = fn;
}
log_fn_t get_log_fn() {
    return g_log_fn;
}

void set_log_level(LogLevel level) {
    g_log_level = level;
}
LogLevel get_log_level() {
    return g_log_level;
}

static char level_letter(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return 'D';
    case LogLevel::Info:
        return 'I';
    case LogLevel::Warning:
        return 'W';
    case LogLevel::Error:
        return 'E';
    default:
        return '?';
    }
}

static void default_log(LogLevel level, const char* tag, const char* msg) {
    printf("[%s] %c %s\n", tag ? tag : MIDEA_LOG_TAG, level_letter(level), msg);
}

void log_write(LogLevel level, const char* tag, const char* fmt, ...) {
    if (level == LogLevel::None || static_cast<uint8_t>(level) < static_cast<uint8_t>(g_log_level))
        return;

    char msg[256];
    va_list args;
    va_start(args, fmt);
    vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);

    if (g_log_fn) {
        g_log_fn(level, tag, msg);
    } else {
        default_log(level, tag, msg);
    }
}

} // namespace midea
