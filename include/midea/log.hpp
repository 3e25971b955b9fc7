#ifndef MIDEA_LOG_HPP
#define MIDEA_LOG_HPP

#include <stdint.h>

namespace midea {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    None = 0xFF,
};

using log_fn_t = void (*)(LogLevel level, const char* tag, const char* msg);

void set_log_fn(log_fn_t fn);
log_fn_t get_log_fn();

void set_log_level(LogLevel level);
LogLevel get_log_level();

void log_write(LogLevel level, const char* tag, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

extern const char* MIDEA_LOG_TAG;

} // namespace midea

#define MIDEA_LOGE(tag, fmt, ...) ::midea::log_write(::midea::LogLevel::Error, tag, fmt, ##__VA_ARGS__)
#define MIDEA_LOGW(tag, fmt, ...) ::midea::log_write(::midea::LogLevel::Warning, tag, fmt, ##__VA_ARGS__)
#define MIDEA_LOGI(tag, fmt, ...) ::midea::log_write(::midea::LogLevel::Info, tag, fmt, ##__VA_ARGS__)
#define MIDEA_LOGD(tag, fmt, ...) ::midea::log_write(::midea::LogLevel::Debug, tag, fmt, ##__VA_ARGS__)

#endif // MIDEA_LOG_HPP
