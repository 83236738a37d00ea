
#ifndef wd_utils_wd_logger_h
#define wd_utils_wd_logger_h

#include <cstdarg>
#include <functional>
#include <string>

namespace wd_utils
{

namespace wd_logger
{

enum LOG_LEVEL
{
    LOG_LEVEL_CRITICAL = 1,
    LOG_LEVEL_ERROR = 3,
    LOG_LEVEL_WARNING = 4,
    LOG_LEVEL_NOTICE = 5,
    LOG_LEVEL_INFO = 6,
    LOG_LEVEL_TRACE = 7,
    LOG_LEVEL_DEBUG = 8
};

#define WD_LOG_CRITICAL(format, ...) wd_utils::wd_logger::write(wd_utils::wd_logger::LOG_LEVEL_CRITICAL, __LINE__, __FILE__, format,  ##__VA_ARGS__)
#define WD_LOG_ERROR(format, ...) wd_utils::wd_logger::write(wd_utils::wd_logger::LOG_LEVEL_ERROR, __LINE__, __FILE__, format,  ##__VA_ARGS__)
#define WD_LOG_WARNING(format, ...) wd_utils::wd_logger::write(wd_utils::wd_logger::LOG_LEVEL_WARNING, __LINE__, __FILE__, format,  ##__VA_ARGS__)
#define WD_LOG_NOTICE(format, ...) wd_utils::wd_logger::write(wd_utils::wd_logger::LOG_LEVEL_NOTICE, __LINE__, __FILE__, format,  ##__VA_ARGS__)
#define WD_LOG_INFO(format, ...) wd_utils::wd_logger::write(wd_utils::wd_logger::LOG_LEVEL_INFO, __LINE__, __FILE__, format,  ##__VA_ARGS__)
#define WD_LOG_TRACE(format, ...) wd_utils::wd_logger::write(wd_utils::wd_logger::LOG_LEVEL_TRACE, __LINE__, __FILE__, format,  ##__VA_ARGS__)
#define WD_LOG_DEBUG(format, ...) wd_utils::wd_logger::write(wd_utils::wd_logger::LOG_LEVEL_DEBUG, __LINE__, __FILE__, format,  ##__VA_ARGS__)

typedef std::function<void(LOG_LEVEL, const std::string&)> log_callback_t;

void write(LOG_LEVEL level, int line, const char* file, const char* format, ...);
void write(LOG_LEVEL level, int line, const char* file, const char* format, va_list& args);

/// Messages less severe than level are dropped. The default is LOG_LEVEL_WARNING.
void set_log_level(LOG_LEVEL level);
LOG_LEVEL get_log_level();

/// Console output always goes to stderr; stdout is reserved for program output.
void set_console_output(bool enabled);

void set_log_callback(log_callback_t callback);
void clear_log_callback();

const char* level_name(LOG_LEVEL level);

void install_terminate();

}

}

#endif
