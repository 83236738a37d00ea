
#include "wd_utils/wd_logger.h"
#include "wd_utils/wd_string_utils.h"
#include "wd_utils/wd_exception.h"
#include <exception>
#include <chrono>
#include <mutex>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

using namespace wd_utils;
using namespace std;

static wd_logger::LOG_LEVEL _log_level = wd_logger::LOG_LEVEL_WARNING;
static bool _console_output = true;
static wd_logger::log_callback_t _log_callback = nullptr;
static mutex _log_lock;

static string _timestamp()
{
    auto now = chrono::system_clock::now();
    auto t = chrono::system_clock::to_time_t(now);
    auto millis = chrono::duration_cast<chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    struct tm tm_storage;
    localtime_r(&t, &tm_storage);

    char buffer[32];
    strftime(buffer, sizeof(buffer), "%H:%M:%S", &tm_storage);

    return wd_string_utils::format("%s.%03d", buffer, (int)millis);
}

void wd_utils::wd_logger::write(LOG_LEVEL level,
                                int line,
                                const char* file,
                                const char* format,
                                ...)
{
    if(level > _log_level)
        return;

    va_list args;
    va_start(args, format);
    wd_logger::write(level, line, file, format, args);
    va_end(args);
}

void wd_utils::wd_logger::write(LOG_LEVEL level,
                                int line,
                                const char* file,
                                const char* format,
                                va_list& args)
{
    if(level > _log_level)
        return;

    auto msg = wd_string_utils::format(format, args);
    auto lines = wd_string_utils::split(msg, '\n');

    lock_guard<mutex> g(_log_lock);

    if(_log_callback)
    {
        for(auto l : lines)
            _log_callback(level, l);
    }

    if(_console_output)
    {
        auto ts = _timestamp();
        // At debug verbosity each line also names the source file and line it came from.
        if(_log_level >= LOG_LEVEL_DEBUG && file)
        {
            auto base = strrchr(file, '/');
            for(auto l : lines)
                fprintf(stderr, "%s [%8s] %s:%d %s\n", ts.c_str(), level_name(level), (base) ? base + 1 : file, line, l.c_str());
        }
        else
        {
            for(auto l : lines)
                fprintf(stderr, "%s [%8s] %s\n", ts.c_str(), level_name(level), l.c_str());
        }
        fflush(stderr);
    }
}

void wd_utils::wd_logger::set_log_level(LOG_LEVEL level)
{
    _log_level = level;
}

wd_logger::LOG_LEVEL wd_utils::wd_logger::get_log_level()
{
    return _log_level;
}

void wd_utils::wd_logger::set_console_output(bool enabled)
{
    _console_output = enabled;
}

void wd_utils::wd_logger::set_log_callback(log_callback_t callback)
{
    lock_guard<mutex> g(_log_lock);
    _log_callback = callback;
}

void wd_utils::wd_logger::clear_log_callback()
{
    lock_guard<mutex> g(_log_lock);
    _log_callback = nullptr;
}

const char* wd_utils::wd_logger::level_name(LOG_LEVEL level)
{
    switch(level)
    {
        case LOG_LEVEL_CRITICAL: return "CRITICAL";
        case LOG_LEVEL_ERROR: return "ERROR";
        case LOG_LEVEL_WARNING: return "WARNING";
        case LOG_LEVEL_NOTICE: return "NOTICE";
        case LOG_LEVEL_INFO: return "INFO";
        case LOG_LEVEL_TRACE: return "TRACE";
        case LOG_LEVEL_DEBUG: return "DEBUG";
        default: break;
    };

    return "UNKNOWN";
}

static void _wd_utils_terminate()
{
    WD_LOG_CRITICAL("wd_utils terminate handler called!");

    std::exception_ptr p = std::current_exception();

    if(p)
    {
        try
        {
            std::rethrow_exception(p);
        }
        catch(std::exception& ex)
        {
            WD_LOG_EXCEPTION(ex);
        }
        catch(...)
        {
            WD_LOG_CRITICAL("unknown exception in wd_utils_terminate().");
        }
    }

    fflush(stderr);

    std::abort();
}

void wd_utils::wd_logger::install_terminate()
{
    set_terminate(_wd_utils_terminate);
}
