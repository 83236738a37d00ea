
#include "wd_discovery/wd_diagnostic_sink.h"

using namespace wd_discovery;
using namespace wd_utils;
using namespace std;

bool wd_logger_sink::wants(wd_logger::LOG_LEVEL level) const
{
    return level <= wd_logger::get_log_level();
}

void wd_logger_sink::record_event(wd_logger::LOG_LEVEL level, const char* file, int line, const string& msg)
{
    wd_logger::write(level, line, file, "%s", msg.c_str());
}
