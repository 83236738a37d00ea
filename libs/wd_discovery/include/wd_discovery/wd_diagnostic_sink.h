#ifndef wd_discovery_wd_diagnostic_sink_h
#define wd_discovery_wd_diagnostic_sink_h

#include "wd_utils/wd_logger.h"
#include <string>

namespace wd_discovery
{

/// Receives the session's diagnostic events (rejected datagrams, raw XML,
/// transport setup). file and line name the code that raised the event.
class wd_diagnostic_sink
{
public:
    virtual ~wd_diagnostic_sink() noexcept {}

    /// False when events at level would be discarded, so callers can skip
    /// building them.
    virtual bool wants(wd_utils::wd_logger::LOG_LEVEL level) const = 0;

    virtual void record_event(wd_utils::wd_logger::LOG_LEVEL level, const char* file, int line, const std::string& msg) = 0;
};

/// Forwards every event to wd_logger and shares its level threshold.
class wd_logger_sink : public wd_diagnostic_sink
{
public:
    virtual ~wd_logger_sink() noexcept {}

    virtual bool wants(wd_utils::wd_logger::LOG_LEVEL level) const override;
    virtual void record_event(wd_utils::wd_logger::LOG_LEVEL level, const char* file, int line, const std::string& msg) override;
};

}

// MSG is only evaluated when the sink wants LEVEL.
#define WD_SINK_EVENT(SINK, LEVEL, MSG) \
do { \
    if((SINK).wants(LEVEL)) \
        (SINK).record_event(LEVEL, __FILE__, __LINE__, MSG); \
} while(0)

#endif
