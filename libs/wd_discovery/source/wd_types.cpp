
#include "wd_discovery/wd_types.h"
#include "wd_utils/wd_exception.h"
#include "wd_utils/wd_string_utils.h"
#include <cmath>

using namespace wd_discovery;
using namespace wd_utils;
using namespace std;
using namespace std::chrono;

const char* wd_discovery::message_kind_name(message_kind kind)
{
    return (kind == message_kind::hello) ? "Hello" : "ProbeMatch";
}

string wd_discovery::dedup_key(const discovered_device& device)
{
    if(!device.endpoint_identity.empty())
        return device.endpoint_identity;

    return wd_string_utils::format("%s:%d", device.source_address.c_str(), device.source_port);
}

milliseconds wd_discovery::timeout_from_seconds(double seconds)
{
    if(!std::isfinite(seconds) || seconds < 0.0)
        WD_STHROW(wd_invalid_argument_exception, ("Timeout must be a non-negative number of seconds: %g", seconds));

    if(seconds > MAX_DISCOVERY_TIMEOUT_SECONDS)
        WD_STHROW(wd_invalid_argument_exception, ("Timeout must not exceed %.0f seconds: %g", MAX_DISCOVERY_TIMEOUT_SECONDS, seconds));

    return duration_cast<milliseconds>(duration<double>(seconds));
}
