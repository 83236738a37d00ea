
#ifndef wd_discovery_wd_report_h
#define wd_discovery_wd_report_h

#include "wd_discovery/wd_types.h"
#include <string>
#include <nlohmann/json.hpp>

namespace wd_discovery
{

namespace wd_report
{

nlohmann::json to_json(const std::string& key, const discovered_device& device);
nlohmann::json to_json(const discovery_report& report);

/// The report as one JSON document. indent < 0 produces a single line. Bytes
/// that are not valid UTF-8 are replaced with U+FFFD.
std::string render_report(const discovery_report& report, int indent = 2);

}

}

#endif
