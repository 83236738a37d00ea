
#include "wd_discovery/wd_report.h"
#include <chrono>
#include <cmath>

using namespace wd_discovery;
using namespace wd_utils;
using namespace std;
using namespace std::chrono;

using json = nlohmann::json;

static double _round_to(double value, int places)
{
    const double scale = pow(10.0, places);
    return round(value * scale) / scale;
}

json wd_discovery::wd_report::to_json(const string& key, const discovered_device& device)
{
    json j;

    j["dedup_key"] = key;
    j["endpoint_uuid"] = device.endpoint_identity;
    j["xaddrs"] = device.service_addresses;
    j["types"] = vector<string>(device.device_types.begin(), device.device_types.end());
    j["scopes"] = vector<string>(device.scopes.begin(), device.scopes.end());
    j["metadata_version"] = (device.metadata_version.is_null()) ? json(nullptr) : json(device.metadata_version.value());
    j["source_ip"] = device.source_address;
    j["source_port"] = device.source_port;
    j["response_time_ms"] = _round_to(duration<double, milli>(device.response_latency).count(), 2);
    j["message_type"] = message_kind_name(device.kind);
    j["relates_to"] = (device.correlates_to.is_null()) ? json(nullptr) : json(device.correlates_to.value());

    return j;
}

json wd_discovery::wd_report::to_json(const discovery_report& report)
{
    json j;

    j["success"] = report.succeeded;
    j["message"] = report.message;
    j["probe_message_id"] = report.correlation_id;

    j["devices"] = json::array();
    for(auto& d : report.devices)
        j["devices"].push_back(to_json(d.first, d.second));

    j["total_devices"] = report.devices.size();
    j["elapsed_time_seconds"] = _round_to(duration<double>(report.elapsed).count(), 3);
    j["datagrams_received"] = report.datagrams_received;
    j["datagrams_rejected"] = report.datagrams_rejected;
    j["datagrams_duplicate"] = report.datagrams_duplicate;
    j["errors"] = report.errors;

    return j;
}

string wd_discovery::wd_report::render_report(const discovery_report& report, int indent)
{
    // Device strings are copied byte for byte from the wire and need not be UTF-8.
    return to_json(report).dump(indent, ' ', false, json::error_handler_t::replace);
}
