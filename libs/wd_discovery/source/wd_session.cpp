
#include "wd_discovery/wd_session.h"
#include "wd_discovery/wd_codec.h"
#include "wd_utils/wd_exception.h"
#include "wd_utils/wd_string_utils.h"
#include <algorithm>
#include <thread>
#include <vector>

using namespace wd_discovery;
using namespace wd_utils;
using namespace std;
using namespace std::chrono;

wd_discovery_session::wd_discovery_session(wd_diagnostic_sink& sink, const discovery_config& config) :
    wd_discovery_session(unique_ptr<wd_transport>(new wd_multicast_transport(config)), sink, config)
{
}

wd_discovery_session::wd_discovery_session(unique_ptr<wd_transport> transport, wd_diagnostic_sink& sink, const discovery_config& config) :
    _transport(std::move(transport)),
    _sink(sink),
    _config(config),
    _state(session_state::idle),
    _cancelled(false),
    _receive_errors(0)
{
    if(!_transport)
        WD_STHROW(wd_invalid_argument_exception, ("A discovery session requires a transport."));

    if(_config.poll_interval <= milliseconds(0))
        WD_STHROW(wd_invalid_argument_exception, ("poll_interval must be positive."));
}

wd_discovery_session::~wd_discovery_session() noexcept
{
    _transport->close();
}

discovery_report wd_discovery_session::run(milliseconds timeout, bool include_hello, const string& bind_interface)
{
    return run(wd_codec::build_probe(), timeout, include_hello, bind_interface);
}

discovery_report wd_discovery_session::run(const probe_request& probe, milliseconds timeout, bool include_hello, const string& bind_interface)
{
    if(timeout < milliseconds(0))
        WD_STHROW(wd_invalid_argument_exception, ("Discovery timeout cannot be negative."));

    auto expected = session_state::idle;
    if(!_state.compare_exchange_strong(expected, session_state::sending))
        WD_THROW(("Discovery session already %s.", session_state_name(expected)));

    auto started = steady_clock::now();

    discovery_report report;
    report.correlation_id = probe.correlation_id;

    steady_clock::time_point sent_at;

    try
    {
        _transport->open(bind_interface);

        WD_SINK_EVENT(_sink, wd_logger::LOG_LEVEL_DEBUG, "Sending Probe:\n" + probe.wire);

        _transport->send(probe.wire);
        sent_at = steady_clock::now();
    }
    catch(const std::exception& ex)
    {
        _transport->close();

        report.errors.push_back(ex.what());
        report.message = string("Discovery failed: ") + ex.what();
        report.elapsed = steady_clock::now() - started;

        WD_SINK_EVENT(_sink, wd_logger::LOG_LEVEL_ERROR, report.message);

        _state = session_state::completed;
        return report;
    }

    WD_SINK_EVENT(_sink, wd_logger::LOG_LEVEL_INFO, wd_string_utils::format("Probe %s sent, listening for %lld ms", probe.correlation_id.c_str(), (long long)timeout.count()));

    _state = session_state::listening;

    // A timeout too large for the clock means no deadline; cancel() still ends the loop.
    auto headroom = duration_cast<milliseconds>(steady_clock::time_point::max() - sent_at);
    auto deadline = (timeout > headroom) ? steady_clock::time_point::max() : sent_at + timeout;

    _listen(report, probe, sent_at, deadline, include_hello);

    _transport->close();

    if(_receive_errors > _config.max_recorded_errors)
        report.errors.push_back(wd_string_utils::format("%zu additional receive errors suppressed", _receive_errors - _config.max_recorded_errors));

    report.succeeded = !report.devices.empty();
    report.message = (report.succeeded) ?
        wd_string_utils::format("Discovered %zu ONVIF device(s)", report.devices.size()) :
        string("No ONVIF devices discovered");
    report.elapsed = steady_clock::now() - started;

    WD_SINK_EVENT(_sink, wd_logger::LOG_LEVEL_INFO, report.message);

    _state = session_state::completed;

    return report;
}

void wd_discovery_session::cancel()
{
    _cancelled = true;
}

void wd_discovery_session::_listen(
    discovery_report& report,
    const probe_request& probe,
    steady_clock::time_point sent_at,
    steady_clock::time_point deadline,
    bool include_hello
)
{
    vector<uint8_t> buffer;

    while(!_cancelled)
    {
        auto now = steady_clock::now();
        if(now >= deadline)
            break;

        auto wait = std::min(_config.poll_interval, duration_cast<milliseconds>(deadline - now));

        string source_address;
        int source_port = 0;
        bool received = false;

        try
        {
            received = _transport->receive(buffer, source_address, source_port, wait);
        }
        catch(const wd_exception& ex)
        {
            _record_receive_error(report, ex.what());

            // a persistent error would otherwise spin until the deadline.
            this_thread::sleep_for(wait);
            continue;
        }

        if(!received)
            continue;

        ++report.datagrams_received;

        auto source = wd_string_utils::format("%s:%d", source_address.c_str(), source_port);

        WD_SINK_EVENT(
            _sink,
            wd_logger::LOG_LEVEL_DEBUG,
            wd_string_utils::format("Received %zu bytes from %s:\n", buffer.size(), source.c_str()) + string((const char*)buffer.data(), buffer.size())
        );

        string reason;
        auto parsed = wd_codec::parse_response(buffer.data(), buffer.size(), source_address, source_port, sent_at, reason);

        if(!parsed)
        {
            ++report.datagrams_rejected;
            WD_SINK_EVENT(_sink, wd_logger::LOG_LEVEL_DEBUG, "Discarded datagram from " + source + ": " + reason);
            continue;
        }

        const discovered_device& device = parsed.value();

        if(device.kind == message_kind::probe_match)
        {
            if(device.correlates_to != probe.correlation_id)
            {
                ++report.datagrams_rejected;
                WD_SINK_EVENT(
                    _sink,
                    wd_logger::LOG_LEVEL_DEBUG,
                    wd_string_utils::format(
                        "Discarded ProbeMatch from %s: RelatesTo %s does not match %s",
                        source.c_str(),
                        device.correlates_to.value_or("(missing)").c_str(),
                        probe.correlation_id.c_str()
                    )
                );
                continue;
            }
        }
        else if(!include_hello)
        {
            ++report.datagrams_rejected;
            WD_SINK_EVENT(_sink, wd_logger::LOG_LEVEL_DEBUG, "Ignoring Hello from " + source);
            continue;
        }

        auto key = dedup_key(device);

        if(report.devices.find(key) != report.devices.end())
        {
            ++report.datagrams_duplicate;
            WD_SINK_EVENT(_sink, wd_logger::LOG_LEVEL_DEBUG, "Duplicate response for " + key + " from " + source);
            continue;
        }

        WD_SINK_EVENT(
            _sink,
            wd_logger::LOG_LEVEL_INFO,
            wd_string_utils::format("%s from %s: %s", message_kind_name(device.kind), source.c_str(), key.c_str())
        );

        report.devices.emplace(key, device);
    }

    if(_cancelled)
        WD_SINK_EVENT(_sink, wd_logger::LOG_LEVEL_NOTICE, "Discovery cancelled before the deadline.");
}

void wd_discovery_session::_record_receive_error(discovery_report& report, const string& msg)
{
    ++_receive_errors;

    if(_receive_errors <= _config.max_recorded_errors)
        report.errors.push_back(msg);

    WD_SINK_EVENT(_sink, wd_logger::LOG_LEVEL_WARNING, "Receive error: " + msg);
}

const char* wd_discovery::session_state_name(session_state state)
{
    switch(state)
    {
        case session_state::idle: return "idle";
        case session_state::sending: return "sending";
        case session_state::listening: return "listening";
        case session_state::completed: return "completed";
    }
    return "unknown";
}
