
#ifndef wd_discovery_wd_session_h
#define wd_discovery_wd_session_h

#include "wd_discovery/wd_types.h"
#include "wd_discovery/wd_transport.h"
#include "wd_discovery/wd_diagnostic_sink.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace wd_discovery
{

enum class session_state
{
    idle,
    sending,
    listening,
    completed
};

/// Sends one Probe and collects the answers that arrive before the deadline.
///
/// A session is single use: run() moves it from idle to completed and a second
/// call throws. Network failures never escape run(); they come back as a report
/// with succeeded == false and the cause in errors.
class wd_discovery_session final
{
public:
    /// Uses a wd_multicast_transport built from config.
    wd_discovery_session(wd_diagnostic_sink& sink, const discovery_config& config = discovery_config());
    wd_discovery_session(std::unique_ptr<wd_transport> transport, wd_diagnostic_sink& sink, const discovery_config& config = discovery_config());
    wd_discovery_session(const wd_discovery_session&) = delete;
    ~wd_discovery_session() noexcept;

    wd_discovery_session& operator = (const wd_discovery_session&) = delete;

    /// timeout is measured from the moment the Probe is sent. Hello
    /// announcements are reported only when include_hello is set.
    discovery_report run(std::chrono::milliseconds timeout, bool include_hello = false, const std::string& bind_interface = std::string());

    /// Same as above, but sends the supplied probe instead of building one.
    discovery_report run(const probe_request& probe, std::chrono::milliseconds timeout, bool include_hello = false, const std::string& bind_interface = std::string());

    /// Safe to call from another thread. The receive loop notices within one
    /// poll interval and returns what it has gathered so far.
    void cancel();

    session_state state() const { return _state; }

private:
    void _listen(
        discovery_report& report,
        const probe_request& probe,
        std::chrono::steady_clock::time_point sent_at,
        std::chrono::steady_clock::time_point deadline,
        bool include_hello
    );

    void _record_receive_error(discovery_report& report, const std::string& msg);

    std::unique_ptr<wd_transport> _transport;
    wd_diagnostic_sink& _sink;
    discovery_config _config;
    std::atomic<session_state> _state;
    std::atomic<bool> _cancelled;
    size_t _receive_errors;
};

const char* session_state_name(session_state state);

}

#endif
