
#ifndef wd_discovery_wd_types_h
#define wd_discovery_wd_types_h

#include "wd_discovery/wd_namespaces.h"
#include "wd_utils/wd_nullable.h"
#include <chrono>
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace wd_discovery
{

struct discovery_config
{
    std::string multicast_address {WSD_MULTICAST_ADDRESS};
    int multicast_port {WSD_MULTICAST_PORT};
    int multicast_ttl {1};

    // Upper bound on a single blocking read inside the receive loop.
    std::chrono::milliseconds poll_interval {500};

    // 0 leaves the kernel default in place.
    size_t recv_buffer_size {0};

    // Receive-loop errors beyond this count are summarized in one entry.
    size_t max_recorded_errors {64};
};

// A day. Longer listening windows are refused rather than risk overflowing
// the deadline arithmetic.
const double MAX_DISCOVERY_TIMEOUT_SECONDS = 86400.0;

/// Converts a user supplied listening window in seconds. Throws
/// wd_invalid_argument_exception unless 0 <= seconds <= MAX_DISCOVERY_TIMEOUT_SECONDS.
std::chrono::milliseconds timeout_from_seconds(double seconds);

struct probe_request
{
    std::string correlation_id;
    std::string device_type_filter;
    std::string wire;
};

enum class message_kind
{
    probe_match,
    hello
};

const char* message_kind_name(message_kind kind);

struct discovered_device
{
    std::string endpoint_identity;
    std::vector<std::string> service_addresses;
    std::set<std::string> device_types;
    std::set<std::string> scopes;
    wd_utils::wd_nullable<int> metadata_version;
    std::string source_address;
    int source_port {0};
    std::chrono::steady_clock::duration response_latency {0};
    message_kind kind {message_kind::probe_match};
    wd_utils::wd_nullable<std::string> correlates_to;
};

/// endpoint_identity when the device reported one, otherwise "address:port".
std::string dedup_key(const discovered_device& device);

struct discovery_report
{
    bool succeeded {false};
    std::string message;
    std::string correlation_id;
    std::map<std::string, discovered_device> devices;
    std::chrono::steady_clock::duration elapsed {0};
    std::vector<std::string> errors;
    size_t datagrams_received {0};
    size_t datagrams_rejected {0};
    size_t datagrams_duplicate {0};
};

}

#endif
