
#ifndef wd_discovery_wd_codec_h
#define wd_discovery_wd_codec_h

#include "wd_discovery/wd_types.h"
#include "wd_utils/wd_nullable.h"
#include <chrono>
#include <cstdint>
#include <string>

namespace wd_discovery
{

namespace wd_codec
{

/// Builds a Probe for NetworkVideoTransmitter devices under the 2005/04 profile,
/// with a fresh "uuid:..." MessageID.
probe_request build_probe();

probe_request build_probe(const std::string& correlation_id);

/// Parses a ProbeMatches or Hello datagram. Returns null for anything that is
/// not one of those two messages (malformed XML, unknown action, missing match
/// element). When a datagram is rejected, reason describes why.
wd_utils::wd_nullable<discovered_device> parse_response(
    const uint8_t* data,
    size_t size,
    const std::string& source_address,
    int source_port,
    std::chrono::steady_clock::time_point sent_at,
    std::string& reason
);

wd_utils::wd_nullable<discovered_device> parse_response(
    const std::string& datagram,
    const std::string& source_address,
    int source_port,
    std::chrono::steady_clock::time_point sent_at
);

}

}

#endif
