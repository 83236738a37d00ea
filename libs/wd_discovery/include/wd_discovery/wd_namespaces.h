
#ifndef wd_discovery_wd_namespaces_h
#define wd_discovery_wd_namespaces_h

#include <array>
#include <string>

namespace wd_discovery
{

// WS-Discovery endpoint.
const char* const WSD_MULTICAST_ADDRESS = "239.255.255.250";
const int WSD_MULTICAST_PORT = 3702;

const char* const NS_SOAP12 = "http://www.w3.org/2003/05/soap-envelope";
const char* const NS_ONVIF_NETWORK = "http://www.onvif.org/ver10/network/wsdl";

const char* const NS_ADDRESSING_2004_08 = "http://schemas.xmlsoap.org/ws/2004/08/addressing";
const char* const NS_DISCOVERY_2005_04 = "http://schemas.xmlsoap.org/ws/2005/04/discovery";

const char* const NS_ADDRESSING_2005_08 = "http://www.w3.org/2005/08/addressing";
const char* const NS_DISCOVERY_2009_01 = "http://docs.oasis-open.org/ws-dd/ns/discovery/2009/01";

const char* const ONVIF_DEVICE_TYPE = "NetworkVideoTransmitter";

/// A namespace profile is one WS-Discovery vocabulary revision. Devices in the
/// field emit either one, and sometimes a mix of both in a single message.
struct ns_profile
{
    const char* name;
    const char* soap;
    const char* addressing;
    const char* discovery;
    const char* probe_action;
    const char* anonymous_address;
    const char* multicast_to;
};

const ns_profile& profile_2005_04();
const ns_profile& profile_2009_01();

/// Profiles in the order they are probed on input: 2005/04 first, then 2009/01.
const std::array<const ns_profile*, 2>& known_profiles();

enum class ns_role
{
    addressing,
    discovery
};

const char* namespace_for(const ns_profile& profile, ns_role role);

/// Every element the codec reads, with the namespace role that qualifies it.
enum class wsd_element
{
    action,
    relates_to,
    endpoint_reference,
    address,
    probe_match,
    hello,
    xaddrs,
    types,
    scopes,
    metadata_version
};

struct element_spec
{
    const char* local_name;
    ns_role role;
};

const element_spec& element_for(wsd_element e);

}

#endif
