
#include "wd_discovery/wd_namespaces.h"
#include "wd_utils/wd_exception.h"
#include <map>

using namespace wd_discovery;
using namespace std;

static const ns_profile _profile_2005_04 = {
    "2005/04",
    NS_SOAP12,
    NS_ADDRESSING_2004_08,
    NS_DISCOVERY_2005_04,
    "http://schemas.xmlsoap.org/ws/2005/04/discovery/Probe",
    "http://schemas.xmlsoap.org/ws/2004/08/addressing/role/anonymous",
    "urn:schemas-xmlsoap-org:ws:2005:04:discovery"
};

static const ns_profile _profile_2009_01 = {
    "2009/01",
    NS_SOAP12,
    NS_ADDRESSING_2005_08,
    NS_DISCOVERY_2009_01,
    "http://docs.oasis-open.org/ws-dd/ns/discovery/2009/01/Probe",
    "http://www.w3.org/2005/08/addressing/anonymous",
    "urn:docs-oasis-open-org:ws-dd:ns:discovery:2009:01"
};

const ns_profile& wd_discovery::profile_2005_04()
{
    return _profile_2005_04;
}

const ns_profile& wd_discovery::profile_2009_01()
{
    return _profile_2009_01;
}

const array<const ns_profile*, 2>& wd_discovery::known_profiles()
{
    static const array<const ns_profile*, 2> profiles = {{ &_profile_2005_04, &_profile_2009_01 }};
    return profiles;
}

const char* wd_discovery::namespace_for(const ns_profile& profile, ns_role role)
{
    return (role == ns_role::addressing) ? profile.addressing : profile.discovery;
}

const element_spec& wd_discovery::element_for(wsd_element e)
{
    static const map<wsd_element, element_spec> elements = {
        { wsd_element::action,             { "Action",            ns_role::addressing } },
        { wsd_element::relates_to,         { "RelatesTo",         ns_role::addressing } },
        { wsd_element::endpoint_reference, { "EndpointReference", ns_role::addressing } },
        { wsd_element::address,            { "Address",           ns_role::addressing } },
        { wsd_element::probe_match,        { "ProbeMatch",        ns_role::discovery } },
        { wsd_element::hello,              { "Hello",             ns_role::discovery } },
        { wsd_element::xaddrs,             { "XAddrs",            ns_role::discovery } },
        { wsd_element::types,              { "Types",             ns_role::discovery } },
        { wsd_element::scopes,             { "Scopes",            ns_role::discovery } },
        { wsd_element::metadata_version,   { "MetadataVersion",   ns_role::discovery } }
    };

    auto found = elements.find(e);
    if(found == elements.end())
        WD_STHROW(wd_utils::wd_internal_exception, ("Unknown WS-Discovery element (%d)", (int)e));

    return found->second;
}
