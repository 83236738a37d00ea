
#include "wd_discovery/wd_codec.h"
#include "wd_discovery/wd_namespaces.h"
#include "wd_utils/wd_string_utils.h"
#include "wd_utils/wd_uuid.h"
#include "wd_utils/wd_exception.h"
#include <algorithm>
#include <sstream>
#include <vector>
#include <pugixml.hpp>

using namespace wd_discovery;
using namespace wd_utils;
using namespace std;

// Build namespace-agnostic XPath query using local-name() and namespace-uri()
// Example: _xpath_local("XAddrs", "http://schemas.xmlsoap.org/ws/2005/04/discovery")
//   returns: "*[local-name()='XAddrs' and namespace-uri()='http://schemas.xmlsoap.org/ws/2005/04/discovery']"
static string _xpath_local(const string& local_name, const string& ns_uri)
{
    return "*[local-name()='" + local_name + "' and namespace-uri()='" + ns_uri + "']";
}

// Namespace URIs to try for a role: the active profile's first, then each known
// profile in its fixed order (2005/04, 2009/01). Devices that mix vocabularies
// are matched by the later entries.
static vector<const char*> _probe_order(const ns_profile& active, ns_role role)
{
    vector<const char*> order;
    order.push_back(namespace_for(active, role));

    for(auto p : known_profiles())
    {
        auto uri = namespace_for(*p, role);
        if(find_if(order.begin(), order.end(), [uri](const char* o){ return string(o) == uri; }) == order.end())
            order.push_back(uri);
    }

    return order;
}

enum class search_depth
{
    child,
    descendant
};

static pugi::xml_node _lookup_in(const pugi::xml_node& context, const element_spec& spec, const char* uri, search_depth depth)
{
    const string axis = (depth == search_depth::child) ? "./" : ".//";
    auto xpath = axis + _xpath_local(spec.local_name, uri);
    return context.select_node(xpath.c_str()).node();
}

static pugi::xml_node _lookup(const pugi::xml_node& context, wsd_element e, const ns_profile& active, search_depth depth)
{
    auto& spec = element_for(e);

    for(auto uri : _probe_order(active, spec.role))
    {
        auto found = _lookup_in(context, spec, uri, depth);
        if(found)
            return found;
    }

    return pugi::xml_node();
}

static string _text(const pugi::xml_node& node)
{
    return (node) ? wd_string_utils::strip(node.text().get()) : string();
}

static vector<string> _tokens(const pugi::xml_node& node)
{
    return (node) ? wd_string_utils::split_whitespace(node.text().get()) : vector<string>();
}

// EndpointReference/Address under the active profile, then a bare Address in
// each known addressing namespace.
static string _endpoint_identity(const pugi::xml_node& match, const ns_profile& active)
{
    auto& epr = element_for(wsd_element::endpoint_reference);
    auto& address = element_for(wsd_element::address);

    auto xpath = ".//" + _xpath_local(epr.local_name, namespace_for(active, epr.role)) +
                 "/" + _xpath_local(address.local_name, namespace_for(active, address.role));

    auto found = match.select_node(xpath.c_str());
    if(found)
        return _text(found.node());

    for(auto p : known_profiles())
    {
        xpath = ".//" + _xpath_local(address.local_name, namespace_for(*p, address.role));
        found = match.select_node(xpath.c_str());
        if(found)
            return _text(found.node());
    }

    return string();
}

static wd_nullable<int> _metadata_version(const pugi::xml_node& node)
{
    wd_nullable<int> version;

    auto text = _text(node);
    if(!wd_string_utils::is_integer(text))
        return version;

    try
    {
        version.set_value(wd_string_utils::s_to_int(text));
    }
    catch(const wd_invalid_argument_exception&)
    {
        // out of range for int, treated like any other unparseable value.
    }

    return version;
}

probe_request wd_discovery::wd_codec::build_probe()
{
    return build_probe("uuid:" + wd_uuid::generate());
}

probe_request wd_discovery::wd_codec::build_probe(const string& correlation_id)
{
    auto& profile = profile_2005_04();

    pugi::xml_document doc;

    pugi::xml_node declaration = doc.append_child(pugi::node_declaration);
    declaration.append_attribute("version") = "1.0";
    declaration.append_attribute("encoding") = "UTF-8";

    pugi::xml_node envelope = doc.append_child("s:Envelope");
    envelope.append_attribute("xmlns:s") = profile.soap;
    envelope.append_attribute("xmlns:a") = profile.addressing;

    pugi::xml_node header = envelope.append_child("s:Header");

    pugi::xml_node action = header.append_child("a:Action");
    action.append_attribute("s:mustUnderstand") = "1";
    action.text().set(profile.probe_action);

    header.append_child("a:MessageID").text().set(correlation_id.c_str());

    header.append_child("a:ReplyTo").append_child("a:Address").text().set(profile.anonymous_address);

    pugi::xml_node to = header.append_child("a:To");
    to.append_attribute("s:mustUnderstand") = "1";
    to.text().set(profile.multicast_to);

    pugi::xml_node body = envelope.append_child("s:Body");

    pugi::xml_node probe = body.append_child("d:Probe");
    probe.append_attribute("xmlns:d") = profile.discovery;

    pugi::xml_node types = probe.append_child("d:Types");
    types.append_attribute("xmlns:dp0") = NS_ONVIF_NETWORK;
    types.text().set((string("dp0:") + ONVIF_DEVICE_TYPE).c_str());

    ostringstream oss;
    doc.save(oss, "", pugi::format_raw);

    probe_request request;
    request.correlation_id = correlation_id;
    request.device_type_filter = ONVIF_DEVICE_TYPE;
    request.wire = oss.str();

    return request;
}

wd_nullable<discovered_device> wd_discovery::wd_codec::parse_response(
    const uint8_t* data,
    size_t size,
    const string& source_address,
    int source_port,
    chrono::steady_clock::time_point sent_at,
    string& reason
)
{
    wd_nullable<discovered_device> result;

    if(data == nullptr || size == 0)
    {
        reason = "empty datagram";
        return result;
    }

    pugi::xml_document doc;
    pugi::xml_parse_result parsed = doc.load_buffer(data, size);
    if(!parsed)
    {
        reason = string("XML parse error: ") + parsed.description();
        return result;
    }

    try
    {
        // The first profile whose addressing namespace yields an Action header
        // becomes the active profile for every other lookup in this message.
        const ns_profile* active = nullptr;
        pugi::xml_node action_node;
        auto& action_spec = element_for(wsd_element::action);

        for(auto p : known_profiles())
        {
            auto xpath = "//" + _xpath_local(action_spec.local_name, namespace_for(*p, action_spec.role));
            auto found = doc.select_node(xpath.c_str());
            if(found)
            {
                active = p;
                action_node = found.node();
                break;
            }
        }

        if(!active)
        {
            reason = "no Action header";
            return result;
        }

        auto action = _text(action_node);

        discovered_device device;
        wsd_element match_element;

        if(wd_string_utils::contains(action, "ProbeMatches"))
        {
            device.kind = message_kind::probe_match;
            match_element = wsd_element::probe_match;
        }
        else if(wd_string_utils::contains(action, "Hello"))
        {
            device.kind = message_kind::hello;
            match_element = wsd_element::hello;
        }
        else
        {
            reason = "unrecognized action: " + action;
            return result;
        }

        auto match = _lookup(doc, match_element, *active, search_depth::descendant);
        if(!match)
        {
            reason = wd_string_utils::format("no %s element (%s profile)", element_for(match_element).local_name, active->name);
            return result;
        }

        if(device.kind == message_kind::probe_match)
        {
            // Only the active addressing namespace counts; a RelatesTo from another
            // WS-Addressing version leaves the match uncorrelated.
            auto& spec = element_for(wsd_element::relates_to);
            auto relates_to = _lookup_in(doc, spec, namespace_for(*active, spec.role), search_depth::descendant);
            auto text = _text(relates_to);
            if(!text.empty())
                device.correlates_to.set_value(text);
        }

        device.endpoint_identity = _endpoint_identity(match, *active);
        device.service_addresses = _tokens(_lookup(match, wsd_element::xaddrs, *active, search_depth::child));

        for(auto& t : _tokens(_lookup(match, wsd_element::types, *active, search_depth::child)))
            device.device_types.insert(t);

        for(auto& s : _tokens(_lookup(match, wsd_element::scopes, *active, search_depth::child)))
            device.scopes.insert(s);

        device.metadata_version = _metadata_version(_lookup(match, wsd_element::metadata_version, *active, search_depth::child));

        device.source_address = source_address;
        device.source_port = source_port;
        device.response_latency = chrono::steady_clock::now() - sent_at;

        result.set_value(device);
    }
    catch(const pugi::xpath_exception& ex)
    {
        reason = string("XPath error: ") + ex.what();
    }

    return result;
}

wd_nullable<discovered_device> wd_discovery::wd_codec::parse_response(
    const string& datagram,
    const string& source_address,
    int source_port,
    chrono::steady_clock::time_point sent_at
)
{
    string reason;
    return parse_response((const uint8_t*)datagram.data(), datagram.size(), source_address, source_port, sent_at, reason);
}
