
#include "wd_discovery/wd_transport.h"
#include "wd_utils/wd_exception.h"
#include "wd_utils/wd_logger.h"
#include "wd_utils/wd_string_utils.h"
#include <errno.h>

using namespace wd_discovery;
using namespace wd_utils;
using namespace std;

wd_multicast_transport::wd_multicast_transport(const discovery_config& config) :
    _config(config),
    _group(config.multicast_port, config.multicast_address),
    _socket()
{
}

wd_multicast_transport::~wd_multicast_transport() noexcept
{
    close();
}

void wd_multicast_transport::open(const string& bind_interface)
{
    if(_socket)
        WD_STHROW(wd_internal_exception, ("Transport is already open."));

    if(!bind_interface.empty() && !wd_socket_address::is_ipv4(bind_interface))
        WD_STHROW(wd_invalid_argument_exception, ("Invalid bind interface: %s", bind_interface.c_str()));

    unique_ptr<wd_udp_socket> sok(new wd_udp_socket());

    sok->set_reuse_address(true);
    sok->set_multicast_ttl(_config.multicast_ttl);

    if(_config.recv_buffer_size > 0)
        sok->set_recv_buffer_size(_config.recv_buffer_size);

    // Port 0, so the kernel picks an ephemeral port for the replies.
    wd_socket_address local(0, (bind_interface.empty()) ? ip4_addr_any : bind_interface);

    try
    {
        sok->bind(local);
    }
    catch(const wd_io_exception& ex)
    {
        if(ex.error_code() == EADDRNOTAVAIL)
            throw wd_io_exception(wd_string_utils::format("%s is not an address of this host (%s)", local.address().c_str(), ex.what()), ex.error_code());
        throw;
    }

    if(!bind_interface.empty())
        sok->set_multicast_interface(local);

    sok->join_group(_group, local);

    WD_LOG_INFO("Discovery socket bound to %s:%d, joined %s", local.address().c_str(), sok->get_bound_port(), _group.to_string().c_str());

    _socket = std::move(sok);
}

void wd_multicast_transport::send(const string& payload)
{
    if(!_socket)
        WD_STHROW(wd_internal_exception, ("send() on a transport that is not open."));

    auto sent = _socket->sendto((const uint8_t*)payload.data(), payload.size(), _group);

    if(sent != payload.size())
        WD_STHROW(wd_io_exception, ("Short send to %s: %zu of %zu bytes.", _group.to_string().c_str(), sent, payload.size()));
}

bool wd_multicast_transport::receive(vector<uint8_t>& buffer, string& source_address, int& source_port, chrono::milliseconds wait)
{
    if(!_socket)
        WD_STHROW(wd_internal_exception, ("receive() on a transport that is not open."));

    wd_socket_address from(0);
    if(!_socket->recvfrom(buffer, from, (int)wait.count()))
        return false;

    source_address = from.address();
    source_port = from.port();

    return true;
}

void wd_multicast_transport::close() noexcept
{
    _socket.reset();
}

int wd_multicast_transport::local_port() const
{
    if(!_socket)
        WD_STHROW(wd_internal_exception, ("local_port() on a transport that is not open."));

    return _socket->get_bound_port();
}
