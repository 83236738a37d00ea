
#include "wd_utils/wd_udp_socket.h"
#include <sys/select.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>

using namespace wd_utils;
using namespace std;

wd_udp_socket::wd_udp_socket() :
    _sok((SOK)::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP))
{
    if(_sok < 0)
        WD_THROW_ERRNO(("Unable to create datagram socket"));
}

wd_udp_socket::~wd_udp_socket() noexcept
{
    ::close(_sok);
}

void wd_udp_socket::set_reuse_address(bool reuse)
{
    int on = (reuse) ? 1 : 0;
    if(::setsockopt(_sok, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) < 0)
        WD_THROW_ERRNO(("Unable to set SO_REUSEADDR"));
}

void wd_udp_socket::set_recv_buffer_size(size_t size)
{
    int sz = (int)size;
    if(::setsockopt(_sok, SOL_SOCKET, SO_RCVBUF, &sz, sizeof(sz)) < 0)
        WD_THROW_ERRNO(("Unable to set SO_RCVBUF"));
}

void wd_udp_socket::set_multicast_ttl(int ttl)
{
    unsigned char t = (unsigned char)ttl;
    if(::setsockopt(_sok, IPPROTO_IP, IP_MULTICAST_TTL, &t, sizeof(t)) < 0)
        WD_THROW_ERRNO(("Unable to set IP_MULTICAST_TTL=%d", ttl));
}

void wd_udp_socket::set_multicast_interface(const wd_socket_address& iface)
{
    struct in_addr addr = iface.ipv4_addr();
    if(::setsockopt(_sok, IPPROTO_IP, IP_MULTICAST_IF, &addr, sizeof(addr)) < 0)
        WD_THROW_ERRNO(("Unable to set IP_MULTICAST_IF to %s", iface.address().c_str()));
}

void wd_udp_socket::join_group(const wd_socket_address& group, const wd_socket_address& iface)
{
    if(!group.is_multicast())
        WD_STHROW(wd_invalid_argument_exception, ("%s is not a multicast address.", group.address().c_str()));

    struct ip_mreq mreq;
    memset(&mreq, 0, sizeof(mreq));
    mreq.imr_multiaddr = group.ipv4_addr();
    mreq.imr_interface = iface.ipv4_addr();

    if(::setsockopt(_sok, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0)
        WD_THROW_ERRNO(("Unable to join multicast group %s on %s", group.address().c_str(), iface.address().c_str()));
}

void wd_udp_socket::bind(const wd_socket_address& local)
{
    if(::bind(_sok, local.get_sock_addr(), local.sock_addr_size()) < 0)
        WD_THROW_ERRNO(("Unable to bind to %s", local.to_string().c_str()));
}

int wd_udp_socket::get_bound_port() const
{
    struct sockaddr_in sa;
    memset(&sa, 0, sizeof(sa));
    socklen_t size = sizeof(sa);

    if(::getsockname(_sok, (struct sockaddr*)&sa, &size) < 0)
        WD_THROW_ERRNO(("getsockname() failed"));

    return ntohs(sa.sin_port);
}

size_t wd_udp_socket::sendto(const uint8_t* buffer, size_t size, const wd_socket_address& address)
{
    auto sent = ::sendto(_sok, buffer, size, 0, address.get_sock_addr(), address.sock_addr_size());

    if(sent < 0)
        WD_THROW_ERRNO(("Unable to send %zu bytes to %s", size, address.to_string().c_str()));

    return (size_t)sent;
}

bool wd_udp_socket::recvfrom(vector<uint8_t>& buffer, wd_socket_address& from, int waitMillis)
{
    if(waitMillis < 0)
        waitMillis = 0;

    struct timeval tv;
    tv.tv_sec = waitMillis / 1000;
    tv.tv_usec = (waitMillis % 1000) * 1000;

    fd_set readFileDescriptors;
    FD_ZERO(&readFileDescriptors);
    FD_SET(_sok, &readFileDescriptors);

    int selectRet = ::select(_sok + 1, &readFileDescriptors, nullptr, nullptr, &tv);

    if(selectRet < 0)
    {
        if(errno == EINTR)
            return false;
        WD_THROW_ERRNO(("select() failed"));
    }

    if(selectRet == 0 || !FD_ISSET(_sok, &readFileDescriptors))
        return false;

    buffer.resize(MAX_UDP_DATAGRAM_SIZE);

    struct sockaddr_in src;
    memset(&src, 0, sizeof(src));
    socklen_t srcLen = sizeof(src);

    auto bytesReceived = ::recvfrom(_sok, &buffer[0], buffer.size(), 0, (struct sockaddr*)&src, &srcLen);

    if(bytesReceived < 0)
    {
        buffer.clear();
        if(errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
            return false;
        WD_THROW_ERRNO(("recvfrom() failed"));
    }

    buffer.resize((size_t)bytesReceived);

    from = wd_socket_address((struct sockaddr*)&src, srcLen);

    return true;
}
