
#include "wd_utils/wd_socket_address.h"
#include "wd_utils/wd_exception.h"
#include "wd_utils/wd_string_utils.h"
#include <memory>
#include <string.h>

using namespace std;
using namespace wd_utils;

wd_socket_address::wd_socket_address(int port, const string& address) :
    _port(port),
    _addr(address)
{
    memset(&_sockaddr, 0, sizeof(_sockaddr));
    _sockaddr.sin_family = AF_INET;
    _sockaddr.sin_port = htons((uint16_t)_port);

    if(address.empty() || address == ip4_addr_any)
    {
        _sockaddr.sin_addr.s_addr = htonl(INADDR_ANY);
        _addr = "0.0.0.0";
        return;
    }

    struct addrinfo hint;
    memset(&hint, 0, sizeof(hint));
    hint.ai_family = AF_INET;
    hint.ai_socktype = SOCK_DGRAM;

    struct addrinfo* info = nullptr;
    auto ret = getaddrinfo(address.c_str(), nullptr, &hint, &info);

    if(ret != 0)
        WD_STHROW(wd_invalid_argument_exception, ("Unable to resolve \'%s\': %s", address.c_str(), gai_strerror(ret)));

    unique_ptr<struct addrinfo, void(*)(struct addrinfo*)> info_holder(info, freeaddrinfo);

    _sockaddr.sin_addr = ((struct sockaddr_in*)info_holder->ai_addr)->sin_addr;
}

wd_socket_address::wd_socket_address(const struct sockaddr* addr, const socklen_t len) :
    _port(0),
    _addr()
{
    if(addr->sa_family != AF_INET || len < (socklen_t)sizeof(struct sockaddr_in))
        WD_STHROW(wd_invalid_argument_exception, ("wd_socket_address: Unsupported address family (%d)", addr->sa_family));

    memset(&_sockaddr, 0, sizeof(_sockaddr));
    memcpy(&_sockaddr, addr, sizeof(struct sockaddr_in));

    _port = ntohs(_sockaddr.sin_port);

    char text[INET_ADDRSTRLEN];
    if(!inet_ntop(AF_INET, &_sockaddr.sin_addr, text, sizeof(text)))
        WD_STHROW(wd_internal_exception, ("inet_ntop() failed for a datagram source address."));
    _addr = text;
}

wd_socket_address::wd_socket_address(const wd_socket_address& obj) :
    _port(obj._port),
    _addr(obj._addr)
{
    memcpy(&_sockaddr, &obj._sockaddr, sizeof(_sockaddr));
}

wd_socket_address::~wd_socket_address() noexcept
{
}

wd_socket_address& wd_socket_address::operator = (const wd_socket_address& obj)
{
    _port = obj._port;
    _addr = obj._addr;
    memcpy(&_sockaddr, &obj._sockaddr, sizeof(_sockaddr));
    return *this;
}

bool wd_socket_address::is_multicast() const
{
    uint8_t firstPart = ntohl(_sockaddr.sin_addr.s_addr) >> 24;
    return (firstPart >= 224 && firstPart <= 239);
}

string wd_socket_address::to_string() const
{
    return wd_string_utils::format("%s:%d", _addr.c_str(), _port);
}

bool wd_socket_address::is_ipv4(const string& addr)
{
    struct in_addr a;
    return inet_pton(AF_INET, addr.c_str(), &a) == 1;
}
