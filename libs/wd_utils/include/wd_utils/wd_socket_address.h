
#ifndef wd_utils_wd_socket_address_h_
#define wd_utils_wd_socket_address_h_

#include <string>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netdb.h>
#include <arpa/inet.h>

namespace wd_utils
{

/// String constant that can be used with wd_socket_address to represent INADDR_ANY.
const std::string ip4_addr_any("INADDR_ANY");

/// An IPv4 address and port, convertible to and from struct sockaddr.
class wd_socket_address final
{
public:
    /// address is a dotted quad or a host name resolved to IPv4. Empty or
    /// ip4_addr_any means INADDR_ANY, reported by address() as "0.0.0.0".
    wd_socket_address(int port, const std::string& address = ip4_addr_any);
    wd_socket_address(const struct sockaddr* addr, const socklen_t len);

    wd_socket_address(const wd_socket_address& obj);
    ~wd_socket_address() noexcept;

    wd_socket_address& operator = (const wd_socket_address& obj);

    int port() const { return _port; }

    const std::string& address() const { return _addr; }

    struct sockaddr* get_sock_addr() const { return (struct sockaddr*)&_sockaddr; }
    socklen_t sock_addr_size() const { return sizeof(struct sockaddr_in); }

    struct in_addr ipv4_addr() const { return _sockaddr.sin_addr; }

    bool is_multicast() const;

    /// "address:port"
    std::string to_string() const;

    static bool is_ipv4(const std::string& addr);

private:
    int _port;
    std::string _addr;
    struct sockaddr_in _sockaddr;
};

}

#endif
