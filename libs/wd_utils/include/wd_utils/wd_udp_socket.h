
#ifndef wd_utils_wd_udp_socket_h
#define wd_utils_wd_udp_socket_h

#include "wd_utils/wd_socket_address.h"
#include "wd_utils/wd_exception.h"
#include <vector>
#include <cstdint>
#include <cstddef>

namespace wd_utils
{

typedef int SOK;

const size_t MAX_UDP_DATAGRAM_SIZE = 65535;

/// Owns an IPv4 datagram socket for its whole lifetime. Every call throws
/// wd_io_exception carrying the failing errno.
class wd_udp_socket final
{
public:
    wd_udp_socket();
    wd_udp_socket(const wd_udp_socket&) = delete;
    ~wd_udp_socket() noexcept;

    wd_udp_socket& operator = (const wd_udp_socket&) = delete;

    void set_reuse_address(bool reuse);
    void set_recv_buffer_size(size_t size);

    void set_multicast_ttl(int ttl);
    void set_multicast_interface(const wd_socket_address& iface);
    void join_group(const wd_socket_address& group, const wd_socket_address& iface);

    void bind(const wd_socket_address& local);
    int get_bound_port() const;

    size_t sendto(const uint8_t* buffer, size_t size, const wd_socket_address& address);

    /// Waits at most waitMillis for a datagram. Returns false if none arrived in
    /// time (or the wait was interrupted by a signal). Throws wd_io_exception on
    /// socket errors.
    bool recvfrom(std::vector<uint8_t>& buffer, wd_socket_address& from, int waitMillis);

private:
    SOK _sok;
};

}

#endif
