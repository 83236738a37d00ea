
#ifndef wd_discovery_wd_transport_h
#define wd_discovery_wd_transport_h

#include "wd_discovery/wd_types.h"
#include "wd_utils/wd_udp_socket.h"
#include <chrono>
#include <memory>
#include <cstdint>
#include <string>
#include <vector>

namespace wd_discovery
{

/// The datagram endpoint a discovery session talks through. open(), send()
/// and receive() throw wd_utils::wd_exception subclasses on failure.
class wd_transport
{
public:
    virtual ~wd_transport() noexcept {}

    /// bind_interface is an IPv4 address, or empty for any interface.
    virtual void open(const std::string& bind_interface) = 0;

    virtual void send(const std::string& payload) = 0;

    /// Waits at most wait for one datagram. Returns false if nothing arrived.
    virtual bool receive(std::vector<uint8_t>& buffer, std::string& source_address, int& source_port, std::chrono::milliseconds wait) = 0;

    virtual void close() noexcept = 0;
};

/// One UDP socket that sends to the WS-Discovery group and receives both the
/// unicast ProbeMatch replies and (group membership permitting) Hello
/// announcements.
class wd_multicast_transport final : public wd_transport
{
public:
    wd_multicast_transport(const discovery_config& config = discovery_config());
    wd_multicast_transport(const wd_multicast_transport&) = delete;
    virtual ~wd_multicast_transport() noexcept;

    wd_multicast_transport& operator = (const wd_multicast_transport&) = delete;

    virtual void open(const std::string& bind_interface) override;
    virtual void send(const std::string& payload) override;
    virtual bool receive(std::vector<uint8_t>& buffer, std::string& source_address, int& source_port, std::chrono::milliseconds wait) override;
    virtual void close() noexcept override;

    int local_port() const;

private:
    discovery_config _config;
    wd_utils::wd_socket_address _group;
    std::unique_ptr<wd_utils::wd_udp_socket> _socket;
};

}

#endif
