#ifndef HTTPU_TRANSPORT_HPP
#define HTTPU_TRANSPORT_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "http/request.hpp"
#include "http/response.hpp"

namespace httpu
{

struct endpoint
{
    std::string ip;
    uint16_t port;
};

endpoint multicast_endpoint();

struct options
{
    /// Interface to send from, the wildcard address is used if not set
    std::optional<std::string> network_interface;

    /// How long to collect responses after the request went out
    std::chrono::seconds timeout {2};

    /// Largest datagram that is read in one go
    size_t packet_size = 4096;
};

/// Sends one request and collects every response that arrives before the
/// timeout. Implementations throw ssdp::error (kind transport) on socket
/// failures and drop datagrams that are no HTTP responses.
class transport
{
public:

    virtual ~transport() = default;

    virtual std::vector<http::response> send(const http::request& message, const endpoint& destination,
        const options& opts) = 0;
};

using transport_ptr = std::shared_ptr<transport>;

class udp_transport : public transport
{
public:

    udp_transport() = default;
    udp_transport(const udp_transport&) = delete;
    udp_transport& operator=(const udp_transport&) = delete;
    ~udp_transport() override = default;

    std::vector<http::response> send(const http::request& message, const endpoint& destination,
        const options& opts) override;
};

} // namespace httpu

#endif
