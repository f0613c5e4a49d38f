#include "httpu/transport.hpp"

#include "socketwrapper.hpp"

#include "ssdp/error.hpp"
#include "ssdp/log.hpp"
#include "ssdp/protocol.hpp"
#include "utils.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <poll.h>

namespace httpu
{

endpoint multicast_endpoint()
{
    return endpoint {SSDP_MULTICAST_IP, SSDP_MULTICAST_PORT};
}

std::vector<http::response> udp_transport::send(const http::request& message, const endpoint& destination,
    const options& opts)
{
    using namespace std::chrono;

    std::string bind_addr {"0.0.0.0"};
    if(opts.network_interface)
    {
        try {
            bind_addr = utils::get_interface_addr(*opts.network_interface);
        } catch(const std::runtime_error& e) {
            ssdp::log::error("send - {}", e.what());
            throw ssdp::error {ssdp::error_kind::transport, {}, e.what()};
        }
    }

    std::string msg = message.to_string();
    std::vector<http::response> responses;

    try {
        net::udp_socket<net::ip_version::v4> sock {bind_addr, 0};
        sock.send(destination.ip, destination.port, net::span {msg.begin(), msg.end()});
        ssdp::log::debug("send - {} bytes to {}:{} from {}", msg.size(), destination.ip, destination.port, bind_addr);

        // Collect answers until the timeout passed
        const auto deadline = steady_clock::now() + opts.timeout;
        for(;;)
        {
            const auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
            if(remaining.count() <= 0)
                break;

            pollfd pfd {sock.get(), POLLIN, 0};
            int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
            if(ready < 0)
            {
                if(errno == EINTR)
                    continue;
                throw std::runtime_error {std::strerror(errno)};
            }
            if(ready == 0)
                break;

            [[maybe_unused]] auto [buffer, peer] = sock.read<char>(opts.packet_size);
            try {
                responses.emplace_back(std::string_view {buffer.data(), buffer.size()});
            } catch(const std::invalid_argument& e) {
                // ... No HTTP response so just skip it
                ssdp::log::verbose("send - dropping datagram ({})", e.what());
            }
        }
    } catch(const std::runtime_error& e) {
        ssdp::log::error("send - socket failure: {}", e.what());
        throw ssdp::error {ssdp::error_kind::transport, {}, e.what()};
    }

    ssdp::log::debug("send - received {} response(s)", responses.size());
    return responses;
}

} // namespace httpu
