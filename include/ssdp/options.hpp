#ifndef SSDP_OPTIONS_HPP
#define SSDP_OPTIONS_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "ssdp/protocol.hpp"
#include "ssdp/search_target.hpp"
#include "httpu/transport.hpp"

namespace ssdp
{

/// Configuration of one search. Defaults are enough for a 1.0 multicast
/// search for root devices; 2.0 additionally requires a control point.
struct options
{
    spec_version version = spec_version::v10;

    search_target target = search_target::root_devices();

    /// Name of the local interface to send from, e.g. "eth0"
    std::optional<std::string> network_interface;

    /// MX value and socket read timeout in seconds, must be within 1..120
    uint8_t max_wait_time = SSDP_DEFAULT_MX;

    /// "ProductName/Version" part of the USER-AGENT header (1.1 and later)
    std::optional<std::string> product_and_version;

    /// Only used and then required by 2.0
    std::optional<control_point> cp;

    static options for_version(spec_version version);

    static options for_control_point(const control_point& cp);

    /// Throws ssdp::error if the options violate the rules of the selected
    /// UPnP device architecture version.
    void validate() const;

    httpu::options to_transport_options() const;
};

} // namespace ssdp

#endif
