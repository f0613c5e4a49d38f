#include "ssdp/options.hpp"
#include "ssdp/error.hpp"
#include "ssdp/log.hpp"

#include <regex>

namespace ssdp
{

static const std::regex& product_and_version_pattern()
{
    static const std::regex pattern {R"(^[A-Za-z0-9_.~+-]+/[A-Za-z0-9_.~+-]+$)"};
    return pattern;
}

options options::for_version(spec_version version)
{
    options opts;
    opts.version = version;
    return opts;
}

options options::for_control_point(const control_point& cp)
{
    options opts;
    opts.version = spec_version::v20;
    opts.cp = cp;
    return opts;
}

void options::validate() const
{
    if(max_wait_time < 1 || max_wait_time > 120)
    {
        log::error("validate - max_wait_time must be between 1..120 ({})", static_cast<unsigned>(max_wait_time));
        throw error {error_kind::invalid_field_value, protocol::head_mx, "max_wait_time must be between 1 and 120"};
    }

    if(version >= spec_version::v11 && product_and_version)
    {
        if(!std::regex_match(*product_and_version, product_and_version_pattern()))
        {
            log::error("validate - user agent needs to match 'ProductName/Version' ({})", *product_and_version);
            throw error {error_kind::invalid_field_value, protocol::head_user_agent,
                "product and version must match 'ProductName/Version'"};
        }
    }

    if(version >= spec_version::v20)
    {
        if(!cp)
        {
            log::error("validate - control point required");
            throw error {error_kind::invalid_field_value, protocol::head_cp_fn, "control point required for UPnP/2.0"};
        }
        if(cp->friendly_name.empty())
        {
            log::error("validate - control point friendly name required");
            throw error {error_kind::invalid_field_value, protocol::head_cp_fn,
                "control point friendly name required for UPnP/2.0"};
        }
    }
}

httpu::options options::to_transport_options() const
{
    httpu::options transport_options;
    transport_options.network_interface = network_interface;
    transport_options.timeout = std::chrono::seconds {max_wait_time};
    return transport_options;
}

} // namespace ssdp
