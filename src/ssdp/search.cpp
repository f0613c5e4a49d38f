#include "ssdp/search.hpp"
#include "ssdp/log.hpp"
#include "ssdp/protocol.hpp"
#include "ssdp/user_agent.hpp"

#include <memory>
#include <string>
#include <utility>

namespace ssdp
{

static std::string describe(const options& opts)
{
    return fmt::format("version: {}, target: {}, max_wait_time: {}, interface: {}, control point: {}",
        to_string(opts.version), opts.target.to_string(), static_cast<unsigned>(opts.max_wait_time),
        opts.network_interface.value_or("-"), opts.cp ? opts.cp->friendly_name : std::string {"-"});
}

http::request build_request(const options& opts, search_mode mode)
{
    opts.validate();

    if(mode == search_mode::unicast && opts.version < spec_version::v11)
    {
        log::error("build_request - unicast search requires UPnP/1.1 or later");
        throw error {error_kind::unsupported, {}, "unicast search requires UPnP/1.1 or later"};
    }

    http::request request {protocol::method_search};

    // Headers every UDA 1.0 search carries
    request.set_header(protocol::head_host, protocol::multicast_address);
    request.set_header(protocol::head_man, protocol::http_extension);
    if(mode == search_mode::multicast)
        request.set_header(protocol::head_mx, std::to_string(opts.max_wait_time));
    request.set_header(protocol::head_st, opts.target.to_string());

    // Headers added by 1.1
    if(opts.version >= spec_version::v11)
        request.set_header(protocol::head_user_agent, user_agent::make(opts.version, opts.product_and_version));

    // Headers added by 2.0
    if(opts.version >= spec_version::v20)
    {
        if(!opts.cp)
        {
            log::error("build_request - missing control point, required for UPnP/2.0");
            throw error {error_kind::missing_required_field, protocol::head_cp_fn, "missing control point"};
        }

        request.set_header(protocol::head_cp_fn, opts.cp->friendly_name);
        if(opts.cp->port)
            request.set_header(protocol::head_tcp_port, std::to_string(*opts.cp->port));
        if(opts.cp->uuid)
            request.set_header(protocol::head_cp_uuid, *opts.cp->uuid);
    }

    return request;
}

search_result parse_responses(const std::vector<http::response>& raw_responses, const search_target& target)
{
    search_result result;
    result.responses.reserve(raw_responses.size());

    for(const auto& raw : raw_responses)
    {
        try {
            result.responses.push_back(response::parse(raw, target));
        } catch(const error& e) {
            log::error("parse_responses - dropping response: {} ({})", e.what(), to_string(e.kind()));
            result.failures.push_back(e);
        }
    }

    return result;
}

search_result search_once(const options& opts, httpu::transport& transport)
{
    log::info("search_once - {}", describe(opts));
    http::request request = build_request(opts, search_mode::multicast);
    log::debug("search_once - request:\n{}", request.to_string());

    auto raw_responses = transport.send(request, httpu::multicast_endpoint(), opts.to_transport_options());
    return parse_responses(raw_responses, opts.target);
}

search_result search_once(const options& opts)
{
    httpu::udp_transport transport;
    return search_once(opts, transport);
}

search_result search_once_to_device(const options& opts, const httpu::endpoint& device,
    httpu::transport& transport)
{
    log::info("search_once_to_device - {}, device: {}:{}", describe(opts), device.ip, device.port);
    http::request request = build_request(opts, search_mode::unicast);
    log::debug("search_once_to_device - request:\n{}", request.to_string());

    auto raw_responses = transport.send(request, device, opts.to_transport_options());
    return parse_responses(raw_responses, opts.target);
}

search_result search_once_to_device(const options& opts, const httpu::endpoint& device)
{
    httpu::udp_transport transport;
    return search_once_to_device(opts, device, transport);
}

response_cache search(const options& opts, httpu::transport_ptr transport, std::chrono::seconds minimum_refresh)
{
    log::info("search - {}", describe(opts));
    return response_cache {opts, std::move(transport), minimum_refresh};
}

response_cache search(const options& opts)
{
    return search(opts, std::make_shared<httpu::udp_transport>());
}

} // namespace ssdp
