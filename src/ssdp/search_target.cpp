#include "ssdp/search_target.hpp"
#include "ssdp/error.hpp"
#include "ssdp/protocol.hpp"

#include "fmt/format.h"

namespace ssdp
{

static constexpr std::string_view prefix_device = "uuid:";
static constexpr std::string_view prefix_device_type = "urn:schemas-upnp-org:device:";
static constexpr std::string_view prefix_service_type = "urn:schemas-upnp-org:service:";
static constexpr std::string_view prefix_urn = "urn:";

static bool starts_with(std::string_view view, std::string_view prefix)
{
    return view.substr(0, prefix.size()) == prefix;
}

static error decode_error(std::string_view value)
{
    return error {error_kind::invalid_field_value, protocol::head_st,
        fmt::format("not a valid search target: '{}'", value)};
}

std::string search_target::check_value(std::string value)
{
    if(value.empty())
        throw error {error_kind::invalid_field_value, protocol::head_st, "search target without id or type"};
    return value;
}

std::string search_target::check_domain(std::string domain)
{
    if(domain.empty() || domain.find(':') != std::string::npos)
        throw error {error_kind::invalid_field_value, protocol::head_st,
            fmt::format("not a valid search target domain: '{}'", domain)};
    return domain;
}

std::string search_target::to_string() const
{
    switch(m_kind)
    {
        case kind::all:
            return "ssdp:all";
        case kind::root_devices:
            return "upnp:rootdevice";
        case kind::device:
            return fmt::format("uuid:{}", m_value);
        case kind::device_type:
            return fmt::format("urn:schemas-upnp-org:device:{}", m_value);
        case kind::service_type:
            return fmt::format("urn:schemas-upnp-org:service:{}", m_value);
        case kind::domain_device_type:
            return fmt::format("urn:{}:device:{}", m_domain, m_value);
        case kind::domain_service_type:
            return fmt::format("urn:{}:service:{}", m_domain, m_value);
    }
    return {};
}

search_target search_target::parse(std::string_view value)
{
    // "ssdp::all" is a common misspelling of the UDA value, accept both
    if(value == "ssdp:all" || value == "ssdp::all")
        return all();
    if(value == "upnp:rootdevice")
        return root_devices();

    std::string_view rest;
    if(starts_with(value, prefix_device))
    {
        rest = value.substr(prefix_device.size());
        if(rest.empty())
            throw decode_error(value);
        return device(std::string {rest});
    }
    if(starts_with(value, prefix_device_type))
    {
        rest = value.substr(prefix_device_type.size());
        if(rest.empty())
            throw decode_error(value);
        return device_type(std::string {rest});
    }
    if(starts_with(value, prefix_service_type))
    {
        rest = value.substr(prefix_service_type.size());
        if(rest.empty())
            throw decode_error(value);
        return service_type(std::string {rest});
    }
    if(starts_with(value, prefix_urn))
    {
        // urn:{domain-name}:device:{type} or urn:{domain-name}:service:{type}
        rest = value.substr(prefix_urn.size());
        size_t sep = rest.find(':');
        if(sep == std::string_view::npos || sep == 0)
            throw decode_error(value);

        std::string_view domain = rest.substr(0, sep);
        std::string_view typed = rest.substr(sep + 1);
        if(starts_with(typed, "device:") && typed.size() > 7)
            return domain_device_type(std::string {domain}, std::string {typed.substr(7)});
        if(starts_with(typed, "service:") && typed.size() > 8)
            return domain_service_type(std::string {domain}, std::string {typed.substr(8)});
    }

    throw decode_error(value);
}

} // namespace ssdp
