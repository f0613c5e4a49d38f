#ifndef SSDP_SEARCH_TARGET_HPP
#define SSDP_SEARCH_TARGET_HPP

#include <string>
#include <string_view>
#include <utility>

namespace ssdp
{

/// Value of the ST header. The device/service type keeps its ":ver" suffix,
/// only the scheme part is modelled.
class search_target
{
public:

    enum class kind
    {
        all,                    // ssdp:all
        root_devices,           // upnp:rootdevice
        device,                 // uuid:{device-UUID}
        device_type,            // urn:schemas-upnp-org:device:{deviceType:ver}
        service_type,           // urn:schemas-upnp-org:service:{serviceType:ver}
        domain_device_type,     // urn:{domain-name}:device:{deviceType:ver}
        domain_service_type     // urn:{domain-name}:service:{serviceType:ver}
    };

    search_target()
        : m_kind {kind::root_devices}
    {}

    static search_target all()
    {
        return search_target {kind::all, {}, {}};
    }

    static search_target root_devices()
    {
        return search_target {kind::root_devices, {}, {}};
    }

    // The factories below throw ssdp::error (invalid_field_value) for an empty
    // id or type and for a domain that is empty or contains ':'.

    static search_target device(std::string id)
    {
        return search_target {kind::device, {}, check_value(std::move(id))};
    }

    static search_target device_type(std::string type)
    {
        return search_target {kind::device_type, {}, check_value(std::move(type))};
    }

    static search_target service_type(std::string type)
    {
        return search_target {kind::service_type, {}, check_value(std::move(type))};
    }

    // The UPnP forum domain has its own kinds, so both encodings stay unique.
    static search_target domain_device_type(std::string domain, std::string type)
    {
        if(domain == upnp_domain)
            return device_type(std::move(type));
        return search_target {kind::domain_device_type, check_domain(std::move(domain)), check_value(std::move(type))};
    }

    static search_target domain_service_type(std::string domain, std::string type)
    {
        if(domain == upnp_domain)
            return service_type(std::move(type));
        return search_target {kind::domain_service_type, check_domain(std::move(domain)), check_value(std::move(type))};
    }

    /// Decodes an ST header value, throws ssdp::error (invalid_field_value) if
    /// the value matches none of the known forms.
    static search_target parse(std::string_view value);

    std::string to_string() const;

    kind get_kind() const
    {
        return m_kind;
    }

    const std::string& get_domain() const
    {
        return m_domain;
    }

    const std::string& get_value() const
    {
        return m_value;
    }

    bool operator==(const search_target& other) const
    {
        return m_kind == other.m_kind && m_domain == other.m_domain && m_value == other.m_value;
    }

    bool operator!=(const search_target& other) const
    {
        return !(*this == other);
    }

private:

    static constexpr const char* upnp_domain = "schemas-upnp-org";

    search_target(kind k, std::string domain, std::string value)
        : m_kind {k}, m_domain {std::move(domain)}, m_value {std::move(value)}
    {}

    static std::string check_value(std::string value);

    static std::string check_domain(std::string domain);

    kind m_kind;

    std::string m_domain;   // only set for the domain_* kinds

    std::string m_value;    // uuid or type, empty for all and root_devices

};

} // namespace ssdp

#endif
