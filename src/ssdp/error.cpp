#include "ssdp/error.hpp"

namespace ssdp
{

std::string_view to_string(error_kind kind)
{
    switch(kind)
    {
        case error_kind::invalid_field_value:
            return "invalid field value";
        case error_kind::missing_required_field:
            return "missing required field";
        case error_kind::unsupported:
            return "unsupported";
        case error_kind::transport:
            return "transport";
    }
    return "unknown";
}

} // namespace ssdp
