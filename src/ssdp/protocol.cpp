#include "ssdp/protocol.hpp"

namespace ssdp
{

std::string_view to_string(spec_version version)
{
    switch(version)
    {
        case spec_version::v10:
            return "1.0";
        case spec_version::v11:
            return "1.1";
        case spec_version::v20:
            return "2.0";
    }
    return "1.0";
}

std::optional<spec_version> parse_spec_version(std::string_view text)
{
    if(text == "1.0")
        return spec_version::v10;
    else if(text == "1.1")
        return spec_version::v11;
    else if(text == "2.0")
        return spec_version::v20;
    return std::nullopt;
}

} // namespace ssdp
