#include "ssdp/user_agent.hpp"

#include "fmt/format.h"

#include <sys/utsname.h>

namespace ssdp
{

namespace user_agent
{

std::string make(spec_version version, const std::optional<std::string>& product_and_version)
{
    std::string os_name {"unknown"};
    std::string os_version {"0"};

    utsname info;
    if(uname(&info) == 0)
    {
        os_name = info.sysname;
        os_version = info.release;
    }

    return fmt::format("{}/{} UPnP/{} {}", os_name, os_version, to_string(version),
        product_and_version ? *product_and_version : std::string {"ssdp_client/" SSDP_CLIENT_VERSION});
}

} // namespace user_agent

} // namespace ssdp
