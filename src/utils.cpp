#include <utils.hpp>

#include <array>
#include <stdexcept>
#include <ifaddrs.h>
#include <sys/socket.h>
#include <netdb.h>
#include <net/if.h>

namespace utils
{

std::string get_interface_addr(const std::string& interface_name)
{
    ifaddrs* addrs;
    if (getifaddrs(&addrs))
        throw std::runtime_error {"Unable to list network interfaces"};

    std::string result;
    for (ifaddrs* curr_addr = addrs; curr_addr != nullptr; curr_addr = curr_addr->ifa_next)
    {
        if(curr_addr->ifa_addr == nullptr || curr_addr->ifa_addr->sa_family != AF_INET)
            continue;
        if(interface_name != curr_addr->ifa_name)
            continue;

        std::array<char, NI_MAXHOST> host;
        int s = getnameinfo(curr_addr->ifa_addr, sizeof(sockaddr_in),
            host.data(), NI_MAXHOST, nullptr, 0, NI_NUMERICHOST);
        if(s == 0)
        {
            result = host.data();
            break;
        }
    }

    freeifaddrs(addrs);
    if(result.empty())
        throw std::runtime_error {"No IPv4 address for interface " + interface_name};
    return result;
}

} // utils
