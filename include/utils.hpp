#ifndef SSDP_CLIENT_UTILS_HPP
#define SSDP_CLIENT_UTILS_HPP

#include <string>

namespace utils
{

/// IPv4 address of the named interface, throws std::runtime_error if the
/// interface does not exist or has no IPv4 address.
std::string get_interface_addr(const std::string& interface_name);

} // utils

#endif
