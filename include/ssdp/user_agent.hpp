#ifndef SSDP_USER_AGENT_HPP
#define SSDP_USER_AGENT_HPP

#include <optional>
#include <string>

#include "ssdp/protocol.hpp"

namespace ssdp
{

namespace user_agent
{

/// Builds "OS/version UPnP/x.y product/version". Without a product the client's
/// own name and version are used.
std::string make(spec_version version, const std::optional<std::string>& product_and_version);

} // namespace user_agent

} // namespace ssdp

#endif
