#ifndef SSDP_PROTOCOL_HPP
#define SSDP_PROTOCOL_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#define SSDP_MULTICAST_IP "239.255.255.250"
#define SSDP_MULTICAST_PORT 1900
#define SSDP_DEFAULT_MX 2
#define SSDP_DEFAULT_MINIMUM_REFRESH 10

#ifndef SSDP_CLIENT_VERSION
#define SSDP_CLIENT_VERSION "0.1.0"
#endif

namespace ssdp
{

namespace protocol
{

constexpr const char* method_search = "M-SEARCH";
constexpr const char* multicast_address = SSDP_MULTICAST_IP ":1900";
constexpr const char* http_extension = "\"ssdp:discover\"";

constexpr const char* head_host = "HOST";
constexpr const char* head_man = "MAN";
constexpr const char* head_mx = "MX";
constexpr const char* head_st = "ST";
constexpr const char* head_user_agent = "USER-AGENT";
constexpr const char* head_cp_fn = "CPFN.UPNP.ORG";
constexpr const char* head_tcp_port = "TCPPORT.UPNP.ORG";
constexpr const char* head_cp_uuid = "CPUUID.UPNP.ORG";

constexpr const char* head_bootid = "BOOTID.UPNP.ORG";
constexpr const char* head_cache_control = "CACHE-CONTROL";
constexpr const char* head_date = "DATE";
constexpr const char* head_ext = "EXT";
constexpr const char* head_location = "LOCATION";
constexpr const char* head_server = "SERVER";
constexpr const char* head_usn = "USN";

} // namespace protocol

enum class spec_version
{
    v10,
    v11,
    v20
};

// Enum classes compare by underlying value, so v10 < v11 < v20 holds for the
// built-in relational operators.

std::string_view to_string(spec_version version);

std::optional<spec_version> parse_spec_version(std::string_view text);

struct control_point
{
    std::string friendly_name;
    std::optional<uint16_t> port;
    std::optional<std::string> uuid;
};

} // namespace ssdp

#endif
