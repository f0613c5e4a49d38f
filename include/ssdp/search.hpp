#ifndef SSDP_SEARCH_HPP
#define SSDP_SEARCH_HPP

#include <chrono>
#include <vector>

#include "http/request.hpp"
#include "httpu/transport.hpp"
#include "ssdp/error.hpp"
#include "ssdp/options.hpp"
#include "ssdp/response.hpp"
#include "ssdp/response_cache.hpp"

namespace ssdp
{

enum class search_mode
{
    multicast,
    unicast
};

/// Builds the M-SEARCH request for the given options. Validates the options
/// first and throws ssdp::error if they are not usable.
http::request build_request(const options& opts, search_mode mode = search_mode::multicast);

/// Parses every raw response, collecting failures next to the successes.
search_result parse_responses(const std::vector<http::response>& raw_responses, const search_target& target);

/// Multicast search, results are returned directly.
search_result search_once(const options& opts, httpu::transport& transport);

search_result search_once(const options& opts);

/// Unicast search to a single device, only available with 1.1 and later.
search_result search_once_to_device(const options& opts, const httpu::endpoint& device,
    httpu::transport& transport);

search_result search_once_to_device(const options& opts, const httpu::endpoint& device);

/// Multicast search whose results are kept in a cache that can be refreshed.
response_cache search(const options& opts, httpu::transport_ptr transport,
    std::chrono::seconds minimum_refresh = std::chrono::seconds {SSDP_DEFAULT_MINIMUM_REFRESH});

response_cache search(const options& opts);

} // namespace ssdp

#endif
