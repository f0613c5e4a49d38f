#ifndef SSDP_RESPONSE_CACHE_HPP
#define SSDP_RESPONSE_CACHE_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

#include "httpu/transport.hpp"
#include "ssdp/options.hpp"
#include "ssdp/response.hpp"

namespace ssdp
{

/// Responses of a multicast search together with their expiration times.
///
/// Construction performs the initial search. refresh() repeats the search with
/// the same options, at most once per minimum_refresh interval, and merges the
/// new responses keyed by (search target, USN). Expired entries are never
/// handed out. A failing refresh leaves the cached entries in place.
class response_cache
{
public:

    using clock_type = std::chrono::steady_clock;
    using time_point = clock_type::time_point;
    using time_source = std::function<time_point()>;

    struct cached_response
    {
        response res;
        time_point expiration;
    };

    response_cache() = delete;
    response_cache(const response_cache&) = delete;
    response_cache& operator=(const response_cache&) = delete;
    response_cache(response_cache&&) = delete;
    response_cache& operator=(response_cache&&) = delete;
    ~response_cache() = default;

    /// Throws ssdp::error if the options are invalid or the initial search fails.
    response_cache(const options& opts, httpu::transport_ptr transport, std::chrono::seconds minimum_refresh,
        time_source now = clock_type::now);

    /// Searches again unless the last search is younger than minimum_refresh.
    /// Returns true if a search was sent.
    bool refresh();

    /// All responses that have not expired yet.
    std::vector<response> responses();

    std::vector<cached_response> entries();

    /// Parse failures of the most recent search.
    std::vector<error> last_failures() const;

    time_point last_updated() const;

    std::chrono::seconds minimum_refresh() const
    {
        return m_minimum_refresh;
    }

    const options& get_options() const
    {
        return m_options;
    }

private:

    void update();

    static std::chrono::seconds::rep clamp_max_age(uint64_t max_age, time_point now);

    // Callers hold m_mutex
    void prune(time_point now);

    void merge(std::vector<response>&& fresh, time_point now);

    const options m_options;

    httpu::transport_ptr m_transport;

    const std::chrono::seconds m_minimum_refresh;

    time_source m_now;

    std::mutex m_refresh_mutex;             // serialises whole refreshes including network I/O

    mutable std::mutex m_mutex;             // guards the members below

    time_point m_last_updated;

    std::vector<cached_response> m_responses;

    std::vector<error> m_last_failures;

};

} // namespace ssdp

#endif
