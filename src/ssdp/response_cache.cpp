#include "ssdp/response_cache.hpp"
#include "ssdp/log.hpp"
#include "ssdp/search.hpp"

#include <algorithm>
#include <utility>

namespace ssdp
{

response_cache::response_cache(const options& opts, httpu::transport_ptr transport,
    std::chrono::seconds minimum_refresh, time_source now)
    : m_options {opts}, m_transport {std::move(transport)}, m_minimum_refresh {minimum_refresh},
      m_now {std::move(now)}
{
    if(!m_transport)
        throw error {error_kind::transport, {}, "no transport given"};

    m_options.validate();

    std::lock_guard<std::mutex> refresh_lock {m_refresh_mutex};
    update();
}

bool response_cache::refresh()
{
    std::lock_guard<std::mutex> refresh_lock {m_refresh_mutex};
    const time_point now = m_now();

    {
        std::lock_guard<std::mutex> lock {m_mutex};
        prune(now);
        if(now - m_last_updated < m_minimum_refresh)
        {
            log::debug("refresh - last search is younger than {}s, using cached responses",
                m_minimum_refresh.count());
            return false;
        }
    }

    update();
    return true;
}

std::vector<response> response_cache::responses()
{
    std::lock_guard<std::mutex> lock {m_mutex};
    prune(m_now());

    std::vector<response> result;
    result.reserve(m_responses.size());
    for(const auto& cached : m_responses)
        result.push_back(cached.res);
    return result;
}

std::vector<response_cache::cached_response> response_cache::entries()
{
    std::lock_guard<std::mutex> lock {m_mutex};
    prune(m_now());
    return m_responses;
}

std::vector<error> response_cache::last_failures() const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    return m_last_failures;
}

response_cache::time_point response_cache::last_updated() const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    return m_last_updated;
}

void response_cache::update()
{
    // Network round trip without holding the data lock, readers keep seeing
    // the previous state. A throwing search leaves the entries untouched.
    search_result result = search_once(m_options, *m_transport);

    // Expiration counts from receipt, the search blocks for up to MX seconds
    const time_point now = m_now();

    std::lock_guard<std::mutex> lock {m_mutex};
    prune(now);
    merge(std::move(result.responses), now);
    m_last_failures = std::move(result.failures);
    m_last_updated = now;

    log::verbose("update - {} cached response(s), {} failure(s)", m_responses.size(), m_last_failures.size());
}

void response_cache::prune(time_point now)
{
    m_responses.erase(std::remove_if(m_responses.begin(), m_responses.end(), [now](const cached_response& cached) {
        return cached.expiration <= now;
    }), m_responses.end());
}

std::chrono::seconds::rep response_cache::clamp_max_age(uint64_t max_age, time_point now)
{
    // Saturate at the latest representable time point instead of wrapping
    const auto headroom = std::chrono::duration_cast<std::chrono::seconds>(time_point::max() - now).count();
    if(headroom <= 0)
        return 0;
    if(max_age > static_cast<uint64_t>(headroom))
        return headroom;
    return static_cast<std::chrono::seconds::rep>(max_age);
}

void response_cache::merge(std::vector<response>&& fresh, time_point now)
{
    for(auto& res : fresh)
    {
        const time_point expiration = now + std::chrono::seconds(clamp_max_age(res.max_age(), now));

        // A search yields a handful of services, a linear search keeps the
        // entries in arrival order
        auto it = std::find_if(m_responses.begin(), m_responses.end(), [&res](const cached_response& cached) {
            return cached.res.target() == res.target() && cached.res.service_name() == res.service_name();
        });

        if(it != m_responses.end())
        {
            it->res = std::move(res);
            it->expiration = expiration;
        }
        else
        {
            m_responses.push_back(cached_response {std::move(res), expiration});
        }
    }
}

} // namespace ssdp
