#ifndef SSDP_RESPONSE_HPP
#define SSDP_RESPONSE_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "http/response.hpp"
#include "ssdp/error.hpp"
#include "ssdp/search_target.hpp"

using nlohmann::json;

namespace ssdp
{

/// One advertisement received in answer to a search. Only created by parse().
class response
{
public:

    response(const response&) = default;
    response(response&&) = default;
    response& operator=(const response&) = default;
    response& operator=(response&&) = default;
    ~response() = default;

    /// Validates the headers of a raw response and converts them. The search
    /// target is the one the request was sent for, responses do not report it.
    /// Throws ssdp::error naming the offending header.
    static response parse(const http::response& raw, const search_target& target);

    uint64_t max_age() const { return m_max_age; }

    const std::string& date() const { return m_date; }

    const std::string& server() const { return m_server; }

    const std::string& location() const { return m_location; }

    const search_target& target() const { return m_search_target; }

    const std::string& service_name() const { return m_service_name; }

    uint64_t boot_id() const { return m_boot_id; }

    const std::map<std::string, std::string>& other_headers() const { return m_other_headers; }

private:

    response() = default;

    uint64_t m_max_age = 0;             // seconds, from CACHE-CONTROL
    std::string m_date;
    std::string m_server;
    std::string m_location;             // URL of the device description
    search_target m_search_target;
    std::string m_service_name;         // USN
    uint64_t m_boot_id = 0;
    std::map<std::string, std::string> m_other_headers;

};

/// Outcome of one search round. Responses that failed to parse are kept in
/// failures instead of aborting the whole batch.
struct search_result
{
    std::vector<response> responses;
    std::vector<error> failures;
};

json to_json(const response& res);

} // namespace ssdp

#endif
