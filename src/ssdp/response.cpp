#include "ssdp/response.hpp"
#include "ssdp/protocol.hpp"
#include "http/header.hpp"

#include "fmt/format.h"

#include <algorithm>
#include <array>
#include <charconv>
#include <regex>

namespace ssdp
{

static constexpr std::array<const char*, 7> required_headers {
    protocol::head_bootid,
    protocol::head_cache_control,
    protocol::head_date,
    protocol::head_ext,
    protocol::head_location,
    protocol::head_st,
    protocol::head_usn
};

static const std::regex& max_age_pattern()
{
    static const std::regex pattern {R"(max-age\s*=\s*(\d+))"};
    return pattern;
}

// Headers with a dedicated field in response, everything else goes to other_headers
static bool is_known_header(std::string_view name)
{
    return http::header_equals(name, protocol::head_server) ||
        std::any_of(required_headers.begin(), required_headers.end(), [name](const char* required) {
            return http::header_equals(name, required);
        });
}

static void check_required(const http::response& raw)
{
    for(const char* name : required_headers)
    {
        if(!raw.check_header(name))
            throw error {error_kind::missing_required_field, name, fmt::format("missing header {}", name)};
    }
}

static std::string require(const http::response& raw, const char* name)
{
    auto value = raw.get_header(name);
    if(!value)
        throw error {error_kind::missing_required_field, name, fmt::format("missing header {}", name)};
    return *value;
}

static void check_empty(const std::string& value, const char* name)
{
    if(!value.empty())
        throw error {error_kind::invalid_field_value, name, fmt::format("header {} must be empty", name)};
}

static std::string check_not_empty(std::string&& value, const char* name)
{
    if(value.empty())
        throw error {error_kind::invalid_field_value, name, fmt::format("header {} must not be empty", name)};
    return std::move(value);
}

static uint64_t check_parsed_value(std::string_view value, const char* name)
{
    uint64_t parsed = 0;
    auto res = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if(value.empty() || res.ec != std::errc {} || res.ptr != value.data() + value.size())
        throw error {error_kind::invalid_field_value, name,
            fmt::format("header {} is not an unsigned number ('{}')", name, value)};
    return parsed;
}

static std::string check_regex(const std::string& value, const char* name, const std::regex& pattern)
{
    std::smatch match;
    if(!std::regex_search(value, match, pattern))
        throw error {error_kind::invalid_field_value, name,
            fmt::format("header {} does not match the expected format ('{}')", name, value)};
    return match[1].str();
}

response response::parse(const http::response& raw, const search_target& target)
{
    check_required(raw);
    check_empty(require(raw, protocol::head_ext), protocol::head_ext);

    response res;
    res.m_boot_id = check_parsed_value(require(raw, protocol::head_bootid), protocol::head_bootid);
    res.m_max_age = check_parsed_value(
        check_regex(require(raw, protocol::head_cache_control), protocol::head_cache_control, max_age_pattern()),
        protocol::head_cache_control);
    res.m_date = check_not_empty(require(raw, protocol::head_date), protocol::head_date);
    res.m_server = check_not_empty(require(raw, protocol::head_server), protocol::head_server);
    res.m_location = check_not_empty(require(raw, protocol::head_location), protocol::head_location);
    res.m_service_name = check_not_empty(require(raw, protocol::head_usn), protocol::head_usn);
    res.m_search_target = target;

    for(const auto& [name, value] : raw.get_headers())
    {
        if(!is_known_header(name))
            res.m_other_headers[name] = value;
    }

    return res;
}

json to_json(const response& res)
{
    json other_headers = json::object();
    for(const auto& [name, value] : res.other_headers())
        other_headers[name] = value;

    return json {
        {"max_age", res.max_age()},
        {"date", res.date()},
        {"server", res.server()},
        {"location", res.location()},
        {"search_target", res.target().to_string()},
        {"service_name", res.service_name()},
        {"boot_id", res.boot_id()},
        {"other_headers", other_headers}
    };
}

} // namespace ssdp
