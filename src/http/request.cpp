#include "http/request.hpp"
#include "http/header.hpp"

#include <algorithm>

namespace http
{

request& request::set_header(const std::string& key, const std::string& value)
{
    auto it = find_header(key);
    if(it != m_headers.end())
        it->second = value;
    else
        m_headers.emplace_back(key, value);
    return *this;
}

request& request::set_header(const std::string& key, std::string&& value)
{
    auto it = find_header(key);
    if(it != m_headers.end())
        it->second = std::move(value);
    else
        m_headers.emplace_back(key, std::move(value));
    return *this;
}

std::string request::to_string() const
{
    std::string request;

    /* Begin with request line */
    ((((request += m_method) += " ") += m_resource) += " HTTP/1.1\r\n");

    /* Append all headers in the order they were set */
    for(const auto& it : m_headers)
        (((request += it.first) += ": ") += it.second) += "\r\n";

    /* HTTPU requests carry no body */
    request += "\r\n";

    return request;
}

bool request::check_header(std::string_view key) const
{
    return find_header(key) != m_headers.end();
}

std::optional<std::string> request::get_header(std::string_view key) const
{
    auto it = find_header(key);
    if(it == m_headers.end())
        return std::nullopt;
    return it->second;
}

std::vector<request::header>::iterator request::find_header(std::string_view key)
{
    return std::find_if(m_headers.begin(), m_headers.end(), [key](const header& h) {
        return header_equals(h.first, key);
    });
}

std::vector<request::header>::const_iterator request::find_header(std::string_view key) const
{
    return std::find_if(m_headers.begin(), m_headers.end(), [key](const header& h) {
        return header_equals(h.first, key);
    });
}

} // namespace http
