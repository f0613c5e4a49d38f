#include <http/response.hpp>
#include <http/header.hpp>

#include <algorithm>
#include <charconv>
#include <stdexcept>

namespace http
{

static std::string_view trim(std::string_view view)
{
    const auto first = view.find_first_not_of(" \t");
    if(first == std::string_view::npos)
        return {};
    const auto last = view.find_last_not_of(" \t");
    return view.substr(first, last - first + 1);
}

void response::parse(std::string_view raw)
{
    m_headers.clear();

    /* extract the status line */
    size_t endl = raw.find("\r\n");
    if(endl == std::string_view::npos)
        throw std::invalid_argument {"invalid_response"};
    parse_statusline(raw.substr(0, endl));

    /* Read and parse response headers until the empty line */
    std::string_view rest = raw.substr(endl + 2);
    while(!rest.empty())
    {
        endl = rest.find("\r\n");
        std::string_view headerline = rest.substr(0, endl);
        if(headerline.empty())
            break;

        size_t sep = headerline.find(':');
        if(sep == std::string_view::npos || sep == 0)
            throw std::invalid_argument {"invalid_header_line"};

        // Empty values are legal, EXT is sent as "EXT:"
        m_headers.emplace_back(std::string {trim(headerline.substr(0, sep))},
            std::string {trim(headerline.substr(sep + 1))});

        if(endl == std::string_view::npos)
            break;
        rest.remove_prefix(endl + 2);
    }
}

void response::parse_statusline(std::string_view statusline)
{
    size_t first = statusline.find(' ');
    if(first == std::string_view::npos)
        throw std::invalid_argument {"invalid_statusline"};

    std::string_view protocol = statusline.substr(0, first);
    if(protocol.substr(0, 5) != "HTTP/")
        throw std::invalid_argument {"invalid_statusline"};

    std::string_view rest = statusline.substr(first + 1);
    size_t second = rest.find(' ');
    std::string_view code = rest.substr(0, second);

    int parsed_code = 0;
    auto res = std::from_chars(code.data(), code.data() + code.size(), parsed_code);
    if(res.ec != std::errc {} || res.ptr != code.data() + code.size())
        throw std::invalid_argument {"invalid_statusline"};

    m_protocol = std::string {protocol};
    m_code = parsed_code;
    m_phrase = (second == std::string_view::npos) ? std::string {} : std::string {trim(rest.substr(second + 1))};
}

bool response::check_header(std::string_view key) const
{
    return get_header(key).has_value();
}

std::optional<std::string> response::get_header(std::string_view key) const
{
    auto it = std::find_if(m_headers.begin(), m_headers.end(), [key](const header& h) {
        return header_equals(h.first, key);
    });
    if(it == m_headers.end())
        return std::nullopt;
    return it->second;
}

} // namespace http
