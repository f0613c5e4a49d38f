#ifndef HTTP_RESPONSE_HPP
#define HTTP_RESPONSE_HPP

#include <string>
#include <string_view>
#include <optional>
#include <utility>
#include <vector>

namespace http
{

/// Incoming HTTPU response, parsed from a single datagram.
class response
{
public:

    using header = std::pair<std::string, std::string>;

    response() = default;

    /// Throws std::invalid_argument if the datagram is not a HTTP response.
    explicit response(std::string_view raw)
    {
        parse(raw);
    }

    void parse(std::string_view raw);

    bool check_header(std::string_view key) const;

    /// Header lookup ignoring the case of the name.
    std::optional<std::string> get_header(std::string_view key) const;

    const std::vector<header>& get_headers() const
    {
        return m_headers;
    }

    int get_code() const
    {
        return m_code;
    }

    const std::string& get_phrase() const
    {
        return m_phrase;
    }

    const std::string& get_protocol() const
    {
        return m_protocol;
    }

private:

    void parse_statusline(std::string_view statusline);

    std::string m_protocol;             /// should be HTTP/1.1
    int m_code = 0;
    std::string m_phrase;

    std::vector<header> m_headers;      /// names as received, values trimmed

};

} // namespace http

#endif
