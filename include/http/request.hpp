#ifndef HTTP_REQUEST_HPP
#define HTTP_REQUEST_HPP

#include <string>
#include <string_view>
#include <optional>
#include <utility>
#include <vector>

namespace http {

/// Outgoing HTTPU request. Headers keep their insertion order on the wire.
class request {

public:

    using header = std::pair<std::string, std::string>;

    request() = default;
    request(const request& other) = default;
    request(request&& other) noexcept = default;
    request& operator=(const request& other) = default;
    request& operator=(request&& other) noexcept = default;

    explicit request(std::string method, std::string resource = "*")
        : m_method {std::move(method)}, m_resource {std::move(resource)}
    {}

    /// Replaces a header with the same (case-insensitive) name or appends a new one.
    request& set_header(const std::string& key, const std::string& value);

    request& set_header(const std::string& key, std::string&& value);

    std::string to_string() const;

    bool check_header(std::string_view key) const;

    std::optional<std::string> get_header(std::string_view key) const;

    const std::vector<header>& get_headers() const { return m_headers; }

    const std::string& get_method() const { return m_method; }

    const std::string& get_resource() const { return m_resource; }

private:

    std::vector<header>::iterator find_header(std::string_view key);

    std::vector<header>::const_iterator find_header(std::string_view key) const;

    std::string m_method;                   /// request method, M-SEARCH for searches
    std::string m_resource = "*";           /// request target
    std::vector<header> m_headers;          /// names and values in wire order

};

} // namespace http

#endif
