#ifndef HTTP_HEADER_HPP
#define HTTP_HEADER_HPP

#include <string_view>

namespace http
{

/// Case-insensitive comparison of header names.
bool header_equals(std::string_view lhs, std::string_view rhs);

} // namespace http

#endif
