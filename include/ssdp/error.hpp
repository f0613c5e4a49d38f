#ifndef SSDP_ERROR_HPP
#define SSDP_ERROR_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace ssdp
{

enum class error_kind
{
    invalid_field_value,
    missing_required_field,
    unsupported,
    transport
};

std::string_view to_string(error_kind kind);

/// Single exception type thrown by the client. field() names the header or
/// option that caused the failure, or is empty when none applies.
class error : public std::runtime_error
{
public:

    error(error_kind kind, std::string field, const std::string& what)
        : std::runtime_error {what}, m_kind {kind}, m_field {std::move(field)}
    {}

    error_kind kind() const
    {
        return m_kind;
    }

    const std::string& field() const
    {
        return m_field;
    }

private:

    error_kind m_kind;
    std::string m_field;

};

} // namespace ssdp

#endif
