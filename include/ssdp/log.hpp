#ifndef SSDP_LOG_HPP
#define SSDP_LOG_HPP

#include <string_view>
#include <optional>
#include <utility>

#include "fmt/format.h"

namespace ssdp
{

namespace log
{

enum class level
{
    debug,
    verbose,
    info,
    error
};

level get_level();

void set_level(level lvl);

std::optional<level> parse_level(std::string_view text);

/// Writes one finished line to stderr, prefixed with the level.
void write_line(level lvl, std::string_view msg);

template<typename... Args>
inline void write(level lvl, fmt::format_string<Args...> format, Args&&... args)
{
    if(lvl < get_level())
        return;
    write_line(lvl, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
inline void debug(fmt::format_string<Args...> format, Args&&... args)
{
    write(level::debug, format, std::forward<Args>(args)...);
}

template<typename... Args>
inline void verbose(fmt::format_string<Args...> format, Args&&... args)
{
    write(level::verbose, format, std::forward<Args>(args)...);
}

template<typename... Args>
inline void info(fmt::format_string<Args...> format, Args&&... args)
{
    write(level::info, format, std::forward<Args>(args)...);
}

template<typename... Args>
inline void error(fmt::format_string<Args...> format, Args&&... args)
{
    write(level::error, format, std::forward<Args>(args)...);
}

} // namespace log

} // namespace ssdp

#endif
