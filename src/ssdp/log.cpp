#include "ssdp/log.hpp"

#include <atomic>
#include <cstdio>

namespace ssdp
{

namespace log
{

static std::atomic<level> current_level {level::error};

static const char* level_name(level lvl)
{
    switch(lvl)
    {
        case level::debug:      return "DEBUG";
        case level::verbose:    return "VERBOSE";
        case level::info:       return "INFO";
        default:                return "ERROR";
    }
}

level get_level()
{
    return current_level.load();
}

void set_level(level lvl)
{
    current_level.store(lvl);
}

std::optional<level> parse_level(std::string_view text)
{
    if(text == "debug")
        return level::debug;
    else if(text == "verbose")
        return level::verbose;
    else if(text == "info")
        return level::info;
    else if(text == "error")
        return level::error;
    return std::nullopt;
}

void write_line(level lvl, std::string_view msg)
{
    if(lvl < get_level())
        return;
    fmt::print(stderr, "[{}] {}\n", level_name(lvl), msg);
}

} // namespace log

} // namespace ssdp
