#include <chrono>
#include <cstdlib>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <getopt.h>

#include "fmt/format.h"

#include "ssdp/error.hpp"
#include "ssdp/log.hpp"
#include "ssdp/options.hpp"
#include "ssdp/search.hpp"

struct cli_config
{
    ssdp::options opts;
    std::optional<httpu::endpoint> device;
    unsigned repeat = 0;
    std::chrono::seconds refresh_interval {SSDP_DEFAULT_MINIMUM_REFRESH};
    bool json_output = false;
};

static void usage(const char* prog)
{
    fmt::print(
        "Usage: {} [options]\n"
        "\n"
        "  -t, --target ST              search target (default upnp:rootdevice)\n"
        "  -v, --upnp-version 1.0|1.1|2.0  UPnP device architecture version (default 1.0)\n"
        "  -w, --wait SECONDS           MX value and receive timeout, 1..120 (default {})\n"
        "  -i, --interface NAME         network interface to send from\n"
        "  -p, --product NAME/VERSION   product token of the user agent (1.1+)\n"
        "  -n, --cp-name NAME           control point friendly name (2.0)\n"
        "  -P, --cp-port PORT           control point TCP port (2.0)\n"
        "  -u, --cp-uuid UUID           control point UUID (2.0)\n"
        "  -d, --device IP:PORT         unicast search to a single device (1.1+)\n"
        "  -r, --repeat COUNT           refresh the result cache COUNT times\n"
        "  -R, --refresh-interval SEC   minimum time between refreshes (default {})\n"
        "  -j, --json                   print results as JSON\n"
        "  -l, --log-level LEVEL        debug, verbose, info or error (default error)\n"
        "  -h, --help                   show this help\n",
        prog, SSDP_DEFAULT_MX, SSDP_DEFAULT_MINIMUM_REFRESH);
}

static unsigned long parse_number(const std::string& text, unsigned long max, const char* what)
{
    size_t pos = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(text, &pos);
    } catch(const std::logic_error&) {
        pos = 0;
    }
    if(pos == 0 || pos != text.size() || value > max)
        throw std::invalid_argument {fmt::format("invalid {}: '{}'", what, text)};
    return value;
}

static httpu::endpoint parse_endpoint(const std::string& text)
{
    size_t sep = text.rfind(':');
    if(sep == std::string::npos || sep == 0)
        throw std::invalid_argument {fmt::format("invalid device address: '{}'", text)};
    return httpu::endpoint {text.substr(0, sep),
        static_cast<uint16_t>(parse_number(text.substr(sep + 1), 65535, "device port"))};
}

static ssdp::control_point& control_point_of(ssdp::options& opts)
{
    if(!opts.cp)
        opts.cp.emplace();
    return *opts.cp;
}

static cli_config parse_args(int argc, char** argv)
{
    static const option long_options[] = {
        {"target", required_argument, nullptr, 't'},
        {"upnp-version", required_argument, nullptr, 'v'},
        {"wait", required_argument, nullptr, 'w'},
        {"interface", required_argument, nullptr, 'i'},
        {"product", required_argument, nullptr, 'p'},
        {"cp-name", required_argument, nullptr, 'n'},
        {"cp-port", required_argument, nullptr, 'P'},
        {"cp-uuid", required_argument, nullptr, 'u'},
        {"device", required_argument, nullptr, 'd'},
        {"repeat", required_argument, nullptr, 'r'},
        {"refresh-interval", required_argument, nullptr, 'R'},
        {"json", no_argument, nullptr, 'j'},
        {"log-level", required_argument, nullptr, 'l'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    cli_config config;
    int opt;
    while((opt = getopt_long(argc, argv, "t:v:w:i:p:n:P:u:d:r:R:jl:h", long_options, nullptr)) != -1)
    {
        const std::string arg = optarg ? optarg : "";
        switch(opt)
        {
            case 't':
                config.opts.target = ssdp::search_target::parse(arg);
                break;
            case 'v':
            {
                auto version = ssdp::parse_spec_version(arg);
                if(!version)
                    throw std::invalid_argument {fmt::format("unknown UPnP version: '{}'", arg)};
                config.opts.version = *version;
                break;
            }
            case 'w':
                // Range is checked by options::validate
                config.opts.max_wait_time = static_cast<uint8_t>(parse_number(arg, 255, "wait time"));
                break;
            case 'i':
                config.opts.network_interface = arg;
                break;
            case 'p':
                config.opts.product_and_version = arg;
                break;
            case 'n':
                control_point_of(config.opts).friendly_name = arg;
                break;
            case 'P':
                control_point_of(config.opts).port = static_cast<uint16_t>(parse_number(arg, 65535, "port"));
                break;
            case 'u':
                control_point_of(config.opts).uuid = arg;
                break;
            case 'd':
                config.device = parse_endpoint(arg);
                break;
            case 'r':
                config.repeat = static_cast<unsigned>(parse_number(arg, 1000, "repeat count"));
                break;
            case 'R':
                config.refresh_interval = std::chrono::seconds(
                    static_cast<std::chrono::seconds::rep>(parse_number(arg, 86400, "refresh interval")));
                break;
            case 'j':
                config.json_output = true;
                break;
            case 'l':
            {
                auto lvl = ssdp::log::parse_level(arg);
                if(!lvl)
                    throw std::invalid_argument {fmt::format("unknown log level: '{}'", arg)};
                ssdp::log::set_level(*lvl);
                break;
            }
            case 'h':
                usage(argv[0]);
                std::exit(EXIT_SUCCESS);
            default:
                usage(argv[0]);
                std::exit(EXIT_FAILURE);
        }
    }

    return config;
}

static void print_responses(const std::vector<ssdp::response>& responses, bool json_output)
{
    if(json_output)
    {
        json list = json::array();
        for(const auto& res : responses)
            list.push_back(ssdp::to_json(res));
        fmt::print("{}\n", list.dump(2));
        return;
    }

    fmt::print("Detected {} service(s) in your local network.\n-------------------------------\n", responses.size());
    for(const auto& res : responses)
    {
        fmt::print("{}\n", res.service_name());
        fmt::print("    location:  {}\n", res.location());
        fmt::print("    server:    {}\n", res.server());
        fmt::print("    max-age:   {}s, boot id {}\n", res.max_age(), res.boot_id());
        for(const auto& [name, value] : res.other_headers())
            fmt::print("    {}: {}\n", name, value);
    }
}

static void print_failures(const std::vector<ssdp::error>& failures)
{
    for(const auto& failure : failures)
        fmt::print(stderr, "Skipped response: {}\n", failure.what());
}

int main(int argc, char** argv)
{
    try {
        cli_config config = parse_args(argc, argv);

        if(config.device)
        {
            ssdp::search_result result = ssdp::search_once_to_device(config.opts, *config.device);
            print_responses(result.responses, config.json_output);
            print_failures(result.failures);
            return EXIT_SUCCESS;
        }

        if(config.repeat == 0)
        {
            ssdp::search_result result = ssdp::search_once(config.opts);
            print_responses(result.responses, config.json_output);
            print_failures(result.failures);
            return EXIT_SUCCESS;
        }

        ssdp::response_cache cache {config.opts, std::make_shared<httpu::udp_transport>(), config.refresh_interval};
        print_responses(cache.responses(), config.json_output);
        print_failures(cache.last_failures());
        for(unsigned i = 0; i < config.repeat; ++i)
        {
            std::this_thread::sleep_for(config.refresh_interval);
            cache.refresh();
            print_responses(cache.responses(), config.json_output);
            print_failures(cache.last_failures());
        }
    } catch(const ssdp::error& e) {
        fmt::print(stderr, "Search failed ({}): {}\n", ssdp::to_string(e.kind()), e.what());
        return EXIT_FAILURE;
    } catch(const std::exception& e) {
        fmt::print(stderr, "{}\n", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
