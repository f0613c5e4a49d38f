#include <gtest/gtest.h>

#include "FakeTransport.hpp"
#include "ssdp/error.hpp"
#include "ssdp/search.hpp"

using namespace std::chrono_literals;
using testing_support::FakeTransport;
using testing_support::MakeResponse;

TEST(Search, MulticastGoesToDiscoveryGroup) {
    FakeTransport transport;
    transport.batches.push_back({MakeResponse("A"), MakeResponse("B")});

    ssdp::options opts;
    opts.max_wait_time = 3;
    opts.network_interface = "eth1";
    const ssdp::search_result result = ssdp::search_once(opts, transport);

    ASSERT_EQ(transport.destinations.size(), 1u);
    EXPECT_EQ(transport.destinations[0].ip, "239.255.255.250");
    EXPECT_EQ(transport.destinations[0].port, 1900);
    EXPECT_EQ(transport.sentOptions[0].timeout, 3s);
    EXPECT_EQ(transport.sentOptions[0].network_interface, std::optional<std::string>{"eth1"});
    EXPECT_EQ(transport.sent[0].get_method(), "M-SEARCH");

    EXPECT_EQ(result.responses.size(), 2u);
    EXPECT_TRUE(result.failures.empty());
}

TEST(Search, NoAnswersIsNotAnError) {
    FakeTransport transport;
    const ssdp::search_result result = ssdp::search_once(ssdp::options{}, transport);
    EXPECT_TRUE(result.responses.empty());
    EXPECT_TRUE(result.failures.empty());
}

TEST(Search, UnicastGoesToDevice) {
    FakeTransport transport;
    transport.batches.push_back({MakeResponse("A")});

    const ssdp::options opts = ssdp::options::for_version(ssdp::spec_version::v11);
    const ssdp::search_result result =
        ssdp::search_once_to_device(opts, httpu::endpoint{"192.168.1.20", 1900}, transport);

    ASSERT_EQ(transport.destinations.size(), 1u);
    EXPECT_EQ(transport.destinations[0].ip, "192.168.1.20");
    EXPECT_FALSE(transport.sent[0].check_header("MX"));
    EXPECT_EQ(result.responses.size(), 1u);
}

// Unicast search only exists since 1.1, nothing is sent for 1.0.
TEST(Search, UnicastRejectedFor10) {
    FakeTransport transport;
    try {
        ssdp::search_once_to_device(ssdp::options{}, httpu::endpoint{"192.168.1.20", 1900}, transport);
        FAIL() << "unicast search accepted for 1.0";
    } catch (const ssdp::error& e) {
        EXPECT_EQ(e.kind(), ssdp::error_kind::unsupported);
    }
    EXPECT_EQ(transport.Calls(), 0u);
}

TEST(Search, ValidationHappensBeforeSending) {
    FakeTransport transport;
    EXPECT_THROW(ssdp::search_once(ssdp::options::for_version(ssdp::spec_version::v20), transport), ssdp::error);
    EXPECT_EQ(transport.Calls(), 0u);
}

TEST(Search, TransportErrorsPropagate) {
    FakeTransport transport;
    transport.failNext = true;
    try {
        ssdp::search_once(ssdp::options{}, transport);
        FAIL() << "transport failure swallowed";
    } catch (const ssdp::error& e) {
        EXPECT_EQ(e.kind(), ssdp::error_kind::transport);
    }
}

TEST(Search, CachedSearchEntryPoint) {
    auto transport = std::make_shared<FakeTransport>();
    transport->batches.push_back({MakeResponse("A"), MakeResponse("B")});

    ssdp::response_cache cache = ssdp::search(ssdp::options{}, transport, 30s);
    EXPECT_EQ(cache.minimum_refresh(), 30s);
    EXPECT_EQ(cache.responses().size(), 2u);
    EXPECT_FALSE(cache.refresh());
    EXPECT_EQ(transport->Calls(), 1u);
}
