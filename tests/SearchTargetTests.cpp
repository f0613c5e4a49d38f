#include <gtest/gtest.h>
#include <vector>

#include "ssdp/error.hpp"
#include "ssdp/search_target.hpp"

using ssdp::search_target;

// Every variant must survive encode followed by decode.
TEST(SearchTarget, DecodeInvertsEncode) {
    const std::vector<search_target> targets{
        search_target::all(),
        search_target::root_devices(),
        search_target::device("2fac1234-31f8-11b4-a222-08002b34c003"),
        search_target::device_type("MediaRenderer:1"),
        search_target::service_type("AVTransport:2"),
        search_target::domain_device_type("schemas-example-com", "Lamp:1"),
        search_target::domain_service_type("schemas-example-com", "Dimming:3"),
    };

    for (const auto& target : targets) {
        EXPECT_EQ(search_target::parse(target.to_string()), target) << target.to_string();
    }
}

TEST(SearchTarget, CanonicalEncoding) {
    EXPECT_EQ(search_target::all().to_string(), "ssdp:all");
    EXPECT_EQ(search_target::root_devices().to_string(), "upnp:rootdevice");
    EXPECT_EQ(search_target::device("abc").to_string(), "uuid:abc");
    EXPECT_EQ(search_target::device_type("MediaServer:1").to_string(),
              "urn:schemas-upnp-org:device:MediaServer:1");
    EXPECT_EQ(search_target::service_type("ContentDirectory:1").to_string(),
              "urn:schemas-upnp-org:service:ContentDirectory:1");
    EXPECT_EQ(search_target::domain_device_type("dial-multiscreen-org", "dial:1").to_string(),
              "urn:dial-multiscreen-org:device:dial:1");
    EXPECT_EQ(search_target::domain_service_type("dial-multiscreen-org", "dial:1").to_string(),
              "urn:dial-multiscreen-org:service:dial:1");
}

// Both the UDA spelling and the double colon variant map to All.
TEST(SearchTarget, DecodesBothAllSpellings) {
    EXPECT_EQ(search_target::parse("ssdp:all").get_kind(), search_target::kind::all);
    EXPECT_EQ(search_target::parse("ssdp::all").get_kind(), search_target::kind::all);
}

TEST(SearchTarget, DecodesDomainQualifiedForms) {
    const auto device = search_target::parse("urn:dial-multiscreen-org:device:dial:1");
    EXPECT_EQ(device.get_kind(), search_target::kind::domain_device_type);
    EXPECT_EQ(device.get_domain(), "dial-multiscreen-org");
    EXPECT_EQ(device.get_value(), "dial:1");

    const auto service = search_target::parse("urn:dial-multiscreen-org:service:dial:1");
    EXPECT_EQ(service.get_kind(), search_target::kind::domain_service_type);
    EXPECT_EQ(service.get_value(), "dial:1");
}

// The UPnP forum domain is folded into the plain type kinds.
TEST(SearchTarget, ForumDomainUsesPlainKinds) {
    EXPECT_EQ(search_target::domain_device_type("schemas-upnp-org", "Basic:1"),
              search_target::device_type("Basic:1"));
    EXPECT_EQ(search_target::domain_service_type("schemas-upnp-org", "Dimming:1"),
              search_target::service_type("Dimming:1"));
}

TEST(SearchTarget, RejectsUnknownValues) {
    const std::vector<std::string> invalid{
        "", "ssdp", "upnp:device", "uuid:", "urn:schemas-upnp-org:device:",
        "urn::device:Lamp:1", "urn:example-com:thing:Lamp:1", "urn:example-com:device:", "http://x"};

    for (const auto& value : invalid) {
        try {
            search_target::parse(value);
            ADD_FAILURE() << "accepted '" << value << "'";
        } catch (const ssdp::error& e) {
            EXPECT_EQ(e.kind(), ssdp::error_kind::invalid_field_value) << value;
            EXPECT_EQ(e.field(), "ST");
        }
    }
}

TEST(SearchTarget, DefaultIsRootDevices) {
    EXPECT_EQ(search_target{}, search_target::root_devices());
    EXPECT_NE(search_target::device("a"), search_target::device("b"));
}

// Payloads without an encoding that parses back are refused at construction.
TEST(SearchTarget, FactoriesRejectPayloadsThatCannotRoundTrip) {
    EXPECT_THROW(search_target::device(""), ssdp::error);
    EXPECT_THROW(search_target::device_type(""), ssdp::error);
    EXPECT_THROW(search_target::service_type(""), ssdp::error);
    EXPECT_THROW(search_target::domain_device_type("", "Lamp:1"), ssdp::error);
    EXPECT_THROW(search_target::domain_service_type("example-com", ""), ssdp::error);
    EXPECT_THROW(search_target::domain_device_type("example:com", "Lamp:1"), ssdp::error);
    EXPECT_THROW(search_target::domain_device_type("schemas-upnp-org", ""), ssdp::error);

    try {
        search_target::domain_service_type("", "Dimming:1");
        ADD_FAILURE() << "accepted an empty domain";
    } catch (const ssdp::error& e) {
        EXPECT_EQ(e.kind(), ssdp::error_kind::invalid_field_value);
        EXPECT_EQ(e.field(), "ST");
    }
}
