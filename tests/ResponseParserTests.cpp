#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "FakeTransport.hpp"
#include "ssdp/error.hpp"
#include "ssdp/response.hpp"
#include "ssdp/search.hpp"

using ssdp::error_kind;
using ssdp::response;
using ssdp::search_target;
using testing_support::RawResponse;
using testing_support::WithoutHeader;

namespace {

ssdp::error ParseFailure(const std::string& raw) {
    try {
        response::parse(http::response{raw}, search_target::root_devices());
    } catch (const ssdp::error& e) {
        return e;
    }
    ADD_FAILURE() << "response was accepted";
    return ssdp::error{error_kind::transport, {}, "accepted"};
}

}  // namespace

TEST(ResponseParser, ParsesAllFields) {
    const response res = response::parse(http::response{RawResponse("uuid:A::upnp:rootdevice")},
                                         search_target::root_devices());

    EXPECT_EQ(res.max_age(), 1800u);
    EXPECT_EQ(res.date(), "Mon, 19 Oct 2026 10:00:00 GMT");
    EXPECT_EQ(res.server(), "Linux/5.10 UPnP/1.1 TestDevice/1.0");
    EXPECT_EQ(res.location(), "http://192.168.1.20:49152/description.xml");
    EXPECT_EQ(res.service_name(), "uuid:A::upnp:rootdevice");
    EXPECT_EQ(res.boot_id(), 7u);
    EXPECT_TRUE(res.other_headers().empty());
}

TEST(ResponseParser, MaxAgeWithSpacesAndDirectives) {
    std::string raw = RawResponse("uuid:A");
    raw.replace(raw.find("max-age=1800"), 12, "no-cache=\"Ext\", max-age = 60");

    const response res = response::parse(http::response{raw}, search_target::root_devices());
    EXPECT_EQ(res.max_age(), 60u);
}

// Each required header is reported by name when it is missing.
TEST(ResponseParser, MissingRequiredHeaderIsNamed) {
    const std::vector<std::string> required{"BOOTID.UPNP.ORG", "CACHE-CONTROL", "DATE", "EXT",
                                            "LOCATION", "ST", "USN", "SERVER"};
    for (const auto& name : required) {
        const ssdp::error e = ParseFailure(WithoutHeader(RawResponse("uuid:A"), name));
        EXPECT_EQ(e.kind(), error_kind::missing_required_field) << name;
        EXPECT_EQ(e.field(), name);
    }
}

TEST(ResponseParser, ExtMustBeEmpty) {
    std::string raw = RawResponse("uuid:A");
    raw.replace(raw.find("EXT:"), 4, "EXT: yes");

    const ssdp::error e = ParseFailure(raw);
    EXPECT_EQ(e.kind(), error_kind::invalid_field_value);
    EXPECT_EQ(e.field(), "EXT");
}

TEST(ResponseParser, RejectsMalformedValues) {
    std::string raw = RawResponse("uuid:A");
    raw.replace(raw.find("BOOTID.UPNP.ORG: 7"), 18, "BOOTID.UPNP.ORG: seven");
    EXPECT_EQ(ParseFailure(raw).field(), "BOOTID.UPNP.ORG");

    raw = RawResponse("uuid:A");
    raw.replace(raw.find("max-age=1800"), 12, "no-store");
    EXPECT_EQ(ParseFailure(raw).field(), "CACHE-CONTROL");

    raw = RawResponse("");
    const ssdp::error e = ParseFailure(raw);
    EXPECT_EQ(e.kind(), error_kind::invalid_field_value);
    EXPECT_EQ(e.field(), "USN");
}

// Unknown headers are kept verbatim, the last duplicate wins.
TEST(ResponseParser, CollectsOtherHeaders) {
    const std::string raw = RawResponse("uuid:A", 1800,
                                        "CONFIGID.UPNP.ORG: 3\r\n"
                                        "X-Vendor: first\r\n"
                                        "X-Vendor: second\r\n");

    const response res = response::parse(http::response{raw}, search_target::root_devices());
    ASSERT_EQ(res.other_headers().size(), 2u);
    EXPECT_EQ(res.other_headers().at("CONFIGID.UPNP.ORG"), "3");
    EXPECT_EQ(res.other_headers().at("X-Vendor"), "second");
    EXPECT_EQ(res.other_headers().count("USN"), 0u);
    EXPECT_EQ(res.other_headers().count("SERVER"), 0u);
}

// The target comes from the request, not from the ST header of the answer.
TEST(ResponseParser, TargetIsTakenFromRequest) {
    const auto target = search_target::device_type("MediaRenderer:1");
    const response res = response::parse(http::response{RawResponse("uuid:A")}, target);
    EXPECT_EQ(res.target(), target);
}

TEST(ResponseParser, HeaderNamesIgnoreCase) {
    std::string raw = RawResponse("uuid:A");
    raw.replace(raw.find("CACHE-CONTROL"), 13, "Cache-Control");
    raw.replace(raw.find("BOOTID.UPNP.ORG"), 15, "bootid.upnp.org");

    const response res = response::parse(http::response{raw}, search_target::root_devices());
    EXPECT_EQ(res.max_age(), 1800u);
    EXPECT_EQ(res.boot_id(), 7u);
    EXPECT_TRUE(res.other_headers().empty());
}

TEST(ResponseParser, JsonRendering) {
    const response res = response::parse(http::response{RawResponse("uuid:A", 90, "X-Vendor: v\r\n")},
                                         search_target::all());
    const json doc = ssdp::to_json(res);
    EXPECT_EQ(doc.at("max_age").get<uint64_t>(), 90u);
    EXPECT_EQ(doc.at("service_name").get<std::string>(), "uuid:A");
    EXPECT_EQ(doc.at("search_target").get<std::string>(), "ssdp:all");
    EXPECT_EQ(doc.at("other_headers").at("X-Vendor").get<std::string>(), "v");
}

// One broken answer does not hide the valid ones of the same batch.
TEST(ResponseParser, BatchKeepsGoodResponses) {
    const std::vector<http::response> raw{
        http::response{RawResponse("uuid:A")},
        http::response{WithoutHeader(RawResponse("uuid:B"), "DATE")},
        http::response{RawResponse("uuid:C")},
    };

    const ssdp::search_result result = ssdp::parse_responses(raw, search_target::root_devices());
    ASSERT_EQ(result.responses.size(), 2u);
    EXPECT_EQ(result.responses[0].service_name(), "uuid:A");
    EXPECT_EQ(result.responses[1].service_name(), "uuid:C");
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].field(), "DATE");
}
