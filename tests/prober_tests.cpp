// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <grab/core/prober.hpp>
#include "fake_http_client.hpp"

using namespace grab::core;
using grab::test::FakeHttpClient;
using grab::test::make_response;

namespace {

const std::string URL = "https://example.com/file";

} // namespace

TEST_CASE("CapabilityProber - HEAD answers", "[prober]") {
    FakeHttpClient client;
    client.head_result = make_response(200, {
        {"content-length", "10000000"},
        {"content-type", "application/zip"},
        {"accept-ranges", "bytes"},
    });

    CapabilityProber prober(client);
    auto result = prober.probe(URL);

    REQUIRE(result.has_value());
    const auto& t = result->transfer;
    CHECK(t.url == URL);
    CHECK(t.size == 10'000'000);
    CHECK(t.ext == "zip");
    CHECK(t.content_type == "application/zip");
    CHECK(t.accepts_ranges);
    CHECK(t.chunkable());
    CHECK_FALSE(result->warning);
    CHECK(client.head_calls() == 1);
    CHECK(client.get_headers_calls() == 0);
}

TEST_CASE("CapabilityProber - falls back to GET", "[prober]") {
    FakeHttpClient client;
    client.get_headers_result = make_response(200, {
        {"content-length", "42"},
        {"accept-ranges", "bytes"},
    });

    SECTION("HEAD not allowed") {
        client.head_result = make_response(405);
    }

    SECTION("HEAD transport failure") {
        client.head_result = std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    CapabilityProber prober(client);
    auto result = prober.probe(URL);

    REQUIRE(result.has_value());
    CHECK(result->transfer.size == 42);
    CHECK(client.get_headers_calls() == 1);
}

TEST_CASE("CapabilityProber - request failures", "[prober]") {
    FakeHttpClient client;
    client.head_result = make_response(404);

    SECTION("Status from the GET is reported") {
        client.get_headers_result = make_response(404);
        auto result = CapabilityProber(client).probe(URL);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().status_code == 404);
        CHECK(result.error().error == DownloadErrc::not_found);
    }

    SECTION("Server error") {
        client.get_headers_result = make_response(503);
        auto result = CapabilityProber(client).probe(URL);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().status_code == 503);
        CHECK(result.error().error == DownloadErrc::server_error);
    }

    SECTION("Transport failure has no status") {
        client.get_headers_result = std::unexpected(make_error_code(DownloadErrc::network_error));
        auto result = CapabilityProber(client).probe(URL);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().status_code == 0);
        CHECK(result.error().error == DownloadErrc::network_error);
    }
}

TEST_CASE("CapabilityProber - file name", "[prober]") {
    FakeHttpClient client;

    SECTION("Content-Disposition without Content-Type") {
        client.head_result = make_response(200, {
            {"content-disposition", R"(attachment; filename="report.final.pdf")"},
        });
        auto result = CapabilityProber(client).probe(URL);
        REQUIRE(result.has_value());
        CHECK(result->transfer.name == "report.final");
        CHECK(result->transfer.ext == "pdf");
        CHECK(result->transfer.file_name() == "report.final.pdf");
    }

    SECTION("Directories in the filename are dropped") {
        client.head_result = make_response(200, {
            {"content-disposition", R"(attachment; filename="../../../tmp/evil.sh")"},
        });
        auto result = CapabilityProber(client).probe(URL);
        REQUIRE(result.has_value());
        CHECK(result->transfer.file_name() == "evil.sh");
    }

    SECTION("Absolute and Windows paths are dropped") {
        client.head_result = make_response(200, {
            {"content-disposition", "attachment; filename=/etc/passwd"},
        });
        auto result = CapabilityProber(client).probe(URL);
        REQUIRE(result.has_value());
        CHECK(result->transfer.file_name() == "passwd");

        client.head_result = make_response(200, {
            {"content-disposition", R"(attachment; filename="..\..\boot.ini")"},
        });
        result = CapabilityProber(client).probe(URL);
        REQUIRE(result.has_value());
        CHECK(result->transfer.file_name() == "boot.ini");
    }

    SECTION("Dot names fall back to the default") {
        for (const char* value : {R"(attachment; filename="..")", R"(attachment; filename="a/..")",
                                  R"(attachment; filename="dir/")", R"(attachment; filename="...")"}) {
            client.head_result = make_response(200, {{"content-disposition", value}});
            auto result = CapabilityProber(client).probe(URL);
            REQUIRE(result.has_value());
            CHECK(result->transfer.file_name() == "download");
        }
    }

    SECTION("Content-Type decides the extension") {
        client.head_result = make_response(200, {
            {"content-disposition", "attachment; filename=data.bin"},
            {"content-type", "application/json; charset=utf-8"},
        });
        auto result = CapabilityProber(client).probe(URL);
        REQUIRE(result.has_value());
        CHECK(result->transfer.file_name() == "data.json");
    }

    SECTION("Unknown Content-Type") {
        client.head_result = make_response(200, {{"content-type", "application/x-weird"}});
        auto result = CapabilityProber(client).probe(URL);
        REQUIRE(result.has_value());
        CHECK(result->transfer.file_name() == "download.bin");
    }

    SECTION("Nothing known") {
        auto result = CapabilityProber(client).probe(URL);
        REQUIRE(result.has_value());
        CHECK(result->transfer.file_name() == "download");
    }
}

TEST_CASE("CapabilityProber - size and ranges", "[prober]") {
    FakeHttpClient client;

    SECTION("Content-Length absent") {
        client.head_result = make_response(200, {{"accept-ranges", "bytes"}});
        auto result = CapabilityProber(client).probe(URL);
        REQUIRE(result.has_value());
        CHECK(result->transfer.size == 0);
        CHECK(result->transfer.accepts_ranges);
        CHECK_FALSE(result->transfer.chunkable());
    }

    SECTION("Content-Length not a number") {
        client.head_result = make_response(200, {{"content-length", "lots"}, {"accept-ranges", "bytes"}});
        auto result = CapabilityProber(client).probe(URL);
        REQUIRE(result.has_value());
        CHECK(result->transfer.size == 0);
    }

    SECTION("Accept-Ranges none") {
        client.head_result = make_response(200, {{"content-length", "100"}, {"accept-ranges", "none"}});
        auto result = CapabilityProber(client).probe(URL);
        REQUIRE(result.has_value());
        CHECK_FALSE(result->transfer.accepts_ranges);
        CHECK_FALSE(result->transfer.chunkable());
        CHECK(result->warning == DownloadErrc::range_not_supported);
    }

    SECTION("Accept-Ranges absent") {
        client.head_result = make_response(200, {{"content-length", "100"}});
        auto result = CapabilityProber(client).probe(URL);
        REQUIRE(result.has_value());
        CHECK_FALSE(result->transfer.accepts_ranges);
        CHECK(result->warning == DownloadErrc::range_not_supported);
    }
}

TEST_CASE("CapabilityProber::parse_content_disposition", "[prober]") {
    CHECK(CapabilityProber::parse_content_disposition(R"(attachment; filename="a b.zip")") == "a b.zip");
    CHECK(CapabilityProber::parse_content_disposition("attachment; filename=plain.txt") == "plain.txt");
    CHECK(CapabilityProber::parse_content_disposition(R"(attachment; FILENAME="upper.iso")") == "upper.iso");
    CHECK(CapabilityProber::parse_content_disposition(R"(attachment; filename="a/b/c.txt")") == "c.txt");
    CHECK(CapabilityProber::parse_content_disposition(R"(attachment; filename="..")").empty());
    CHECK(CapabilityProber::parse_content_disposition("inline").empty());
    CHECK(CapabilityProber::parse_content_disposition("").empty());
}

TEST_CASE("CapabilityProber::split_last_dot", "[prober]") {
    CHECK(CapabilityProber::split_last_dot("archive.tar.gz") == std::pair<std::string, std::string>{"archive.tar", "gz"});
    CHECK(CapabilityProber::split_last_dot("README") == std::pair<std::string, std::string>{"README", ""});
    CHECK(CapabilityProber::split_last_dot(".bashrc") == std::pair<std::string, std::string>{"", "bashrc"});
}
