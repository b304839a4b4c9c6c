// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <grab/core/mime_types.hpp>

using namespace grab::core;

TEST_CASE("file_extension - known types", "[mime]") {
    CHECK(file_extension("application/pdf") == "pdf");
    CHECK(file_extension("image/png") == "png");
    CHECK(file_extension("application/zip") == "zip");
    CHECK(file_extension("video/mp4") == "mp4");
    CHECK(file_extension("text/plain") == "txt");
}

TEST_CASE("file_extension - parameters and case", "[mime]") {
    CHECK(file_extension("text/html; charset=utf-8") == "html");
    CHECK(file_extension("Application/JSON") == "json");
    CHECK(file_extension("  image/jpeg ;q=1") == "jpg");
}

TEST_CASE("file_extension - unknown types", "[mime]") {
    CHECK(file_extension("application/x-unknown-thing") == "bin");
    CHECK(file_extension("application/octet-stream") == "bin");
    CHECK(file_extension("") == "bin");
}
