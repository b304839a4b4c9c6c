// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <grab/core/chunk.hpp>
#include <grab/core/config.hpp>
#include <grab/core/transfer.hpp>
#include <limits>

using namespace grab::core;

TEST_CASE("chunk_count", "[chunk]") {
    CHECK(chunk_count(10'000'000, 1'000'000) == 10);
    CHECK(chunk_count(10'000'001, 1'000'000) == 11);
    CHECK(chunk_count(1, 1'000'000) == 1);
    CHECK(chunk_count(0, 1'000'000) == 0);
    CHECK(chunk_count(100, 0) == 0);
}

TEST_CASE("chunk_range boundaries", "[chunk]") {
    SECTION("Interior chunk") {
        auto r = chunk_range(2, 1000, 10'000);
        CHECK(r.start == 2000);
        CHECK(r.end == 2999);
        CHECK(r.size() == 1000);
    }

    SECTION("Short last chunk") {
        auto r = chunk_range(3, 1000, 3500);
        CHECK(r.start == 3000);
        CHECK(r.end == 3499);
        CHECK(r.size() == 500);
    }

    SECTION("Single byte file") {
        auto r = chunk_range(0, 1000, 1);
        CHECK(r == ByteRange{0, 0});
    }

    SECTION("Range header value") {
        CHECK(ByteRange{0, 999}.to_string() == "0-999");
    }
}

TEST_CASE("Huge chunk sizes do not wrap", "[chunk]") {
    constexpr auto max = std::numeric_limits<std::uint64_t>::max();
    const std::uint64_t huge = max - MEGABYTE + 1;

    CHECK(chunk_count(2'000'000, huge) == 1);
    CHECK(chunk_count(2'000'000, max) == 1);
    CHECK(chunk_count(max, max) == 1);
    CHECK(chunk_count(max, 2) == max / 2 + 1);

    auto chunks = make_chunks(2'000'000, huge);
    REQUIRE(chunks.size() == 1);
    CHECK(chunks[0].range == ByteRange{0, 1'999'999});

    // Last chunk of a file ending at the top of the range
    CHECK(chunk_range(1, max / 2 + 1, max) == ByteRange{max / 2 + 1, max - 1});
}

TEST_CASE("make_chunks - 10 MB in 1 MB chunks", "[chunk]") {
    auto chunks = make_chunks(10'000'000, 1'000'000);
    REQUIRE(chunks.size() == 10);

    for (std::size_t i = 0; i < chunks.size(); ++i) {
        CHECK(chunks[i].index == i);
        CHECK(chunks[i].range.start == i * 1'000'000);
        CHECK(chunks[i].range.end == i * 1'000'000 + 999'999);
        CHECK_FALSE(chunks[i].has_data());
    }
    CHECK(chunks.back().range.end == 9'999'999);
}

TEST_CASE("make_chunks tiles the file exactly", "[chunk]") {
    auto total = GENERATE(1ull, 2ull, 999ull, 1000ull, 1001ull, 4096ull, 1'048'577ull, 7'340'033ull);
    auto size = GENERATE(1ull, 7ull, 1000ull, 1'048'576ull);

    auto chunks = make_chunks(total, size);
    REQUIRE(chunks.size() == chunk_count(total, size));

    std::uint64_t next = 0;
    std::uint64_t covered = 0;
    for (const auto& chunk : chunks) {
        CHECK(chunk.range.start == next);
        CHECK(chunk.range.end >= chunk.range.start);
        CHECK(chunk.range.size() <= size);
        next = chunk.range.end + 1;
        covered += chunk.range.size();
    }
    CHECK(next == total);
    CHECK(covered == total);
}

TEST_CASE("Transfer file name and mode", "[chunk]") {
    Transfer t;
    CHECK(t.file_name() == "download");

    t.name = "report";
    t.ext = "pdf";
    CHECK(t.file_name() == "report.pdf");

    CHECK_FALSE(t.chunkable());
    t.size = 10;
    CHECK(t.chunkable());
    t.accepts_ranges = false;
    CHECK_FALSE(t.chunkable());
}
