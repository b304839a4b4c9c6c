// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <grab/core/chunk.hpp>
#include <grab/core/transfer_meta.hpp>
#include <grab/disk/error.hpp>
#include <filesystem>
#include <fstream>

using namespace grab::core;

namespace fs = std::filesystem;

TEST_CASE("TransferMeta::meta_path", "[metadata]") {
    CHECK(TransferMeta::meta_path("test.bin") == "test.bin.meta.json");
    CHECK(TransferMeta::meta_path("/path/with spaces/file.zip") == "/path/with spaces/file.zip.meta.json");
}

TEST_CASE("to_missed copies index and range", "[metadata]") {
    Chunk chunk;
    chunk.index = 4;
    chunk.range = ByteRange{4000, 4999};
    CHECK(to_missed(chunk) == MissedChunk{4, 4000, 4999});
}

TEST_CASE("TransferMeta save and load", "[metadata]") {
    const auto dir = fs::temp_directory_path() / "grab_meta_test";
    fs::remove_all(dir);
    const auto output = (dir / "file.iso").string();
    const auto meta_file = TransferMeta::meta_path(output);

    SECTION("Round trip with two missed chunks") {
        TransferMeta original;
        original.url = "https://example.com/file.iso";
        original.total_size = 10'000'000;
        original.downloaded_size = 8'000'000;
        original.missed_chunks = {{2, 2'000'000, 2'999'999}, {7, 7'000'000, 7'999'999}};

        // Parent directory is created on save
        REQUIRE_FALSE(original.save(meta_file));
        REQUIRE(TransferMeta::exists(output));

        auto loaded = TransferMeta::load(meta_file);
        REQUIRE(loaded.has_value());
        CHECK(loaded->url == original.url);
        CHECK(loaded->total_size == original.total_size);
        CHECK(loaded->downloaded_size == original.downloaded_size);
        CHECK(loaded->missed_chunks == original.missed_chunks);

        TransferMeta::remove(output);
        CHECK_FALSE(TransferMeta::exists(output));
    }

    SECTION("Null missed_chunks loads as empty") {
        fs::create_directories(dir);
        {
            std::ofstream f(meta_file);
            f << R"({"url":"http://x/y","missed_chunks":null,"total_size":5,"downloaded_size":5})";
        }
        auto loaded = TransferMeta::load(meta_file);
        REQUIRE(loaded.has_value());
        CHECK(loaded->missed_chunks.empty());
        CHECK(loaded->total_size == 5);
    }

    SECTION("Missing file") {
        auto loaded = TransferMeta::load(meta_file);
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error() == grab::disk::DiskErrc::file_not_found);
    }

    SECTION("Garbage content") {
        fs::create_directories(dir);
        {
            std::ofstream f(meta_file);
            f << "this is not json";
        }
        auto loaded = TransferMeta::load(meta_file);
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error() == DownloadErrc::metadata_error);
    }

    SECTION("Missing required key") {
        fs::create_directories(dir);
        {
            std::ofstream f(meta_file);
            f << R"({"url":"http://x/y"})";
        }
        auto loaded = TransferMeta::load(meta_file);
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error() == DownloadErrc::metadata_error);
    }

    SECTION("Removing a missing side file is harmless") {
        CHECK_NOTHROW(TransferMeta::remove(output));
    }

    fs::remove_all(dir);
}
