// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <grab/cli/commands.hpp>
#include <grab/cli/progress_bar.hpp>
#include <initializer_list>
#include <string>
#include <vector>

using namespace grab::cli;

namespace {

CliArgs parse(std::initializer_list<std::string> list) {
    std::vector<std::string> storage{"grab"};
    storage.insert(storage.end(), list.begin(), list.end());

    std::vector<char*> argv;
    for (auto& s : storage) argv.push_back(s.data());
    argv.push_back(nullptr);

    return parse_args(static_cast<int>(storage.size()), argv.data());
}

} // namespace

TEST_CASE("parse_args - defaults", "[cli]") {
    auto args = parse({"https://example.com/file.zip"});
    CHECK(args.error.empty());
    CHECK(args.url == "https://example.com/file.zip");
    CHECK(args.chunk_size_mb == 1);
    CHECK(args.workers == 0);
    CHECK(args.output_dir.empty());
    CHECK_FALSE(args.keep_meta);
    CHECK_FALSE(args.info);
}

TEST_CASE("parse_args - options", "[cli]") {
    auto args = parse({"-c", "8", "-o", "/tmp/out", "-w", "3", "--keep-meta", "-V",
                       "http://example.com/a"});
    CHECK(args.error.empty());
    CHECK(args.chunk_size_mb == 8);
    CHECK(args.output_dir == "/tmp/out");
    CHECK(args.workers == 3);
    CHECK(args.keep_meta);
    CHECK(args.verbose);

    auto longform = parse({"--chunk-size", "2", "--output", "dir", "--info", "--quiet",
                           "http://example.com/a"});
    CHECK(longform.error.empty());
    CHECK(longform.chunk_size_mb == 2);
    CHECK(longform.output_dir == "dir");
    CHECK(longform.info);
    CHECK(longform.quiet);
}

TEST_CASE("parse_args - commands", "[cli]") {
    CHECK(parse({"version"}).version);
    CHECK(parse({"-v"}).version);
    CHECK(parse({"--help"}).help);
}

TEST_CASE("parse_args - errors", "[cli]") {
    CHECK_FALSE(parse({}).error.empty());
    CHECK_FALSE(parse({"ftp://example.com/file"}).error.empty());
    CHECK_FALSE(parse({"not-a-url"}).error.empty());
    CHECK_FALSE(parse({"-c", "0", "http://example.com/a"}).error.empty());
    CHECK_FALSE(parse({"-c", "big", "http://example.com/a"}).error.empty());
    CHECK_FALSE(parse({"-c", "17592186044416", "http://example.com/a"}).error.empty());
    CHECK_FALSE(parse({"-c", "18446744073709551615", "http://example.com/a"}).error.empty());
    CHECK_FALSE(parse({"-c"}).error.empty());
    CHECK_FALSE(parse({"-o"}).error.empty());
    CHECK_FALSE(parse({"--bogus", "http://example.com/a"}).error.empty());
    CHECK_FALSE(parse({"http://example.com/a", "http://example.com/b"}).error.empty());
}

TEST_CASE("parse_args - largest chunk size", "[cli]") {
    auto args = parse({"-c", "17592186044415", "http://example.com/a"});
    REQUIRE(args.error.empty());
    auto config = make_config(args);
    CHECK(config.chunk_size / (1024 * 1024) == 17592186044415ull);
    CHECK(config.chunk_size % (1024 * 1024) == 0);
}

TEST_CASE("make_config", "[cli]") {
    auto args = parse({"-c", "4", "-o", "/data", "-w", "2", "--keep-meta", "http://example.com/a"});
    auto config = make_config(args);
    CHECK(config.chunk_size == 4ull * 1024 * 1024);
    CHECK(config.output_dir == "/data");
    CHECK(config.max_workers == 2);
    CHECK(config.keep_metadata);
    CHECK(config.retry.max_attempts == 3);

    auto fallback = make_config(parse({"http://example.com/a"}));
    CHECK_FALSE(fallback.output_dir.empty());
}

TEST_CASE("ProgressBar formatting", "[cli]") {
    CHECK(ProgressBar::format_bytes(512) == "512 B");
    CHECK(ProgressBar::format_bytes(2048) == "2 KB");
    CHECK(ProgressBar::format_bytes(1536 * 1024) == "1.5 MB");
    CHECK(ProgressBar::format_speed(1024) == "1 KB/s");
    CHECK(ProgressBar::format_time(42) == "42s");
    CHECK(ProgressBar::format_time(125) == "2m 5s");
    CHECK(ProgressBar::format_time(3725) == "1h 02m");

    ProgressBar bar(1000, "Downloading");
    auto line = bar.render(500, 3, 10);
    CHECK_THAT(line, Catch::Matchers::ContainsSubstring("Downloading: "));
    CHECK_THAT(line, Catch::Matchers::ContainsSubstring(" 50%"));
    CHECK_THAT(line, Catch::Matchers::ContainsSubstring("[3/10 chunks]"));
}
