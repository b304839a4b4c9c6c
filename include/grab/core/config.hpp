// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>

namespace grab::core {

constexpr std::uint64_t MEGABYTE = 1 << 20;
constexpr std::uint64_t DEFAULT_CHUNK_SIZE_MB = 1;
constexpr std::uint64_t DEFAULT_CHUNK_SIZE = DEFAULT_CHUNK_SIZE_MB * MEGABYTE;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 60;
constexpr std::uint32_t RETRY_COUNT = 3;
constexpr std::chrono::milliseconds RETRY_DELAY{2000};

constexpr std::size_t READ_BUFFER_SIZE = 256 * 1024;            // 256 KB

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

constexpr std::string_view DEFAULT_FILENAME = "download";
constexpr std::string_view FALLBACK_EXTENSION = "bin";
constexpr std::string_view META_SUFFIX = ".meta.json";

// Fixed-delay retry: no growth, no jitter
struct RetryPolicy {
    std::uint32_t max_attempts{RETRY_COUNT};
    std::chrono::milliseconds delay{RETRY_DELAY};
};

// Everything the engine needs from the command line
struct TransferConfig {
    std::uint64_t chunk_size{DEFAULT_CHUNK_SIZE};
    std::string output_dir;
    RetryPolicy retry{};
    std::uint32_t max_workers{0};         // 0 = one per hardware thread
    bool keep_metadata{false};            // Keep .meta.json after the run
    bool verbose{false};                  // Report every chunk
    bool quiet{false};                    // Only errors
};

} // namespace grab::core
