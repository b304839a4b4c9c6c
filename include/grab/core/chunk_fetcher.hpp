// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <grab/core/chunk.hpp>
#include <grab/core/config.hpp>
#include <grab/core/http_client.hpp>
#include <grab/disk/file_writer.hpp>
#include <cstdint>
#include <string>
#include <system_error>

namespace grab::core {

// Fetches one chunk with a ranged GET and writes it at its offset
class ChunkFetcher {
public:
    ChunkFetcher(HttpClient& client, RetryPolicy policy) noexcept
        : client_(client), policy_(policy) {}

    // Set chunk.range from the shared boundary formula and fetch it, retrying
    // per the policy. On success chunk.data holds exactly range.size() bytes.
    // On exhaustion chunk.data is empty and the last error is returned.
    [[nodiscard]] std::error_code fetch(Chunk& chunk,
                                        const std::string& url,
                                        std::uint64_t chunk_size,
                                        std::uint64_t total_size) noexcept;

    // One attempt, no retry
    [[nodiscard]] std::error_code fetch_once(Chunk& chunk, const std::string& url) noexcept;

    // Positioned write of the payload at range.start; releases the payload
    [[nodiscard]] static std::error_code write(Chunk& chunk, disk::FileWriter& writer) noexcept;

    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }

private:
    HttpClient& client_;
    RetryPolicy policy_;
};

} // namespace grab::core
