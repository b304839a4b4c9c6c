// Copyright (c) 2026 changcheng967. All rights reserved.

#include <grab/core/chunk_fetcher.hpp>
#include <grab/core/error.hpp>
#include <grab/core/retry.hpp>
#include <grab/disk/error.hpp>
#include <cstdio>
#include <expected>

namespace grab::core {

std::error_code ChunkFetcher::fetch(Chunk& chunk,
                                    const std::string& url,
                                    std::uint64_t chunk_size,
                                    std::uint64_t total_size) noexcept {
    if (chunk_size == 0 || total_size == 0 || chunk.index >= chunk_count(total_size, chunk_size)) {
        return make_error_code(DownloadErrc::invalid_range);
    }

    chunk.range = chunk_range(chunk.index, chunk_size, total_size);

    auto result = with_retry(policy_,
        [&](std::uint32_t) -> std::expected<void, std::error_code> {
            auto ec = fetch_once(chunk, url);
            if (ec) return std::unexpected(ec);
            return {};
        },
        [&](std::uint32_t attempt, const std::error_code& ec) {
            std::fprintf(stderr, "Chunk %zu: attempt %u/%u failed: %s\n",
                         chunk.index, attempt, policy_.max_attempts, ec.message().c_str());
        });

    return result ? std::error_code{} : result.error();
}

std::error_code ChunkFetcher::fetch_once(Chunk& chunk, const std::string& url) noexcept {
    try {
        chunk.data.clear();

        const auto expected_size = chunk.range.size();
        std::vector<std::byte> buffer;
        buffer.reserve(static_cast<std::size_t>(expected_size));
        bool overflow = false;

        auto response = client_.get(url,
            [&buffer, &overflow, expected_size](const std::byte* data, std::size_t size) {
                // More than asked for: the server ignored the range
                if (buffer.size() + size > expected_size) {
                    overflow = true;
                    return false;
                }
                buffer.insert(buffer.end(), data, data + size);
                return true;
            },
            chunk.range);

        if (!response) {
            return response.error();
        }
        if (auto ec = status_error(response->status_code)) {
            return ec;
        }
        if (overflow || buffer.size() != expected_size) {
            return make_error_code(DownloadErrc::invalid_range);
        }

        chunk.data = std::move(buffer);
        return {};
    } catch (const std::bad_alloc&) {
        chunk.data.clear();
        return make_error_code(disk::DiskErrc::allocation_failed);
    }
}

std::error_code ChunkFetcher::write(Chunk& chunk, disk::FileWriter& writer) noexcept {
    if (!chunk.has_data()) {
        return make_error_code(disk::DiskErrc::handle_invalid);
    }

    auto ec = writer.write(chunk.range.start, chunk.data.data(), chunk.data.size());

    // Payload is not needed once it is on disk
    chunk.data.clear();
    chunk.data.shrink_to_fit();
    return ec;
}

} // namespace grab::core
