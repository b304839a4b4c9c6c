// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace grab::core {

// Inclusive byte range [start, end]
struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] std::uint64_t size() const noexcept { return end - start + 1; }

    // "start-end", the value after "bytes=" in a Range header
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const ByteRange&, const ByteRange&) = default;
};

// A contiguous byte range of the transfer, fetched and written independently
struct Chunk {
    std::size_t index{0};
    ByteRange range;
    std::vector<std::byte> data;  // Empty until fetched, released once written

    [[nodiscard]] bool has_data() const noexcept { return !data.empty(); }
};

// Number of chunks needed to cover total_size: ceil(total_size / chunk_size)
[[nodiscard]] std::size_t chunk_count(std::uint64_t total_size, std::uint64_t chunk_size) noexcept;

// Byte range of chunk `index`. The only place the boundary formula lives:
// start = index * chunk_size, end = min(start + chunk_size - 1, total_size - 1).
// Requires total_size > 0, chunk_size > 0 and index < chunk_count().
[[nodiscard]] ByteRange chunk_range(std::size_t index,
                                    std::uint64_t chunk_size,
                                    std::uint64_t total_size) noexcept;

// One chunk per index, ranges filled in, payloads empty
[[nodiscard]] std::vector<Chunk> make_chunks(std::uint64_t total_size, std::uint64_t chunk_size);

} // namespace grab::core
