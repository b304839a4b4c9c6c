// Copyright (c) 2026 changcheng967. All rights reserved.

#include <grab/core/chunk.hpp>
#include <algorithm>

namespace grab::core {

std::string ByteRange::to_string() const {
    return std::to_string(start) + "-" + std::to_string(end);
}

std::size_t chunk_count(std::uint64_t total_size, std::uint64_t chunk_size) noexcept {
    if (total_size == 0 || chunk_size == 0) return 0;
    return static_cast<std::size_t>(total_size / chunk_size + (total_size % chunk_size != 0));
}

ByteRange chunk_range(std::size_t index,
                      std::uint64_t chunk_size,
                      std::uint64_t total_size) noexcept {
    ByteRange range;
    range.start = static_cast<std::uint64_t>(index) * chunk_size;
    // Same as min(start + chunk_size - 1, total_size - 1) without wrapping
    range.end = range.start + std::min(chunk_size, total_size - range.start) - 1;
    return range;
}

std::vector<Chunk> make_chunks(std::uint64_t total_size, std::uint64_t chunk_size) {
    const auto count = chunk_count(total_size, chunk_size);

    std::vector<Chunk> chunks(count);
    for (std::size_t i = 0; i < count; ++i) {
        chunks[i].index = i;
        chunks[i].range = chunk_range(i, chunk_size, total_size);
    }
    return chunks;
}

} // namespace grab::core
