// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <grab/core/config.hpp>
#include <cstdint>
#include <string>

namespace grab::core {

// One download, as learned from the capability probe
struct Transfer {
    std::string url;
    std::string name{DEFAULT_FILENAME};   // File stem
    std::string ext;                      // Extension without the dot, may be empty
    std::string content_type;
    std::uint64_t size{0};                // 0 = unknown
    std::uint64_t chunk_size{DEFAULT_CHUNK_SIZE};
    bool accepts_ranges{true};

    // name.ext, or just name without an extension
    [[nodiscard]] std::string file_name() const;

    // Chunked fetching needs a known size and range support
    [[nodiscard]] bool chunkable() const noexcept { return size > 0 && accepts_ranges; }
};

} // namespace grab::core
