// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace grab::core {

struct Chunk;

// A chunk that failed on every retry attempt
struct MissedChunk {
    std::size_t index{0};
    std::uint64_t start{0};
    std::uint64_t end{0};

    friend bool operator==(const MissedChunk&, const MissedChunk&) = default;
};

[[nodiscard]] MissedChunk to_missed(const Chunk& chunk) noexcept;

// Failure record written next to the output as <output>.meta.json
struct TransferMeta {
    std::string url;
    std::vector<MissedChunk> missed_chunks;
    std::uint64_t total_size{0};
    std::uint64_t downloaded_size{0};

    // Side file path for a given output file
    [[nodiscard]] static std::string meta_path(std::string_view output_path);

    // Serialize to JSON at path
    [[nodiscard]] std::error_code save(std::string_view path) const noexcept;

    // Read back; any read or parse failure is an error, never an exception
    [[nodiscard]] static std::expected<TransferMeta, std::error_code>
    load(std::string_view path) noexcept;

    // Check if a side file exists for the given output
    [[nodiscard]] static bool exists(std::string_view output_path) noexcept;

    // Delete the side file for the given output (best effort)
    static void remove(std::string_view output_path) noexcept;
};

} // namespace grab::core
