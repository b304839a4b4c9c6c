// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <grab/core/config.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace grab::cli {

// CLI result: exit code, or the error that ended the command
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string url;
    std::string output_dir;               // Empty = download directory heuristic
    std::uint64_t chunk_size_mb{core::DEFAULT_CHUNK_SIZE_MB};
    std::uint32_t workers{0};
    bool keep_meta{false};
    bool info{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;                    // Set when the arguments are unusable
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Resolve parsed arguments into the engine configuration
[[nodiscard]] core::TransferConfig make_config(const CliArgs& args);

// Download a single URL
[[nodiscard]] CliResult download(const CliArgs& args) noexcept;

// Probe a URL and print what the download would do
[[nodiscard]] CliResult info(const std::string& url) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace grab::cli
