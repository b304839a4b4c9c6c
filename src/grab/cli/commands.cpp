// Copyright (c) 2026 changcheng967. All rights reserved.

#include <grab/cli/commands.hpp>
#include <grab/cli/progress_bar.hpp>
#include <grab/core/chunk.hpp>
#include <grab/core/download_engine.hpp>
#include <grab/core/http_client.hpp>
#include <grab/core/prober.hpp>
#include <grab/core/url.hpp>
#include <grab/disk/paths.hpp>
#include <grab/version.hpp>
#include <charconv>
#include <iostream>
#include <limits>
#include <optional>

using namespace grab::core;

namespace grab::cli {

namespace {

// Positive decimal integer, nullopt otherwise
template<typename T>
std::optional<T> parse_number(std::string_view text) noexcept {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// Keeps the global curl state alive for one command
struct CurlGlobal {
    CurlGlobal() { CurlHttpClient::global_init(); }
    ~CurlGlobal() { CurlHttpClient::global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version" || (arg == "version" && args.url.empty())) {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-i" || arg == "--info") {
            args.info = true;
        } else if (arg == "--keep-meta") {
            args.keep_meta = true;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                args.error = "Missing directory after " + arg;
                return args;
            }
            args.output_dir = argv[++i];
        } else if (arg == "-c" || arg == "--chunk-size") {
            auto mb = i + 1 < argc ? parse_number<std::uint64_t>(argv[++i]) : std::nullopt;
            if (!mb || *mb == 0) {
                args.error = "Chunk size must be a positive number of megabytes";
                return args;
            }
            if (*mb > std::numeric_limits<std::uint64_t>::max() / MEGABYTE) {
                args.error = "Chunk size is too large";
                return args;
            }
            args.chunk_size_mb = *mb;
        } else if (arg == "-w" || arg == "--workers") {
            auto n = i + 1 < argc ? parse_number<std::uint32_t>(argv[++i]) : std::nullopt;
            if (!n) {
                args.error = "Worker count must be a number (0 = auto)";
                return args;
            }
            args.workers = *n;
        } else if (arg.starts_with("-")) {
            args.error = "Unknown option: " + arg;
            return args;
        } else if (args.url.empty()) {
            args.url = arg;
        } else {
            args.error = "Too many arguments: " + arg;
            return args;
        }
    }

    if (args.url.empty()) {
        args.error = "Requires at least 1 argument to be passed";
    } else if (!is_downloadable(args.url)) {
        args.error = "Invalid URL. Please provide a valid link.";
    }

    return args;
}

TransferConfig make_config(const CliArgs& args) {
    TransferConfig config;
    config.chunk_size = args.chunk_size_mb * MEGABYTE;
    config.output_dir = args.output_dir.empty() ? disk::downloads_dir() : args.output_dir;
    config.max_workers = args.workers;
    config.keep_metadata = args.keep_meta;
    config.verbose = args.verbose;
    config.quiet = args.quiet;
    return config;
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args) noexcept {
    try {
        CurlGlobal curl_global;

        auto config = make_config(args);
        if (args.output_dir.empty() && !args.quiet) {
            std::cout << "Output directory not provided, defaulting to " << config.output_dir << std::endl;
        }

        CurlHttpClient client;
        DownloadEngine engine(config, client);

        std::optional<ProgressBar> bar;
        std::optional<Spinner> spinner;

        // Per-chunk lines replace the bar in verbose mode
        if (!args.quiet && !args.verbose) {
            engine.callback([&](const TransferProgress& p) {
                if (p.total_bytes > 0) {
                    if (!bar) bar.emplace(p.total_bytes, "Downloading");
                    bar->update(p.downloaded_bytes, p.chunks_done + p.chunks_missed, p.chunks_total);
                } else {
                    if (!spinner) spinner.emplace();
                    spinner->update(p.downloaded_bytes);
                }
            });
        }

        auto report = engine.download(args.url);

        if (bar) bar->finish();
        if (spinner) spinner->finish();

        if (!report) {
            std::cerr << "Error: Download failed: " << report.error().message() << std::endl;
            return std::unexpected(report.error());
        }

        if (args.verbose && report->warning) {
            std::cout << report->warning.message() << std::endl;
        }

        if (!report->complete()) {
            std::cerr << "Warning: " << report->missed_chunks.size()
                      << " chunk(s) could not be downloaded, the file is incomplete:";
            for (const auto& missed : report->missed_chunks) {
                std::cerr << " " << missed.index << " (" << missed.start << "-" << missed.end << ")";
            }
            std::cerr << std::endl;
            if (report->meta_kept) {
                std::cerr << "Failure record saved to " << report->meta_path << std::endl;
            }
        }

        if (!args.quiet) {
            std::cout << "File downloaded successfully and saved in " << report->output_path << std::endl;
            std::cout << "Download took " << ProgressBar::format_time(
                             static_cast<std::uint64_t>(report->elapsed.count() / 1000))
                      << " (" << report->elapsed.count() << " ms)" << std::endl;
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(DownloadErrc::request_failed));
    }
}

CliResult info(const std::string& url) noexcept {
    try {
        CurlGlobal curl_global;

        CurlHttpClient client;
        CapabilityProber prober(client);
        auto probed = prober.probe(url);

        if (!probed) {
            std::cerr << "Error: " << probed.error().error.message();
            if (probed.error().status_code > 0) {
                std::cerr << " (status " << probed.error().status_code << ")";
            }
            std::cerr << std::endl;
            return std::unexpected(probed.error().error);
        }

        const auto& transfer = probed->transfer;
        std::cout << "URL: " << url << std::endl;
        std::cout << "File name: " << transfer.file_name() << std::endl;
        std::cout << "Content-Type: " << transfer.content_type << std::endl;
        std::cout << "Size: " << transfer.size << std::endl;
        std::cout << "Accepts-Ranges: " << (transfer.accepts_ranges ? "yes" : "no") << std::endl;
        if (transfer.chunkable()) {
            std::cout << "Chunks at " << DEFAULT_CHUNK_SIZE_MB << " MB: "
                      << chunk_count(transfer.size, DEFAULT_CHUNK_SIZE) << std::endl;
        } else {
            std::cout << "Mode: streaming" << std::endl;
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(DownloadErrc::request_failed));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "grab - fetch files over HTTP and HTTPS in parallel chunks\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>\n";
    std::cout << "  " << program_name << " version\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -c, --chunk-size <MB>   Chunk size in megabytes (default: " << DEFAULT_CHUNK_SIZE_MB << ")\n";
    std::cout << "  -o, --output <DIR>      Directory to save into (default: ~/Downloads)\n";
    std::cout << "  -w, --workers <N>       Concurrent chunk downloads (default: CPU count)\n";
    std::cout << "      --keep-meta         Keep <file>.meta.json when chunks are missed\n";
    std::cout << "  -i, --info              Show file info without downloading\n";
    std::cout << "  -V, --verbose           Report every chunk\n";
    std::cout << "  -q, --quiet             Only report errors\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -c 8 -o /tmp https://example.com/large.iso\n";
}

void print_version() noexcept {
    std::cout << "grab version " << grab::version.to_string() << std::endl;
}

} // namespace grab::cli
