// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <grab/core/chunk.hpp>
#include <grab/core/chunk_fetcher.hpp>
#include <grab/core/config.hpp>
#include <grab/core/error.hpp>
#include <grab/core/http_client.hpp>
#include <grab/core/transfer.hpp>
#include <grab/core/transfer_meta.hpp>
#include <grab/disk/file_writer.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace grab::core {

// Progress snapshot handed to the callback
struct TransferProgress {
    std::uint64_t total_bytes{0};         // 0 when unknown
    std::uint64_t downloaded_bytes{0};
    std::size_t chunks_total{0};          // 0 when streaming
    std::size_t chunks_done{0};
    std::size_t chunks_missed{0};
    bool streaming{false};
};

using ProgressCallback = std::function<void(const TransferProgress&)>;

// Outcome of a whole download
struct DownloadReport {
    Transfer transfer;
    std::string output_path;
    std::uint64_t bytes_written{0};
    std::vector<MissedChunk> missed_chunks;
    std::error_code warning;              // range_not_supported from the probe
    std::string meta_path;                // Empty unless metadata was written
    bool meta_kept{false};
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] bool complete() const noexcept { return missed_chunks.empty(); }
};

// Transfer orchestrator: picks streaming or chunked mode, drives the worker
// pool and collects missed chunks.
class DownloadEngine {
public:
    DownloadEngine(TransferConfig config, HttpClient& client);

    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;

    // Probe, create <output_dir>/<file>, run, and record missed chunks
    [[nodiscard]] std::expected<DownloadReport, std::error_code> download(const std::string& url) noexcept;

    // Fetch an already probed transfer into an open file.
    // Returns bytes written; missed chunks are in meta() afterwards.
    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    run(const Transfer& transfer, disk::FileWriter& writer) noexcept;

    // Failure record of the last run
    [[nodiscard]] const TransferMeta& meta() const noexcept { return meta_; }

    [[nodiscard]] const TransferConfig& config() const noexcept { return config_; }

    // Worker count for a chunked transfer: min(chunks, workers)
    [[nodiscard]] std::size_t concurrency_for(std::size_t chunk_count) const noexcept;

    // Set progress callback (thread-safe)
    void callback(ProgressCallback cb) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(cb);
    }

private:
    // Whole body in one sequential GET, retried from scratch
    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    stream(const Transfer& transfer, disk::FileWriter& writer) noexcept;

    // One pool task per chunk
    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    download_chunks(const Transfer& transfer, disk::FileWriter& writer) noexcept;

    // Body of a pool task
    void fetch_chunk(Chunk& chunk, const Transfer& transfer,
                     disk::FileWriter& writer, ChunkFetcher& fetcher) noexcept;

    // Guarded append to meta_.missed_chunks
    void record_missed(const Chunk& chunk);

    // First positioned-write failure wins and stops the remaining chunks
    void record_write_error(std::error_code ec) noexcept;

    void reset(const Transfer& transfer) noexcept;
    void notify() noexcept;

    TransferConfig config_;
    HttpClient& client_;

    TransferMeta meta_;
    std::mutex meta_mutex_;               // Protects meta_.missed_chunks and write_error_
    std::error_code write_error_;
    std::atomic<bool> aborted_{false};

    std::atomic<std::uint64_t> bytes_written_{0};
    std::atomic<std::size_t> chunks_done_{0};
    std::atomic<std::size_t> chunks_missed_{0};
    std::size_t chunks_total_{0};
    std::uint64_t total_bytes_{0};
    bool streaming_{false};

    ProgressCallback callback_;
    std::mutex callback_mutex_;           // Protects callback_ access
};

} // namespace grab::core
