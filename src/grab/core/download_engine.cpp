// Copyright (c) 2026 changcheng967. All rights reserved.

#include <grab/core/download_engine.hpp>
#include <grab/core/prober.hpp>
#include <grab/core/retry.hpp>
#include <grab/core/worker_pool.hpp>
#include <grab/disk/error.hpp>
#include <grab/disk/paths.hpp>
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <system_error>
#include <thread>

namespace grab::core {

//=============================================================================
// DownloadEngine
//=============================================================================

DownloadEngine::DownloadEngine(TransferConfig config, HttpClient& client)
    : config_(std::move(config))
    , client_(client) {}

std::size_t DownloadEngine::concurrency_for(std::size_t chunk_count) const noexcept {
    std::size_t workers = config_.max_workers;
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    return std::max<std::size_t>(1, std::min(chunk_count, workers));
}

std::expected<DownloadReport, std::error_code> DownloadEngine::download(const std::string& url) noexcept {
    const auto started = std::chrono::steady_clock::now();

    CapabilityProber prober(client_);
    auto probed = prober.probe(url);
    if (!probed) {
        if (probed.error().status_code > 0) {
            std::cerr << "Error: Server responded with: " << probed.error().status_code << std::endl;
        }
        std::cerr << "Error: Failed to get file info: " << probed.error().error.message() << std::endl;
        return std::unexpected(probed.error().error);
    }

    try {
        DownloadReport report;
        report.transfer = std::move(probed->transfer);
        report.transfer.chunk_size = config_.chunk_size;
        report.warning = probed->warning;
        report.output_path = disk::join_path(config_.output_dir, report.transfer.file_name());

        disk::FileWriter writer;
        auto open_ec = writer.open(report.output_path,
                                   report.transfer.chunkable() ? report.transfer.size : 0);
        if (open_ec) {
            std::cerr << "Error: Failed to create " << report.output_path << ": "
                      << open_ec.message() << std::endl;
            return std::unexpected(open_ec);
        }

        auto written = run(report.transfer, writer);
        if (!written) {
            writer.close();
            return std::unexpected(written.error());
        }

        if (auto ec = writer.flush()) {
            writer.close();
            return std::unexpected(ec);
        }
        writer.close();

        report.bytes_written = *written;
        report.missed_chunks = meta_.missed_chunks;

        // Failure record next to the output; diagnostic only, nothing resumes from it
        if (!meta_.missed_chunks.empty()) {
            auto meta_file = TransferMeta::meta_path(report.output_path);
            if (auto ec = meta_.save(meta_file)) {
                std::cerr << "Warning: Failed to save metadata to " << meta_file << ": "
                          << ec.message() << std::endl;
            } else {
                report.meta_path = meta_file;
                report.meta_kept = config_.keep_metadata;
                if (!config_.keep_metadata) {
                    TransferMeta::remove(report.output_path);
                }
            }
        }

        report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        return report;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(disk::DiskErrc::allocation_failed));
    }
}

std::expected<std::uint64_t, std::error_code>
DownloadEngine::run(const Transfer& transfer, disk::FileWriter& writer) noexcept {
    reset(transfer);

    // Unknown size and no range support both fall back to one stream
    if (!transfer.chunkable()) {
        return stream(transfer, writer);
    }

    if (transfer.chunk_size == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_range));
    }

    return download_chunks(transfer, writer);
}

void DownloadEngine::reset(const Transfer& transfer) noexcept {
    {
        std::lock_guard<std::mutex> lock(meta_mutex_);
        meta_.url = transfer.url;
        meta_.missed_chunks.clear();
        meta_.total_size = transfer.size;
        meta_.downloaded_size = 0;
        write_error_.clear();
    }
    aborted_.store(false, std::memory_order_release);
    bytes_written_.store(0, std::memory_order_relaxed);
    chunks_done_.store(0, std::memory_order_relaxed);
    chunks_missed_.store(0, std::memory_order_relaxed);
    chunks_total_ = 0;
    total_bytes_ = transfer.size;
    streaming_ = !transfer.chunkable();
}

std::expected<std::uint64_t, std::error_code>
DownloadEngine::stream(const Transfer& transfer, disk::FileWriter& writer) noexcept {
    if (!config_.quiet) {
        std::cout << "Chunking not possible, streaming the data instead" << std::endl;
    }

    auto result = with_retry(config_.retry,
        [&](std::uint32_t attempt) -> std::expected<std::uint64_t, std::error_code> {
            // Start over: a failed attempt may have left a partial body
            if (attempt > 1) {
                if (auto ec = writer.truncate(0)) {
                    return std::unexpected(ec);
                }
                bytes_written_.store(0, std::memory_order_relaxed);
            }

            std::uint64_t offset = 0;
            std::error_code write_ec;

            auto response = client_.get(transfer.url,
                [&](const std::byte* data, std::size_t size) {
                    if (auto ec = writer.write(offset, data, size)) {
                        write_ec = ec;
                        return false;
                    }
                    offset += size;
                    bytes_written_.store(offset, std::memory_order_relaxed);
                    notify();
                    return true;
                });

            if (write_ec) {
                return std::unexpected(write_ec);
            }
            if (!response) {
                return std::unexpected(response.error());
            }
            if (auto ec = status_error(response->status_code)) {
                return std::unexpected(ec);
            }
            if (offset == 0) {
                return std::unexpected(make_error_code(DownloadErrc::empty_body));
            }
            return offset;
        },
        [&](std::uint32_t attempt, const std::error_code& ec) {
            std::cerr << "Failed to write bytes " << bytes_written_.load(std::memory_order_relaxed)
                      << " (attempt " << attempt << "/" << config_.retry.max_attempts << "): "
                      << ec.message() << std::endl;
        });

    if (!result) {
        return std::unexpected(result.error());
    }

    std::lock_guard<std::mutex> lock(meta_mutex_);
    meta_.downloaded_size = *result;
    return *result;
}

std::expected<std::uint64_t, std::error_code>
DownloadEngine::download_chunks(const Transfer& transfer, disk::FileWriter& writer) noexcept {
    try {
        auto chunks = make_chunks(transfer.size, transfer.chunk_size);
        chunks_total_ = chunks.size();

        const auto workers = concurrency_for(chunks.size());
        if (!config_.quiet) {
            std::cout << "File size: " << transfer.size << std::endl;
            std::cout << "Splitting download into " << chunks.size() << " chunks ("
                      << workers << " workers)" << std::endl;
        }

        ChunkFetcher fetcher(client_, config_.retry);

        std::vector<Task> tasks;
        tasks.reserve(chunks.size());
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            tasks.push_back(Task{i + 1, [this, &chunks, &transfer, &writer, &fetcher, i] {
                fetch_chunk(chunks[i], transfer, writer, fetcher);
            }});
        }

        WorkerPool pool(std::move(tasks), workers);
        pool.run();

        std::lock_guard<std::mutex> lock(meta_mutex_);
        if (write_error_) {
            return std::unexpected(write_error_);
        }

        std::sort(meta_.missed_chunks.begin(), meta_.missed_chunks.end(),
                  [](const MissedChunk& a, const MissedChunk& b) { return a.index < b.index; });
        meta_.downloaded_size = bytes_written_.load(std::memory_order_acquire);
        return meta_.downloaded_size;
    } catch (const std::system_error& e) {
        return std::unexpected(e.code());
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(disk::DiskErrc::allocation_failed));
    }
}

void DownloadEngine::fetch_chunk(Chunk& chunk, const Transfer& transfer,
                                 disk::FileWriter& writer, ChunkFetcher& fetcher) noexcept {
    // A write already failed; the run is over
    if (aborted_.load(std::memory_order_acquire)) {
        return;
    }

    auto ec = fetcher.fetch(chunk, transfer.url, transfer.chunk_size, transfer.size);
    if (ec || !chunk.has_data()) {
        try {
            record_missed(chunk);
        } catch (const std::bad_alloc&) {
            record_write_error(make_error_code(disk::DiskErrc::allocation_failed));
            return;
        }
        std::fprintf(stderr, "Critical Error: Chunk %zu is still empty after %u attempts!\n",
                     chunk.index, fetcher.policy().max_attempts);
        notify();
        return;
    }

    const auto size = chunk.data.size();
    if (auto wec = ChunkFetcher::write(chunk, writer)) {
        std::fprintf(stderr, "Failed to write chunk %zu to file: %s\n",
                     chunk.index, wec.message().c_str());
        record_write_error(wec);
        return;
    }

    bytes_written_.fetch_add(size, std::memory_order_acq_rel);
    chunks_done_.fetch_add(1, std::memory_order_acq_rel);

    if (config_.verbose) {
        std::printf("Chunk %zu downloaded - bytes: %llu-%llu\n", chunk.index,
                    static_cast<unsigned long long>(chunk.range.start),
                    static_cast<unsigned long long>(chunk.range.end));
    }
    notify();
}

void DownloadEngine::record_missed(const Chunk& chunk) {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    meta_.missed_chunks.push_back(to_missed(chunk));
    chunks_missed_.fetch_add(1, std::memory_order_acq_rel);
}

void DownloadEngine::record_write_error(std::error_code ec) noexcept {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    if (!write_error_) {
        write_error_ = ec;
    }
    aborted_.store(true, std::memory_order_release);
}

void DownloadEngine::notify() noexcept {
    TransferProgress snap;
    snap.total_bytes = total_bytes_;
    snap.downloaded_bytes = bytes_written_.load(std::memory_order_relaxed);
    snap.chunks_total = chunks_total_;
    snap.chunks_done = chunks_done_.load(std::memory_order_relaxed);
    snap.chunks_missed = chunks_missed_.load(std::memory_order_relaxed);
    snap.streaming = streaming_;

    // Serialized: workers report concurrently
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (callback_) {
        try {
            callback_(snap);
        } catch (const std::exception& e) {
            std::fprintf(stderr, "Progress callback failed: %s\n", e.what());
        }
    }
}

} // namespace grab::core
