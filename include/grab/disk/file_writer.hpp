// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <grab/disk/error.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace grab::disk {

// Output file shared by concurrent chunk writers.
// write() is a positioned write (pwrite): it takes an explicit offset and
// never moves a shared cursor, so writers of disjoint ranges need no lock.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Create or truncate the file; size > 0 pre-sizes it
    [[nodiscard]] std::error_code open(std::string_view path, std::uint64_t size = 0) noexcept;

    // Write all of data at offset (thread-safe for disjoint ranges)
    [[nodiscard]] std::error_code write(std::uint64_t offset,
                                        const void* data,
                                        std::size_t size) noexcept;

    // Set the file length
    [[nodiscard]] std::error_code truncate(std::uint64_t size) noexcept;

    // Flush to disk
    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_.load(std::memory_order_acquire) >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::atomic<int> fd_{-1};
    std::string path_;
};

// Map an errno value to a disk error
[[nodiscard]] std::error_code errno_to_error_code(int err) noexcept;

} // namespace grab::disk
