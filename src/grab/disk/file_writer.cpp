// Copyright (c) 2026 changcheng967. All rights reserved.

#include <grab/disk/file_writer.hpp>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace grab::disk {

std::error_code errno_to_error_code(int err) noexcept {
    switch (err) {
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:
        case EFBIG:         return make_error_code(DiskErrc::disk_full);
        case ENOTDIR:
        case EISDIR:
        case ENAMETOOLONG:  return make_error_code(DiskErrc::invalid_path);
        case EEXIST:        return make_error_code(DiskErrc::file_exists);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        default:            return make_error_code(DiskErrc::write_error);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

std::error_code FileWriter::open(std::string_view path, std::uint64_t size) noexcept {
    if (is_open()) {
        return make_error_code(DiskErrc::file_exists);
    }

    if (path.empty()) {
        return make_error_code(DiskErrc::invalid_path);
    }

    path_ = path;

    int fd = ::open(path_.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return errno_to_error_code(errno);
    }

    // Pre-size so every chunk lands inside the file
    if (size > 0 && ::ftruncate(fd, static_cast<off_t>(size)) != 0) {
        auto ec = errno_to_error_code(errno);
        ::close(fd);
        return ec;
    }

    fd_.store(fd, std::memory_order_release);
    return {};
}

std::error_code FileWriter::write(std::uint64_t offset,
                                  const void* data,
                                  std::size_t size) noexcept {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* bytes = static_cast<const char*>(data);
    std::size_t written = 0;

    // pwrite may write less than asked
    while (written < size) {
        ssize_t n = ::pwrite(fd, bytes + written, size - written,
                             static_cast<off_t>(offset + written));
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno);
        }
        if (n == 0) {
            return make_error_code(DiskErrc::write_error);
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code FileWriter::truncate(std::uint64_t size) noexcept {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    if (::ftruncate(fd, static_cast<off_t>(size)) != 0) {
        return errno_to_error_code(errno);
    }
    return {};
}

std::error_code FileWriter::flush() noexcept {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    if (::fsync(fd) != 0) {
        return errno_to_error_code(errno);
    }
    return {};
}

void FileWriter::close() noexcept {
    // Exchange guards against double-close
    int fd = fd_.exchange(-1, std::memory_order_acq_rel);
    if (fd >= 0) {
        ::close(fd);
    }
}

} // namespace grab::disk
