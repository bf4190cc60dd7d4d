// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/disk/file_writer.hpp>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace volley::disk {

namespace {

std::error_code errno_to_error_code(int err) noexcept {
    switch (err) {
        case ENOENT:                   return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:                    return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:                   return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:                   return make_error_code(DiskErrc::invalid_path);
        case EBADF:                    return make_error_code(DiskErrc::handle_invalid);
        default:                       return make_error_code(DiskErrc::write_error);
    }
}

} // namespace

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_)) {
    other.fd_ = -1;
}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

std::error_code FileWriter::open(std::string_view path, std::uint64_t size) noexcept {
    if (is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    try {
        path_ = path;
    } catch (const std::exception&) {
        return make_error_code(DiskErrc::invalid_path);
    }

    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return errno_to_error_code(errno);
    }

    if (size > 0 && ::ftruncate(fd, static_cast<off_t>(size)) != 0) {
        auto ec = errno_to_error_code(errno);
        ::close(fd);
        return ec;
    }

    fd_ = fd;
    return {};
}

std::error_code FileWriter::write(std::uint64_t offset, std::span<const std::byte> data) noexcept {
    if (!is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    std::size_t written = 0;
    while (written < data.size()) {
        auto n = ::pwrite(fd_, data.data() + written, data.size() - written,
                          static_cast<off_t>(offset + written));
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno);
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (!is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fsync(fd_) != 0) {
        return errno_to_error_code(errno);
    }
    return {};
}

void FileWriter::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::error_code write_file(std::string_view path, std::span<const std::byte> data) noexcept {
    FileWriter writer;
    if (auto ec = writer.open(path, data.size())) {
        return ec;
    }

    auto ec = writer.write(0, data);
    if (!ec) {
        ec = writer.flush();
    }
    writer.close();

    // Never leave a partial file behind
    if (ec) {
        ::unlink(writer.path().c_str());
    }
    return ec;
}

} // namespace volley::disk
