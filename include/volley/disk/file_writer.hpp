// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace volley::disk {

// Positional writer over a POSIX file descriptor
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Create or truncate the file, pre-sized to `size` bytes when non-zero
    [[nodiscard]] std::error_code open(std::string_view path, std::uint64_t size = 0) noexcept;

    // Write all of `data` at `offset`
    [[nodiscard]] std::error_code write(std::uint64_t offset, std::span<const std::byte> data) noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    int fd_{-1};
    std::string path_;
};

// Write a whole buffer to a fresh file at `path`
[[nodiscard]] std::error_code write_file(std::string_view path, std::span<const std::byte> data) noexcept;

} // namespace volley::disk
