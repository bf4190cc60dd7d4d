// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/chunk.hpp>
#include <volley/core/connection_pool.hpp>
#include <volley/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <span>
#include <vector>

namespace volley::core {

// Progress snapshot: every chunk with its current byte count.
// Called after each block of data arrives, on the thread running fetch().
using ProgressCallback = std::function<void(std::span<const Chunk>)>;

// Downloads planned chunks concurrently into one in-memory buffer
class FetchEngine {
public:
    explicit FetchEngine(ConnectionPool& pool) noexcept : pool_(pool) {}

    FetchEngine(const FetchEngine&) = delete;
    FetchEngine& operator=(const FetchEngine&) = delete;

    void callback(ProgressCallback cb) { callback_ = std::move(cb); }

    // Issue one range request per chunk and place every byte at its offset.
    // Completes once every chunk has received its whole range; the first
    // failing chunk fails the whole fetch and no partial buffer is returned.
    [[nodiscard]] std::expected<std::vector<std::byte>, std::error_code>
    fetch(std::vector<Chunk>& chunks, std::uint64_t file_size);

private:
    // Status check for a finished range response
    [[nodiscard]] static std::error_code check_response(const Chunk& chunk,
                                                        long status_code,
                                                        std::uint64_t file_size) noexcept;

    ConnectionPool& pool_;
    ProgressCallback callback_;
};

} // namespace volley::core
