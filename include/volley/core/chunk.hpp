// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/error.hpp>
#include <volley/core/source.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace volley::core {

// A contiguous byte range of the target resource, fetched from one source
struct Chunk {
    std::uint32_t index{0};      // Reassembly order and round-robin position
    Source source;               // Assigned source
    std::string url;             // Resource URL on that source
    std::uint64_t first{0};      // Inclusive
    std::uint64_t last{0};       // Inclusive
    std::uint64_t downloaded{0}; // Bytes received so far, written only by this chunk's transfer

    [[nodiscard]] std::uint64_t size() const noexcept { return last - first + 1; }
    [[nodiscard]] std::uint64_t remaining() const noexcept {
        return downloaded >= size() ? 0 : size() - downloaded;
    }
    [[nodiscard]] bool complete() const noexcept { return downloaded == size(); }
    [[nodiscard]] double percent() const noexcept {
        return static_cast<double>(downloaded) * 100.0 / static_cast<double>(size());
    }
};

// Aggregate view of a progress snapshot
struct FetchProgress {
    std::uint64_t total_bytes{0};
    std::uint64_t downloaded_bytes{0};
    std::uint32_t total_chunks{0};
    std::uint32_t completed_chunks{0};
    double percent{0.0};
};

// Split [0, file_size) into chunk_size pieces (the last one may be shorter)
// and assign chunk i to sources[i % sources.size()].
// Fails with invalid_config when chunk_size is zero or larger than file_size,
// and with no_sources when there is no source to assign.
// The chunk count is not checked against any connection limit.
[[nodiscard]] std::expected<std::vector<Chunk>, std::error_code>
plan_chunks(std::string_view filename,
            std::uint64_t file_size,
            std::uint64_t chunk_size,
            std::span<const Source> sources);

// Copy freshly received bytes to buffer[first + downloaded] and advance the
// chunk. Bytes past the chunk's last offset are rejected with invalid_range
// and nothing is written.
[[nodiscard]] std::error_code deliver(Chunk& chunk,
                                      std::span<std::byte> buffer,
                                      std::span<const std::byte> data) noexcept;

[[nodiscard]] FetchProgress summarize(std::span<const Chunk> chunks) noexcept;

} // namespace volley::core
