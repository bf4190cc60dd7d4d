// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/cli/progress_bar.hpp>
#include <volley/core/chunk.hpp>
#include <chrono>
#include <span>
#include <string>

namespace volley::cli {

// "  42.17%\t3/12\t(8388608 bytes)\tmirror.example.com"
[[nodiscard]] std::string format_chunk_line(const core::Chunk& chunk, std::size_t chunk_count);

// One line per chunk, in index order
[[nodiscard]] std::string render_chunk_table(std::span<const core::Chunk> chunks);

// Console view over the fetch engine's progress snapshots
class StatusView {
public:
    explicit StatusView(bool per_chunk);

    // Progress callback target
    void update(std::span<const core::Chunk> chunks) noexcept;

    void finish(std::span<const core::Chunk> chunks) noexcept;
    void clear() noexcept;

private:
    bool per_chunk_;
    ProgressBar bar_;
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point last_table_;
};

} // namespace volley::cli
