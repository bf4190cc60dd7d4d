// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/cli/status_view.hpp>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace volley::cli {

namespace {

constexpr std::chrono::milliseconds TABLE_REFRESH_INTERVAL{100};

} // namespace

std::string format_chunk_line(const core::Chunk& chunk, std::size_t chunk_count) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << std::setw(7) << chunk.percent() << "%\t"
       << (chunk.index + 1) << '/' << chunk_count << '\t'
       << '(' << chunk.size() << " bytes)\t"
       << chunk.source.host();
    return ss.str();
}

std::string render_chunk_table(std::span<const core::Chunk> chunks) {
    std::string table;
    for (const auto& chunk : chunks) {
        table += format_chunk_line(chunk, chunks.size());
        table += '\n';
    }
    return table;
}

//=============================================================================
// StatusView
//=============================================================================

StatusView::StatusView(bool per_chunk)
    : per_chunk_(per_chunk)
    , bar_(0, "Downloading")
    , start_(std::chrono::steady_clock::now())
    , last_table_() {}

void StatusView::update(std::span<const core::Chunk> chunks) noexcept {
    auto progress = core::summarize(chunks);
    auto now = std::chrono::steady_clock::now();

    if (per_chunk_) {
        if (now - last_table_ < TABLE_REFRESH_INTERVAL) return;
        last_table_ = now;
        try {
            // Clear screen, cursor home
            std::cout << "\x1b[2J\x1b[H" << render_chunk_table(chunks) << std::flush;
        } catch (const std::exception&) {
            // Display only
        }
        return;
    }

    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_).count();
    std::uint64_t speed = elapsed_ms > 0
        ? static_cast<std::uint64_t>(static_cast<double>(progress.downloaded_bytes) * 1000.0 / elapsed_ms)
        : 0;

    bar_.total(progress.total_bytes);
    bar_.update(progress.downloaded_bytes, speed);
}

void StatusView::finish(std::span<const core::Chunk> chunks) noexcept {
    if (per_chunk_) {
        try {
            std::cout << "\x1b[2J\x1b[H" << render_chunk_table(chunks) << std::flush;
        } catch (const std::exception&) {
            // Display only
        }
        return;
    }
    bar_.total(core::summarize(chunks).total_bytes);
    bar_.finish();
}

void StatusView::clear() noexcept {
    if (!per_chunk_) {
        bar_.clear();
    }
}

} // namespace volley::cli
