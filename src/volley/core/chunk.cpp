// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/chunk.hpp>
#include <spdlog/spdlog.h>
#include <cstring>

namespace volley::core {

std::expected<std::vector<Chunk>, std::error_code>
plan_chunks(std::string_view filename,
            std::uint64_t file_size,
            std::uint64_t chunk_size,
            std::span<const Source> sources) {
    if (chunk_size == 0 || chunk_size > file_size) {
        spdlog::error("Chunk size {} is not usable for a {} byte file", chunk_size, file_size);
        return std::unexpected(make_error_code(FetchErrc::invalid_config));
    }
    if (sources.empty()) {
        return std::unexpected(make_error_code(FetchErrc::no_sources));
    }

    const std::uint64_t count = (file_size + chunk_size - 1) / chunk_size;  // Round up

    std::vector<Chunk> chunks;
    chunks.reserve(count);

    for (std::uint64_t i = 0; i < count; ++i) {
        const auto& source = sources[i % sources.size()];
        const std::uint64_t first = i * chunk_size;
        const std::uint64_t size = i < count - 1 ? chunk_size : file_size - first;

        Chunk chunk;
        chunk.index = static_cast<std::uint32_t>(i);
        chunk.source = source;
        chunk.url = source.resource_url(filename);
        chunk.first = first;
        chunk.last = first + size - 1;
        chunks.push_back(std::move(chunk));
    }

    spdlog::debug("Planned {} chunk(s) of {} bytes over {} source(s)", count, chunk_size, sources.size());
    return chunks;
}

std::error_code deliver(Chunk& chunk,
                        std::span<std::byte> buffer,
                        std::span<const std::byte> data) noexcept {
    if (data.size() > chunk.remaining()) {
        return make_error_code(FetchErrc::invalid_range);
    }

    const std::uint64_t offset = chunk.first + chunk.downloaded;
    if (offset + data.size() > buffer.size()) {
        return make_error_code(FetchErrc::invalid_range);
    }

    if (!data.empty()) {
        std::memcpy(buffer.data() + offset, data.data(), data.size());
    }
    chunk.downloaded += data.size();
    return {};
}

FetchProgress summarize(std::span<const Chunk> chunks) noexcept {
    FetchProgress progress;
    progress.total_chunks = static_cast<std::uint32_t>(chunks.size());

    for (const auto& chunk : chunks) {
        progress.total_bytes += chunk.size();
        progress.downloaded_bytes += chunk.downloaded;
        if (chunk.complete()) ++progress.completed_chunks;
    }

    if (progress.total_bytes > 0) {
        progress.percent = static_cast<double>(progress.downloaded_bytes) * 100.0
                         / static_cast<double>(progress.total_bytes);
    }
    return progress;
}

} // namespace volley::core
