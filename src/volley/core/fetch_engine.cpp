// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/fetch_engine.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

namespace volley::core {

std::error_code FetchEngine::check_response(const Chunk& chunk,
                                            long status_code,
                                            std::uint64_t file_size) noexcept {
    if (status_code == 206) {
        return {};
    }

    // A server may answer a full-file range with the whole resource
    if (status_code == 200 && chunk.first == 0 && chunk.last + 1 == file_size) {
        return {};
    }

    return make_error_code(FetchErrc::invalid_range);
}

std::expected<std::vector<std::byte>, std::error_code>
FetchEngine::fetch(std::vector<Chunk>& chunks, std::uint64_t file_size) {
    // Chunks must partition exactly [0, file_size)
    std::uint64_t expected_first = 0;
    for (const auto& chunk : chunks) {
        if (chunk.first != expected_first || chunk.last < chunk.first || chunk.last >= file_size) {
            return std::unexpected(make_error_code(FetchErrc::invalid_range));
        }
        expected_first = chunk.last + 1;
    }
    if (expected_first != file_size) {
        return std::unexpected(make_error_code(FetchErrc::invalid_range));
    }

    std::vector<std::byte> buffer(file_size);
    std::span<std::byte> output(buffer);
    std::span<const Chunk> snapshot(chunks);

    auto started = std::chrono::steady_clock::now();

    std::vector<Request> requests;
    requests.reserve(chunks.size());

    for (auto& chunk : chunks) {
        chunk.downloaded = 0;

        Request request(chunk.url);
        request.range(chunk.first, chunk.last);

        // Each chunk writes only inside its own range, so the buffer needs no lock
        request.body_sink([this, &chunk, output, snapshot](std::span<const std::byte> data) {
            if (auto ec = deliver(chunk, output, data)) {
                spdlog::error("Chunk {} received more than its {} bytes", chunk.index, chunk.size());
                return ec;
            }
            if (callback_) {
                callback_(snapshot);
            }
            return std::error_code{};
        });

        requests.push_back(std::move(request));
    }

    if (auto ec = pool_.perform(requests)) {
        spdlog::error("Fetch failed: {}", ec.message());
        return std::unexpected(ec);
    }

    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];

        if (auto ec = check_response(chunk, requests[i].status_code(), file_size)) {
            spdlog::error("Chunk {} from {}: unexpected HTTP {} for range {}-{}",
                          chunk.index, chunk.source.host(), requests[i].status_code(),
                          chunk.first, chunk.last);
            return std::unexpected(ec);
        }

        if (!chunk.complete()) {
            spdlog::error("Chunk {} from {} ended after {} of {} bytes",
                          chunk.index, chunk.source.host(), chunk.downloaded, chunk.size());
            return std::unexpected(make_error_code(FetchErrc::connection_lost));
        }

        spdlog::debug("Chunk {} complete ({} bytes from {})", chunk.index, chunk.size(), chunk.source.host());
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("Fetched {} bytes in {} chunk(s) in {} ms", file_size, chunks.size(), elapsed.count());

    return buffer;
}

} // namespace volley::core
