// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/connection_pool.hpp>
#include <volley/core/error.hpp>
#include <volley/core/source.hpp>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace volley::core {

// What one source says about the target resource
struct SourceMetadata {
    std::uint64_t content_length{0};
    bool has_content_length{false};
    bool accepts_ranges{false};
    HeaderMap headers;

    // Header value or empty when absent
    [[nodiscard]] std::string header(std::string_view name) const;
    [[nodiscard]] std::string etag() const { return header("etag"); }
    [[nodiscard]] std::string server() const { return header("server"); }

    // Build from a raw header set
    [[nodiscard]] static SourceMetadata from_headers(HeaderMap headers);
};

// Agreed size plus every source's metadata, in source order
struct ValidationReport {
    std::uint64_t file_size{0};
    std::vector<SourceMetadata> metadata;
};

// HEAD {path}{filename} on every source at once.
// Any transport failure or error status fails the whole call.
[[nodiscard]] std::expected<std::vector<SourceMetadata>, std::error_code>
fetch_source_metadata(ConnectionPool& pool,
                      std::span<const Source> sources,
                      std::string_view filename);

// The file size every source agrees on, or why they don't
[[nodiscard]] std::expected<std::uint64_t, std::error_code>
check_sources(std::span<const SourceMetadata> metadata) noexcept;

[[nodiscard]] bool is_valid_sources(std::span<const SourceMetadata> metadata) noexcept;

// fetch_source_metadata followed by check_sources
[[nodiscard]] std::expected<ValidationReport, std::error_code>
validate_sources(ConnectionPool& pool,
                 std::span<const Source> sources,
                 std::string_view filename);

} // namespace volley::core
