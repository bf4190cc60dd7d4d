// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/source_validator.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string_view>
#include <system_error>

namespace volley::core {

enum class IntegrityStatus : std::uint8_t {
    match,     // Tag size equals the file size
    mismatch,  // Tag size differs from the file size
    skipped    // No tag, or a tag this checker does not understand
};

[[nodiscard]] std::string_view to_string(IntegrityStatus status) noexcept;

// Size field of an nginx entity tag.
//
// nginx builds the tag as "<mtime hex>-<content length hex>" in quotes
// (prefixed with W/ once a filter weakens it). Returns the second
// dash-delimited field parsed as base 16, or nothing when the tag has no
// such field. The field is compared as a number, not as text: "x-01F4" and
// "x-1f4" both describe 500 bytes.
[[nodiscard]] std::optional<std::uint64_t> etag_content_length(std::string_view etag) noexcept;

// Only nginx tags carry a size we know how to read
[[nodiscard]] bool is_recognized_server(std::string_view server) noexcept;

// True when the persisted file's byte size equals the tag's size field.
// A tag without a size field never matches.
[[nodiscard]] std::expected<bool, std::error_code>
verify_etag(const std::filesystem::path& path, std::string_view etag) noexcept;

// Check a persisted file against one source's headers. Never fatal: a
// file that cannot be inspected is reported as a mismatch.
[[nodiscard]] IntegrityStatus check_integrity(const std::filesystem::path& path,
                                              const SourceMetadata& metadata) noexcept;

} // namespace volley::core
