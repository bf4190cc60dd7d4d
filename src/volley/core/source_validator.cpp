// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/source_validator.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace volley::core {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

//=============================================================================
// SourceMetadata
//=============================================================================

std::string SourceMetadata::header(std::string_view name) const {
    auto it = headers.find(std::string(name));
    return it != headers.end() ? it->second : std::string{};
}

SourceMetadata SourceMetadata::from_headers(HeaderMap headers) {
    SourceMetadata meta;
    meta.headers = std::move(headers);

    // Strict decimal, anything else counts as missing
    auto cl_it = meta.headers.find("content-length");
    if (cl_it != meta.headers.end() && !cl_it->second.empty()) {
        const auto& text = cl_it->second;
        std::uint64_t value = 0;
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc{} && end == text.data() + text.size()) {
            meta.content_length = value;
            meta.has_content_length = true;
        }
    }

    auto ar_it = meta.headers.find("accept-ranges");
    meta.accepts_ranges = ar_it != meta.headers.end() && iequals(ar_it->second, "bytes");

    return meta;
}

//=============================================================================
// Validation
//=============================================================================

std::expected<std::vector<SourceMetadata>, std::error_code>
fetch_source_metadata(ConnectionPool& pool,
                      std::span<const Source> sources,
                      std::string_view filename) {
    std::vector<Request> requests;
    requests.reserve(sources.size());
    for (const auto& source : sources) {
        requests.emplace_back(source.resource_url(filename));
        requests.back().head_only();
    }

    if (auto ec = pool.perform(requests)) {
        spdlog::error("Metadata request failed: {}", ec.message());
        return std::unexpected(ec);
    }

    std::vector<SourceMetadata> metadata;
    metadata.reserve(requests.size());
    for (std::size_t i = 0; i < requests.size(); ++i) {
        auto meta = SourceMetadata::from_headers(requests[i].headers());
        spdlog::debug("{}: content-length={} accept-ranges={} etag={} server={}",
                      sources[i].host(),
                      meta.has_content_length ? std::to_string(meta.content_length) : "none",
                      meta.accepts_ranges ? "bytes" : "none",
                      meta.etag().empty() ? "none" : meta.etag(),
                      meta.server().empty() ? "none" : meta.server());
        metadata.push_back(std::move(meta));
    }
    return metadata;
}

std::expected<std::uint64_t, std::error_code>
check_sources(std::span<const SourceMetadata> metadata) noexcept {
    if (metadata.empty()) {
        return std::unexpected(make_error_code(FetchErrc::no_sources));
    }

    for (const auto& meta : metadata) {
        if (!meta.accepts_ranges) {
            return std::unexpected(make_error_code(FetchErrc::ranges_unsupported));
        }
        if (!meta.has_content_length) {
            return std::unexpected(make_error_code(FetchErrc::missing_content_length));
        }
        if (meta.content_length != metadata.front().content_length) {
            return std::unexpected(make_error_code(FetchErrc::size_mismatch));
        }
    }

    return metadata.front().content_length;
}

bool is_valid_sources(std::span<const SourceMetadata> metadata) noexcept {
    return check_sources(metadata).has_value();
}

std::expected<ValidationReport, std::error_code>
validate_sources(ConnectionPool& pool,
                 std::span<const Source> sources,
                 std::string_view filename) {
    if (sources.empty()) {
        spdlog::error("No sources to validate");
        return std::unexpected(make_error_code(FetchErrc::no_sources));
    }

    auto metadata = fetch_source_metadata(pool, sources, filename);
    if (!metadata) {
        return std::unexpected(metadata.error());
    }

    auto size = check_sources(*metadata);
    if (!size) {
        spdlog::error("Invalid sources: {}", size.error().message());
        return std::unexpected(size.error());
    }

    return ValidationReport{*size, std::move(*metadata)};
}

} // namespace volley::core
