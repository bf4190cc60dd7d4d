// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/integrity.hpp>
#include <volley/disk/error.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <string>

namespace volley::core {

std::string_view to_string(IntegrityStatus status) noexcept {
    switch (status) {
        case IntegrityStatus::match:    return "good";
        case IntegrityStatus::mismatch: return "bad";
        case IntegrityStatus::skipped:  return "skipped";
        default:                        return "unknown";
    }
}

std::optional<std::uint64_t> etag_content_length(std::string_view etag) noexcept {
    if (etag.starts_with("W/")) {
        etag.remove_prefix(2);
    }

    // Quotes are not part of the value
    std::string bare;
    try {
        bare.reserve(etag.size());
        for (char c : etag) {
            if (c != '"') bare += c;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }

    auto dash = bare.find('-');
    if (dash == std::string::npos) {
        return std::nullopt;
    }

    std::string_view field(bare);
    field.remove_prefix(dash + 1);
    if (auto next = field.find('-'); next != std::string_view::npos) {
        field = field.substr(0, next);
    }
    if (field.empty()) {
        return std::nullopt;
    }

    std::uint64_t size = 0;
    auto [end, ec] = std::from_chars(field.data(), field.data() + field.size(), size, 16);
    if (ec != std::errc{} || end != field.data() + field.size()) {
        return std::nullopt;
    }
    return size;
}

bool is_recognized_server(std::string_view server) noexcept {
    return server.find("nginx") != std::string_view::npos;
}

std::expected<bool, std::error_code>
verify_etag(const std::filesystem::path& path, std::string_view etag) noexcept {
    std::error_code fs_ec;
    auto size = std::filesystem::file_size(path, fs_ec);
    if (fs_ec) {
        if (fs_ec == std::errc::no_such_file_or_directory) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }
        if (fs_ec == std::errc::permission_denied) {
            return std::unexpected(make_error_code(disk::DiskErrc::access_denied));
        }
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }

    auto claimed = etag_content_length(etag);
    return claimed.has_value() && *claimed == static_cast<std::uint64_t>(size);
}

IntegrityStatus check_integrity(const std::filesystem::path& path,
                                const SourceMetadata& metadata) noexcept {
    try {
        auto etag = metadata.etag();
        auto server = metadata.server();

        if (etag.empty() || server.empty() || !is_recognized_server(server)) {
            return IntegrityStatus::skipped;
        }
        if (!etag_content_length(etag)) {
            return IntegrityStatus::skipped;
        }

        auto verified = verify_etag(path, etag);
        if (!verified) {
            spdlog::warn("Cannot inspect {}: {}", path.string(), verified.error().message());
            return IntegrityStatus::mismatch;
        }
        return *verified ? IntegrityStatus::match : IntegrityStatus::mismatch;
    } catch (const std::exception& e) {
        spdlog::warn("Integrity check of {} failed: {}", path.string(), e.what());
        return IntegrityStatus::mismatch;
    }
}

} // namespace volley::core
