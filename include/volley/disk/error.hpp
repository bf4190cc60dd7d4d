// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace volley::disk {

// Failures while persisting or inspecting the output file
enum class DiskErrc {
    success = 0,
    file_not_found,   // Missing file or parent directory
    access_denied,    // Permissions or read-only filesystem
    disk_full,        // No space or quota left
    invalid_path,     // Path names a directory or is too long
    write_error,
    read_error,       // File exists but cannot be stat'ed
    handle_invalid,   // Writer used while closed
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override { return "volley::disk"; }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:        return "Success";
            case DiskErrc::file_not_found: return "Output file or directory does not exist";
            case DiskErrc::access_denied:  return "Not allowed to write the output file";
            case DiskErrc::disk_full:      return "No space left for the output file";
            case DiskErrc::invalid_path:   return "Output path is not a regular file path";
            case DiskErrc::write_error:    return "Failed to write the output file";
            case DiskErrc::read_error:     return "Failed to inspect the output file";
            case DiskErrc::handle_invalid: return "Output file is not open";
        }
        return "Unknown disk error";
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

} // namespace volley::disk

namespace std {

template<>
struct is_error_code_enum<volley::disk::DiskErrc> : true_type {};

} // namespace std
