// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace volley::core {

enum class FetchErrc {
    success = 0,
    // Configuration
    invalid_config,
    invalid_url,
    // Validation
    no_sources,
    missing_content_length,
    size_mismatch,
    ranges_unsupported,
    // Transport
    network_error,
    timeout,
    refused,
    dns_error,
    ssl_error,
    too_many_redirects,
    connection_lost,
    not_found,
    permission_denied,
    server_error,
    invalid_range,
};

namespace detail {

struct FetchErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "volley::fetch";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<FetchErrc>(ev)) {
            case FetchErrc::success:                return "Success";
            case FetchErrc::invalid_config:         return "Invalid configuration";
            case FetchErrc::invalid_url:            return "Invalid URL";
            case FetchErrc::no_sources:             return "No sources configured";
            case FetchErrc::missing_content_length: return "Source sent no content length";
            case FetchErrc::size_mismatch:          return "Sources disagree on file size";
            case FetchErrc::ranges_unsupported:     return "Source does not accept byte ranges";
            case FetchErrc::network_error:          return "Network error";
            case FetchErrc::timeout:                return "Operation timed out";
            case FetchErrc::refused:                return "Connection refused";
            case FetchErrc::dns_error:              return "DNS resolution failed";
            case FetchErrc::ssl_error:              return "SSL/TLS error";
            case FetchErrc::too_many_redirects:     return "Too many redirects";
            case FetchErrc::connection_lost:        return "Connection lost";
            case FetchErrc::not_found:              return "Resource not found (404)";
            case FetchErrc::permission_denied:      return "Permission denied";
            case FetchErrc::server_error:           return "Server error (5xx)";
            case FetchErrc::invalid_range:          return "Invalid byte range";
            default:                                return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::FetchErrcCategory& fetch_errc_category() noexcept {
    static detail::FetchErrcCategory category;
    return category;
}

inline std::error_code make_error_code(FetchErrc e) noexcept {
    return {static_cast<int>(e), fetch_errc_category()};
}

// Error for an HTTP status, empty for anything below 400
inline std::error_code map_http_status(long status) noexcept {
    if (status < 400) return {};
    if (status == 404 || status == 410) return make_error_code(FetchErrc::not_found);
    if (status == 401 || status == 403) return make_error_code(FetchErrc::permission_denied);
    if (status == 416) return make_error_code(FetchErrc::invalid_range);
    if (status >= 500) return make_error_code(FetchErrc::server_error);
    return make_error_code(FetchErrc::network_error);
}

} // namespace volley::core

namespace std {

template<>
struct is_error_code_enum<volley::core::FetchErrc> : true_type {};

} // namespace std
