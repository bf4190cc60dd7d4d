// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/source.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <exception>

namespace volley::core {

namespace {

// Base paths are directories: always "/.../"
std::string normalize_path(std::string_view path) {
    std::string result;
    if (path.empty() || path.front() != '/') {
        result += '/';
    }
    result += path;
    if (result.back() != '/') {
        result += '/';
    }
    return result;
}

// Decimal 1-65535
bool is_valid_port(std::string_view port) noexcept {
    if (port.empty() || port.size() > 5) return false;
    std::uint32_t value = 0;
    auto [end, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
    return ec == std::errc{} && end == port.data() + port.size() && value >= 1 && value <= 65535;
}

} // namespace

Source::Source(std::string host, std::string path, std::string scheme, std::string port)
    : scheme_(std::move(scheme))
    , host_(std::move(host))
    , port_(std::move(port))
    , path_(normalize_path(path)) {}

std::expected<Source, std::error_code> Source::parse(std::string_view url_str) noexcept {
    try {
        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos) {
            return std::unexpected(make_error_code(FetchErrc::invalid_url));
        }

        std::string scheme;
        scheme.reserve(scheme_end);
        for (std::size_t i = 0; i < scheme_end; ++i) {
            scheme += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
        }

        // Only byte-range capable HTTP servers are supported
        if (scheme != "http" && scheme != "https") {
            return std::unexpected(make_error_code(FetchErrc::invalid_url));
        }

        auto rest_start = scheme_end + 3;

        // Query and fragment have no meaning for a base path
        auto rest_end = std::min(url_str.find('?', rest_start), url_str.find('#', rest_start));
        if (rest_end == std::string_view::npos) {
            rest_end = url_str.length();
        }

        auto path_start = url_str.find('/', rest_start);
        if (path_start == std::string_view::npos || path_start > rest_end) {
            path_start = rest_end;
        }

        auto authority = url_str.substr(rest_start, path_start - rest_start);

        // Drop userinfo, authentication is not supported
        if (auto at = authority.rfind('@'); at != std::string_view::npos) {
            authority.remove_prefix(at + 1);
        }

        std::string host;
        std::string port;

        if (!authority.empty() && authority.front() == '[') {
            // IPv6 literal [::1]:port
            auto bracket_end = authority.find(']');
            if (bracket_end == std::string_view::npos) {
                return std::unexpected(make_error_code(FetchErrc::invalid_url));
            }
            host = std::string(authority.substr(0, bracket_end + 1));
            auto tail = authority.substr(bracket_end + 1);
            if (!tail.empty()) {
                if (tail.front() != ':') {
                    return std::unexpected(make_error_code(FetchErrc::invalid_url));
                }
                port = std::string(tail.substr(1));
            }
        } else if (auto colon = authority.find(':'); colon != std::string_view::npos) {
            host = std::string(authority.substr(0, colon));
            port = std::string(authority.substr(colon + 1));
        } else {
            host = std::string(authority);
        }

        if (host.empty() || host == "[]") {
            return std::unexpected(make_error_code(FetchErrc::invalid_url));
        }
        if (!port.empty() && !is_valid_port(port)) {
            return std::unexpected(make_error_code(FetchErrc::invalid_url));
        }

        std::transform(host.begin(), host.end(), host.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        auto path = url_str.substr(path_start, rest_end - path_start);
        return Source(std::move(host), std::string(path), std::move(scheme), std::move(port));
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(FetchErrc::invalid_url));
    }
}

std::string Source::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    result += path_;
    return result;
}

std::string Source::resource_url(std::string_view filename) const {
    std::string result = base();
    result += filename;
    return result;
}

} // namespace volley::core
