// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace volley::core {

// A server able to serve the target resource under a base path.
// Every source of a run must serve byte-identical content for the same filename.
class Source {
public:
    Source() = default;
    Source(std::string host, std::string path, std::string scheme = "https", std::string port = {});

    // Parse a base URL such as "https://mirror.example.com:8443/pub/"
    static std::expected<Source, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    // scheme://host[:port]{path}
    [[nodiscard]] std::string base() const;

    // scheme://host[:port]{path}{filename}
    [[nodiscard]] std::string resource_url(std::string_view filename) const;

    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }

    bool operator==(const Source&) const = default;

private:
    std::string scheme_{"https"};
    std::string host_;
    std::string port_;
    std::string path_{"/"};
};

} // namespace volley::core
