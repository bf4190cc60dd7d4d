// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/config.hpp>
#include <volley/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <utility>

namespace volley::core {

// Response headers, names lower-cased
using HeaderMap = std::map<std::string, std::string>;

// Receives each block of body bytes. Returning an error aborts the transfer with it.
using BodySink = std::function<std::error_code(std::span<const std::byte>)>;

// Pool limits, applied to every request routed through the pool
struct PoolConfig {
    std::uint32_t max_connections{DEFAULT_MAX_CONNECTIONS};
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};  // 0 = unbounded
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};         // 0 = unbounded
    bool verify_peer{true};
};

// One HTTP request driven by a ConnectionPool
class Request {
public:
    explicit Request(std::string url) : url_(std::move(url)) {}

    // Metadata only, no body transfer
    void head_only() noexcept { head_only_ = true; }
    [[nodiscard]] bool is_head() const noexcept { return head_only_; }

    // Inclusive byte range [first, last]
    void range(std::uint64_t first, std::uint64_t last) noexcept { range_ = {first, last}; }
    [[nodiscard]] const std::optional<std::pair<std::uint64_t, std::uint64_t>>& range() const noexcept { return range_; }

    void body_sink(BodySink sink) { sink_ = std::move(sink); }

    [[nodiscard]] const std::string& url() const noexcept { return url_; }

    // Results, valid once the pool has finished the request
    [[nodiscard]] const HeaderMap& headers() const noexcept { return headers_; }
    [[nodiscard]] long status_code() const noexcept { return status_code_; }
    [[nodiscard]] const std::error_code& error() const noexcept { return error_; }
    [[nodiscard]] bool done() const noexcept { return done_; }

private:
    friend class ConnectionPool;

    std::string url_;
    bool head_only_{false};
    std::optional<std::pair<std::uint64_t, std::uint64_t>> range_;
    BodySink sink_;

    HeaderMap headers_;
    long status_code_{0};
    std::error_code error_;
    bool done_{false};
};

// Shared HTTP client for a whole run.
//
// Wraps one libcurl multi handle. Persistent connections are kept in the
// multi handle's cache and reused by later requests to the same host; the
// total number of simultaneous connections is capped at max_connections and
// libcurl queues transfers beyond the cap until a connection frees up.
// Construct once per run and pass by reference to every component.
class ConnectionPool {
public:
    explicit ConnectionPool(PoolConfig config = {});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;
    ConnectionPool(ConnectionPool&&) = delete;
    ConnectionPool& operator=(ConnectionPool&&) = delete;

    // Run every request concurrently and wait for all of them.
    // Returns the first failure; requests still in flight at that point are
    // removed from the pool and never complete.
    [[nodiscard]] std::error_code perform(std::span<Request> requests) noexcept;

    [[nodiscard]] const PoolConfig& config() const noexcept { return config_; }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    [[nodiscard]] std::error_code configure(void* handle, Request& request) const noexcept;
    [[nodiscard]] std::error_code finish(void* handle, Request& request, int result) const noexcept;

    // libcurl callbacks, userdata is the Request
    static std::size_t on_header(char* buffer, std::size_t size, std::size_t nitems, void* userdata) noexcept;
    static std::size_t on_body(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept;

    PoolConfig config_;
    void* multi_{nullptr};  // CURLM*
};

} // namespace volley::core
