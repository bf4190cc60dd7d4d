// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/connection_pool.hpp>
#include <volley/version.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace volley::core {

namespace {

// RAII curl easy handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;
    bool attached = false;  // Currently added to the multi handle

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
    CurlHandle(CurlHandle&& other) noexcept : ptr(other.ptr), attached(other.attached) {
        other.ptr = nullptr;
        other.attached = false;
    }
    CurlHandle& operator=(CurlHandle&& other) noexcept {
        if (this != &other) {
            if (ptr) curl_easy_cleanup(ptr);
            ptr = other.ptr;
            attached = other.attached;
            other.ptr = nullptr;
            other.attached = false;
        }
        return *this;
    }
};

std::error_code map_curl_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:
            return {};
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(FetchErrc::dns_error);
        case CURLE_COULDNT_CONNECT:
            return make_error_code(FetchErrc::refused);
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(FetchErrc::timeout);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(FetchErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(FetchErrc::too_many_redirects);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return make_error_code(FetchErrc::connection_lost);
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
            return make_error_code(FetchErrc::invalid_url);
        case CURLE_RANGE_ERROR:
            return make_error_code(FetchErrc::invalid_range);
        default:
            return make_error_code(FetchErrc::network_error);
    }
}

} // namespace

//=============================================================================
// Callbacks
//=============================================================================

std::size_t ConnectionPool::on_header(char* buffer, std::size_t size, std::size_t nitems, void* userdata) noexcept {
    std::size_t total = size * nitems;
    auto* request = static_cast<Request*>(userdata);
    if (!request) return total;

    std::string_view header(buffer, total);

    // A new status line starts a new response (redirect or 1xx), forget the previous headers
    if (header.starts_with("HTTP/")) {
        request->headers_.clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    try {
        std::string lower_name;
        lower_name.reserve(name.size());
        for (char c : name) {
            lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        request->headers_[lower_name] = std::string(value);
    } catch (const std::exception&) {
        return 0;  // Out of memory, abort the transfer
    }
    return total;
}

std::size_t ConnectionPool::on_body(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    std::size_t total = size * nmemb;
    auto* request = static_cast<Request*>(userdata);
    if (!request || !request->sink_) return total;  // Nothing wants the body, drain it

    try {
        auto ec = request->sink_(std::span<const std::byte>(reinterpret_cast<const std::byte*>(ptr), total));
        if (ec) {
            request->error_ = ec;
            return 0;
        }
    } catch (const std::exception&) {
        request->error_ = make_error_code(FetchErrc::network_error);
        return 0;
    }
    return total;
}

//=============================================================================
// ConnectionPool
//=============================================================================

ConnectionPool::ConnectionPool(PoolConfig config)
    : config_(config)
    , multi_(curl_multi_init()) {
    if (!multi_) {
        spdlog::error("curl_multi_init failed");
        return;
    }

    auto* multi = static_cast<CURLM*>(multi_);
    auto ceiling = static_cast<long>(std::max<std::uint32_t>(config_.max_connections, 1));

    // Hard cap on simultaneous connections across every host
    curl_multi_setopt(multi, CURLMOPT_MAX_TOTAL_CONNECTIONS, ceiling);

    // Keep every idle connection cached for reuse instead of closing it
    curl_multi_setopt(multi, CURLMOPT_MAXCONNECTS, ceiling);

    // HTTP/1.1 style: one request per connection at a time
    curl_multi_setopt(multi, CURLMOPT_PIPELINING, static_cast<long>(CURLPIPE_NOTHING));
}

ConnectionPool::~ConnectionPool() {
    if (multi_) {
        curl_multi_cleanup(static_cast<CURLM*>(multi_));
    }
}

std::error_code ConnectionPool::configure(void* handle, Request& request) const noexcept {
    auto* curl = static_cast<CURL*>(handle);

    curl_easy_setopt(curl, CURLOPT_URL, request.url_.c_str());
    curl_easy_setopt(curl, CURLOPT_PRIVATE, static_cast<void*>(&request));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT.data());

    // http and https only, redirects included
    if (curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https") != CURLE_OK) {
        return make_error_code(FetchErrc::invalid_url);
    }
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");

    if (request.head_only_) {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    }

    if (request.range_) {
        std::string range = std::to_string(request.range_->first) + "-" + std::to_string(request.range_->second);
        curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());  // libcurl copies the string
    }

    // Error statuses fail before any body reaches the sink
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &ConnectionPool::on_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, static_cast<void*>(&request));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &ConnectionPool::on_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, static_cast<void*>(&request));

    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }

    // Timeouts
    if (config_.connect_timeout_sec > 0) {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config_.connect_timeout_sec));
    }
    if (config_.stall_timeout_sec > 0) {
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(config_.stall_timeout_sec));
    }

    // SSL options
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config_.verify_peer ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config_.verify_peer ? 2L : 0L);

    // Persistent HTTP/1.1 connections
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(READ_BUFFER_SIZE));

    return {};
}

std::error_code ConnectionPool::finish(void* handle, Request& request, int result) const noexcept {
    auto* curl = static_cast<CURL*>(handle);
    auto code = static_cast<CURLcode>(result);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    request.status_code_ = http_code;
    request.done_ = true;

    if (code == CURLE_HTTP_RETURNED_ERROR) {
        request.error_ = map_http_status(http_code);
        if (!request.error_) {
            request.error_ = make_error_code(FetchErrc::network_error);
        }
        spdlog::warn("{}: HTTP {}", request.url_, http_code);
        return request.error_;
    }

    if (code != CURLE_OK) {
        // A sink error is more precise than the CURLE_WRITE_ERROR it caused
        if (!request.error_) {
            request.error_ = map_curl_error(code);
        }
        spdlog::warn("{}: {} ({})", request.url_, curl_easy_strerror(code), request.error_.message());
        return request.error_;
    }

    if (auto ec = map_http_status(http_code)) {
        request.error_ = ec;
        spdlog::warn("{}: HTTP {}", request.url_, http_code);
        return ec;
    }

    return {};
}

std::error_code ConnectionPool::perform(std::span<Request> requests) noexcept {
    if (!multi_) {
        return make_error_code(FetchErrc::network_error);
    }
    if (requests.empty()) {
        return {};
    }

    auto* multi = static_cast<CURLM*>(multi_);
    std::vector<CurlHandle> handles;

    // Detach whatever is still in flight, then the handles clean themselves up.
    // Cached connections stay in the multi handle for the next perform().
    auto detach_all = [&]() noexcept {
        for (auto& h : handles) {
            if (h.attached) {
                curl_multi_remove_handle(multi, h.ptr);
                h.attached = false;
            }
        }
    };

    std::error_code first_error;

    try {
        handles.reserve(requests.size());

        for (auto& request : requests) {
            request.headers_.clear();
            request.status_code_ = 0;
            request.error_ = {};
            request.done_ = false;

            CurlHandle h(curl_easy_init());
            if (!h.ptr) {
                detach_all();
                return make_error_code(FetchErrc::network_error);
            }

            if (auto ec = configure(h.ptr, request)) {
                detach_all();
                return ec;
            }

            handles.push_back(std::move(h));
            if (curl_multi_add_handle(multi, handles.back().ptr) != CURLM_OK) {
                detach_all();
                return make_error_code(FetchErrc::network_error);
            }
            handles.back().attached = true;
        }
    } catch (const std::exception&) {
        detach_all();
        return make_error_code(FetchErrc::network_error);
    }

    std::size_t remaining = handles.size();

    while (remaining > 0 && !first_error) {
        int running = 0;
        if (curl_multi_perform(multi, &running) != CURLM_OK) {
            first_error = make_error_code(FetchErrc::network_error);
            break;
        }

        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi, &queued)) {
            if (msg->msg != CURLMSG_DONE) continue;

            char* priv = nullptr;
            curl_easy_getinfo(msg->easy_handle, CURLINFO_PRIVATE, &priv);
            auto* request = reinterpret_cast<Request*>(priv);

            auto ec = request
                ? finish(msg->easy_handle, *request, static_cast<int>(msg->data.result))
                : make_error_code(FetchErrc::network_error);

            curl_multi_remove_handle(multi, msg->easy_handle);
            for (auto& h : handles) {
                if (h.ptr == msg->easy_handle) {
                    h.attached = false;
                    break;
                }
            }
            --remaining;

            if (ec && !first_error) {
                first_error = ec;
            }
        }

        if (remaining > 0 && !first_error) {
            if (curl_multi_poll(multi, nullptr, 0, 1000, nullptr) != CURLM_OK) {
                first_error = make_error_code(FetchErrc::network_error);
            }
        }
    }

    if (first_error && remaining > 0) {
        spdlog::debug("Abandoning {} request(s) after failure: {}", remaining, first_error.message());
    }

    detach_all();
    return first_error;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void ConnectionPool::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void ConnectionPool::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace volley::core
