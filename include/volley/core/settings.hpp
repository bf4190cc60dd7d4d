// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/config.hpp>
#include <volley/core/connection_pool.hpp>
#include <volley/core/error.hpp>
#include <volley/core/source.hpp>
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace volley::core {

// Everything a run needs. Combinations are not cross-checked.
struct FetchSettings {
    std::vector<Source> sources;
    std::string filename;
    std::string output_path;                 // Defaults to filename
    std::uint64_t chunk_size{DEFAULT_CHUNK_SIZE};
    std::uint32_t max_connections{DEFAULT_MAX_CONNECTIONS};
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};
    bool verify_tls{true};                   // Certificate and host name checks for https sources

    [[nodiscard]] std::string effective_output() const {
        return output_path.empty() ? filename : output_path;
    }
};

// Read settings from a parsed JSON document:
//   {
//     "sources": ["https://a.example/vid/", {"hostname": "b.example", "path": "/tmp/", "port": 8443}],
//     "filename": "movie.mp4",
//     "output": "movie.mp4",
//     "chunk_size": 8388608,
//     "max_connections": 64,
//     "connect_timeout": 30,
//     "stall_timeout": 0,
//     "verify_tls": true
//   }
// Missing keys keep the values already in `base`.
[[nodiscard]] std::expected<FetchSettings, std::error_code>
settings_from_json(const nlohmann::json& j, FetchSettings base = {});

// Load and parse a JSON settings file
[[nodiscard]] std::expected<FetchSettings, std::error_code>
load_settings(std::string_view path, FetchSettings base = {});

[[nodiscard]] PoolConfig pool_config(const FetchSettings& settings) noexcept;

} // namespace volley::core
