// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <cstddef>

namespace volley::core {

constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 8 * 1024 * 1024;      // 8 MiB
constexpr std::uint32_t DEFAULT_MAX_CONNECTIONS = 64;              // Shared by every request of a run

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 0;                     // 0 = no stall detection

constexpr std::size_t READ_BUFFER_SIZE = 256 * 1024;               // 256 KB

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

} // namespace volley::core
