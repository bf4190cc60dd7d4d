// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/settings.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace volley::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::vector<std::string> sources;
    std::string filename;
    std::string output_file;
    std::string config_path;
    std::uint64_t chunk_size{0};       // 0 = from config or default
    std::uint32_t max_connections{0};  // 0 = from config or default
    bool info_only{false};
    bool insecure{false};              // Skip TLS certificate checks
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;                 // Set when the command line is unusable
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// "8388608", "512K", "8M", "1G"
[[nodiscard]] std::optional<std::uint64_t> parse_size(std::string_view text) noexcept;

// Defaults, then the config file, then command line overrides
[[nodiscard]] std::expected<core::FetchSettings, std::error_code>
resolve_settings(const CliArgs& args);

// Validate, plan, fetch, persist and verify one file
[[nodiscard]] CliResult download(const core::FetchSettings& settings, bool verbose, bool quiet) noexcept;

// Show each source's metadata without downloading
[[nodiscard]] CliResult info(const core::FetchSettings& settings) noexcept;

void print_help(std::string_view program_name) noexcept;

void print_version() noexcept;

} // namespace volley::cli
