// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/settings.hpp>
#include <volley/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace volley::core {

namespace {

std::expected<Source, std::error_code> parse_source(const nlohmann::json& j) {
    if (j.is_string()) {
        return Source::parse(j.get<std::string>());
    }

    // Object form goes through the same URL rules as the string form
    if (j.is_object() && j.contains("hostname")) {
        auto host = j["hostname"].get<std::string>();
        auto path = j.value("path", std::string("/"));

        std::string url = j.value("scheme", std::string("https"));
        url += "://";
        url += host;
        if (j.contains("port")) {
            url += ':';
            url += j["port"].is_number_unsigned()
                ? std::to_string(j["port"].get<std::uint64_t>())
                : j["port"].get<std::string>();
        }
        if (path.empty() || path.front() != '/') {
            url += '/';
        }
        url += path;

        return Source::parse(url);
    }

    return std::unexpected(make_error_code(FetchErrc::invalid_config));
}

} // namespace

std::expected<FetchSettings, std::error_code>
settings_from_json(const nlohmann::json& j, FetchSettings base) {
    if (!j.is_object()) {
        return std::unexpected(make_error_code(FetchErrc::invalid_config));
    }

    try {
        if (j.contains("sources")) {
            if (!j["sources"].is_array()) {
                return std::unexpected(make_error_code(FetchErrc::invalid_config));
            }
            base.sources.clear();
            for (const auto& s : j["sources"]) {
                auto source = parse_source(s);
                if (!source) {
                    return std::unexpected(source.error());
                }
                base.sources.push_back(std::move(*source));
            }
        }

        if (j.contains("filename")) {
            base.filename = j["filename"].get<std::string>();
        }
        if (j.contains("output")) {
            base.output_path = j["output"].get<std::string>();
        }
        if (j.contains("chunk_size")) {
            base.chunk_size = j["chunk_size"].get<std::uint64_t>();
        }
        if (j.contains("max_connections")) {
            base.max_connections = j["max_connections"].get<std::uint32_t>();
        }
        if (j.contains("connect_timeout")) {
            base.connect_timeout_sec = j["connect_timeout"].get<std::uint32_t>();
        }
        if (j.contains("stall_timeout")) {
            base.stall_timeout_sec = j["stall_timeout"].get<std::uint32_t>();
        }
        if (j.contains("verify_tls")) {
            base.verify_tls = j["verify_tls"].get<bool>();
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Bad settings: {}", e.what());
        return std::unexpected(make_error_code(FetchErrc::invalid_config));
    }

    return base;
}

std::expected<FetchSettings, std::error_code>
load_settings(std::string_view path, FetchSettings base) {
    std::ifstream file{std::string(path)};
    if (!file) {
        spdlog::error("Cannot open settings file {}", path);
        return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
    }

    try {
        auto j = nlohmann::json::parse(file);
        return settings_from_json(j, std::move(base));
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Cannot parse settings file {}: {}", path, e.what());
        return std::unexpected(make_error_code(FetchErrc::invalid_config));
    }
}

PoolConfig pool_config(const FetchSettings& settings) noexcept {
    PoolConfig config;
    config.max_connections = settings.max_connections;
    config.connect_timeout_sec = settings.connect_timeout_sec;
    config.stall_timeout_sec = settings.stall_timeout_sec;
    config.verify_peer = settings.verify_tls;
    return config;
}

} // namespace volley::core
