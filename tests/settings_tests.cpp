// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <volley/core/settings.hpp>
#include <volley/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace volley::core;

namespace fs = std::filesystem;

TEST_CASE("FetchSettings defaults", "[settings]") {
    FetchSettings settings;
    CHECK(settings.chunk_size == 8 * 1024 * 1024);
    CHECK(settings.max_connections == 64);
    CHECK(settings.sources.empty());

    settings.filename = "movie.mp4";
    CHECK(settings.effective_output() == "movie.mp4");
    settings.output_path = "/tmp/out.mp4";
    CHECK(settings.effective_output() == "/tmp/out.mp4");
}

TEST_CASE("settings_from_json", "[settings]") {
    SECTION("Full document") {
        auto j = nlohmann::json::parse(R"({
            "sources": [
                "https://a.example/vid/",
                {"hostname": "b.example", "path": "/tmp/"},
                {"hostname": "127.0.0.1", "path": "data", "scheme": "http", "port": 8000}
            ],
            "filename": "movie.mp4",
            "output": "out.mp4",
            "chunk_size": 1048576,
            "max_connections": 16,
            "connect_timeout": 10,
            "stall_timeout": 60
        })");

        auto settings = settings_from_json(j);
        REQUIRE(settings.has_value());
        REQUIRE(settings->sources.size() == 3);
        CHECK(settings->sources[0] == Source("a.example", "/vid/"));
        CHECK(settings->sources[1] == Source("b.example", "/tmp/"));
        CHECK(settings->sources[2].resource_url("movie.mp4") == "http://127.0.0.1:8000/data/movie.mp4");
        CHECK(settings->filename == "movie.mp4");
        CHECK(settings->output_path == "out.mp4");
        CHECK(settings->chunk_size == 1'048'576);
        CHECK(settings->max_connections == 16);
        CHECK(settings->connect_timeout_sec == 10);
        CHECK(settings->stall_timeout_sec == 60);
    }

    SECTION("Missing keys keep the base values") {
        FetchSettings base;
        base.filename = "keep.bin";
        base.max_connections = 8;

        auto settings = settings_from_json(nlohmann::json::parse(R"({"chunk_size": 4096})"), base);
        REQUIRE(settings.has_value());
        CHECK(settings->filename == "keep.bin");
        CHECK(settings->max_connections == 8);
        CHECK(settings->chunk_size == 4096);
    }

    SECTION("Wrong value type") {
        auto settings = settings_from_json(nlohmann::json::parse(R"({"chunk_size": "big"})"));
        REQUIRE_FALSE(settings.has_value());
        CHECK(settings.error() == FetchErrc::invalid_config);
    }

    SECTION("Sources must be an array") {
        auto settings = settings_from_json(nlohmann::json::parse(R"({"sources": "https://a.example/"})"));
        REQUIRE_FALSE(settings.has_value());
        CHECK(settings.error() == FetchErrc::invalid_config);
    }

    SECTION("Bad source URL") {
        auto settings = settings_from_json(nlohmann::json::parse(R"({"sources": ["ftp://a.example/"]})"));
        REQUIRE_FALSE(settings.has_value());
        CHECK(settings.error() == FetchErrc::invalid_url);
    }

    SECTION("Object sources follow the URL rules") {
        auto upper = settings_from_json(nlohmann::json::parse(
            R"({"sources": [{"hostname": "A.Example", "scheme": "HTTPS", "port": "8443", "path": "pub"}]})"));
        REQUIRE(upper.has_value());
        CHECK(upper->sources[0] == Source("a.example", "/pub/", "https", "8443"));

        auto big_port = settings_from_json(nlohmann::json::parse(
            R"({"sources": [{"hostname": "a.example", "port": 70000}]})"));
        REQUIRE_FALSE(big_port.has_value());
        CHECK(big_port.error() == FetchErrc::invalid_url);

        auto text_port = settings_from_json(nlohmann::json::parse(
            R"({"sources": [{"hostname": "a.example", "port": "abc"}]})"));
        REQUIRE_FALSE(text_port.has_value());
        CHECK(text_port.error() == FetchErrc::invalid_url);

        auto bad_scheme = settings_from_json(nlohmann::json::parse(
            R"({"sources": [{"hostname": "a.example", "scheme": "ftp"}]})"));
        REQUIRE_FALSE(bad_scheme.has_value());
        CHECK(bad_scheme.error() == FetchErrc::invalid_url);

        auto no_host = settings_from_json(nlohmann::json::parse(
            R"({"sources": [{"hostname": ""}]})"));
        REQUIRE_FALSE(no_host.has_value());
        CHECK(no_host.error() == FetchErrc::invalid_url);
    }

    SECTION("TLS verification can be turned off") {
        auto settings = settings_from_json(nlohmann::json::parse(R"({"verify_tls": false})"));
        REQUIRE(settings.has_value());
        CHECK_FALSE(settings->verify_tls);
        CHECK_FALSE(pool_config(*settings).verify_peer);
    }

    SECTION("Not an object") {
        auto settings = settings_from_json(nlohmann::json::parse("[1, 2]"));
        REQUIRE_FALSE(settings.has_value());
        CHECK(settings.error() == FetchErrc::invalid_config);
    }
}

TEST_CASE("load_settings", "[settings]") {
    auto path = fs::temp_directory_path() / "volley_settings_test.json";

    SECTION("Reads a file") {
        {
            std::ofstream out(path);
            out << R"({"sources": ["https://a.example/"], "filename": "f.bin"})";
        }
        auto settings = load_settings(path.string());
        REQUIRE(settings.has_value());
        CHECK(settings->filename == "f.bin");
        CHECK(settings->sources.size() == 1);
    }

    SECTION("Malformed JSON") {
        {
            std::ofstream out(path);
            out << R"({"sources": [)";
        }
        auto settings = load_settings(path.string());
        REQUIRE_FALSE(settings.has_value());
        CHECK(settings.error() == FetchErrc::invalid_config);
    }

    SECTION("Missing file") {
        auto settings = load_settings((fs::temp_directory_path() / "volley_absent.json").string());
        REQUIRE_FALSE(settings.has_value());
        CHECK(settings.error() == volley::disk::DiskErrc::file_not_found);
    }

    fs::remove(path);
}

TEST_CASE("pool_config", "[settings]") {
    FetchSettings settings;
    settings.max_connections = 4;
    settings.connect_timeout_sec = 7;
    settings.stall_timeout_sec = 20;

    auto config = pool_config(settings);
    CHECK(config.max_connections == 4);
    CHECK(config.connect_timeout_sec == 7);
    CHECK(config.stall_timeout_sec == 20);
    CHECK(config.verify_peer);

    settings.verify_tls = false;
    CHECK_FALSE(pool_config(settings).verify_peer);
}
