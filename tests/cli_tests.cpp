// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <volley/cli/commands.hpp>
#include <volley/cli/progress_bar.hpp>
#include <volley/cli/status_view.hpp>
#include <volley/core/chunk.hpp>
#include <array>
#include <vector>

using namespace volley::cli;
using namespace volley::core;

namespace {

// argv built from string literals
template <std::size_t N>
CliArgs parse(const std::array<const char*, N>& argv) {
    std::vector<char*> ptrs;
    for (const char* arg : argv) {
        ptrs.push_back(const_cast<char*>(arg));
    }
    return parse_args(static_cast<int>(ptrs.size()), ptrs.data());
}

} // namespace

TEST_CASE("parse_size", "[cli]") {
    CHECK(parse_size("8388608") == 8'388'608ULL);
    CHECK(parse_size("512K") == 512ULL * 1024);
    CHECK(parse_size("8M") == 8ULL * 1024 * 1024);
    CHECK(parse_size("8m") == 8ULL * 1024 * 1024);
    CHECK(parse_size("1G") == 1024ULL * 1024 * 1024);

    CHECK_FALSE(parse_size("").has_value());
    CHECK_FALSE(parse_size("M").has_value());
    CHECK_FALSE(parse_size("12X").has_value());
    CHECK_FALSE(parse_size("-1").has_value());
    CHECK_FALSE(parse_size("99999999999999999999").has_value());
}

TEST_CASE("parse_args", "[cli]") {
    SECTION("Sources, file and options") {
        auto args = parse(std::array{"volley", "-f", "movie.mp4",
                                     "https://a.example/vid/", "-s", "https://b.example/tmp/",
                                     "-c", "4M", "-m", "16", "-o", "out.mp4", "-V"});
        CHECK(args.error.empty());
        REQUIRE(args.sources.size() == 2);
        CHECK(args.sources[0] == "https://a.example/vid/");
        CHECK(args.sources[1] == "https://b.example/tmp/");
        CHECK(args.filename == "movie.mp4");
        CHECK(args.output_file == "out.mp4");
        CHECK(args.chunk_size == 4ULL * 1024 * 1024);
        CHECK(args.max_connections == 16);
        CHECK(args.verbose);
        CHECK_FALSE(args.quiet);
        CHECK_FALSE(args.insecure);
    }

    SECTION("Positional filename") {
        auto args = parse(std::array{"volley", "http://127.0.0.1:8000/", "file.bin", "--info"});
        CHECK(args.error.empty());
        CHECK(args.filename == "file.bin");
        CHECK(args.info_only);
    }

    SECTION("Insecure flag") {
        CHECK(parse(std::array{"volley", "-k"}).insecure);
        CHECK(parse(std::array{"volley", "--insecure"}).insecure);
    }

    SECTION("Help and version stop parsing") {
        CHECK(parse(std::array{"volley", "-h", "--bogus"}).help);
        CHECK(parse(std::array{"volley", "--version"}).version);
    }

    SECTION("Unknown option") {
        auto args = parse(std::array{"volley", "--bogus"});
        CHECK_FALSE(args.error.empty());
    }

    SECTION("Missing option value") {
        auto args = parse(std::array{"volley", "-f"});
        CHECK_FALSE(args.error.empty());
    }

    SECTION("Bad numbers") {
        CHECK_FALSE(parse(std::array{"volley", "-c", "0"}).error.empty());
        CHECK_FALSE(parse(std::array{"volley", "-c", "lots"}).error.empty());
        CHECK_FALSE(parse(std::array{"volley", "-m", "0"}).error.empty());
        CHECK_FALSE(parse(std::array{"volley", "-m", "8x"}).error.empty());
    }

    SECTION("Second positional filename") {
        auto args = parse(std::array{"volley", "a.bin", "b.bin"});
        CHECK_FALSE(args.error.empty());
    }
}

TEST_CASE("resolve_settings", "[cli]") {
    SECTION("Command line values override defaults") {
        CliArgs args;
        args.sources = {"https://a.example/vid/", "https://b.example/tmp/"};
        args.filename = "movie.mp4";
        args.chunk_size = 1024;

        auto settings = resolve_settings(args);
        REQUIRE(settings.has_value());
        CHECK(settings->sources.size() == 2);
        CHECK(settings->sources[1].host() == "b.example");
        CHECK(settings->chunk_size == 1024);
        CHECK(settings->max_connections == 64);
        CHECK(settings->effective_output() == "movie.mp4");
        CHECK(settings->verify_tls);
    }

    SECTION("Insecure disables TLS verification") {
        CliArgs args;
        args.sources = {"https://a.example/"};
        args.filename = "f.bin";
        args.insecure = true;

        auto settings = resolve_settings(args);
        REQUIRE(settings.has_value());
        CHECK_FALSE(settings->verify_tls);
        CHECK_FALSE(pool_config(*settings).verify_peer);
    }

    SECTION("Filename is required") {
        CliArgs args;
        args.sources = {"https://a.example/"};
        auto settings = resolve_settings(args);
        REQUIRE_FALSE(settings.has_value());
        CHECK(settings.error() == FetchErrc::invalid_config);
    }

    SECTION("Invalid source URL") {
        CliArgs args;
        args.sources = {"https://a.example:bad/"};
        args.filename = "f.bin";
        auto settings = resolve_settings(args);
        REQUIRE_FALSE(settings.has_value());
        CHECK(settings.error() == FetchErrc::invalid_url);
    }
}

TEST_CASE("Chunk status lines", "[cli]") {
    Chunk chunk;
    chunk.index = 2;
    chunk.source = Source("mirror.example.com", "/pub/");
    chunk.first = 0;
    chunk.last = 8'388'607;
    chunk.downloaded = 4'194'304;

    CHECK(format_chunk_line(chunk, 12) == "  50.00%\t3/12\t(8388608 bytes)\tmirror.example.com");

    chunk.downloaded = chunk.size();
    CHECK(format_chunk_line(chunk, 12) == " 100.00%\t3/12\t(8388608 bytes)\tmirror.example.com");

    std::vector<Chunk> chunks{chunk, chunk};
    chunks[0].index = 0;
    chunks[1].index = 1;
    auto table = render_chunk_table(chunks);
    CHECK(table == " 100.00%\t1/2\t(8388608 bytes)\tmirror.example.com\n"
                   " 100.00%\t2/2\t(8388608 bytes)\tmirror.example.com\n");
}

TEST_CASE("ProgressBar formatting", "[cli]") {
    SECTION("Bytes") {
        CHECK(ProgressBar::format_bytes(512) == "512 B");
        CHECK(ProgressBar::format_bytes(2048) == "2 KB");
        CHECK(ProgressBar::format_bytes(8 * 1024 * 1024) == "8.0 MB");
    }

    SECTION("Speed") {
        CHECK(ProgressBar::format_speed(100) == "100 B/s");
        CHECK(ProgressBar::format_speed(1536) == "1.5 KB/s");
    }

    SECTION("Rendered line") {
        ProgressBar bar(1000, "Downloading");
        auto line = bar.render(500, 0);
        CHECK(line.starts_with("Downloading: ["));
        CHECK(line.find(" 50% (500 B/1000 B)") != std::string::npos);
    }
}
