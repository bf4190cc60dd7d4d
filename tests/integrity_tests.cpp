// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <volley/core/integrity.hpp>
#include <volley/disk/error.hpp>
#include <filesystem>
#include <fstream>
#include <string>

using namespace volley::core;

namespace fs = std::filesystem;

namespace {

fs::path make_file(const std::string& name, std::size_t size) {
    auto path = fs::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << std::string(size, 'x');
    return path;
}

SourceMetadata with(std::string server, std::string etag) {
    HeaderMap headers;
    if (!server.empty()) headers["server"] = std::move(server);
    if (!etag.empty()) headers["etag"] = std::move(etag);
    return SourceMetadata::from_headers(std::move(headers));
}

} // namespace

TEST_CASE("etag_content_length", "[integrity]") {
    SECTION("nginx strong tag") {
        auto size = etag_content_length("\"1a2b-1f4\"");
        REQUIRE(size.has_value());
        CHECK(*size == 500);
    }

    SECTION("Weak tag") {
        auto size = etag_content_length("W/\"5f1a2b3c-989680\"");
        REQUIRE(size.has_value());
        CHECK(*size == 10'000'000);
    }

    SECTION("Unquoted tag") {
        auto size = etag_content_length("1a2b-1f4");
        REQUIRE(size.has_value());
        CHECK(*size == 500);
    }

    SECTION("Size field is read as a number") {
        CHECK(etag_content_length("\"x-01F4\"") == etag_content_length("\"x-1f4\""));
        CHECK(etag_content_length("\"x-01F4\"") == std::optional<std::uint64_t>(500));
    }

    SECTION("Extra fields after the size") {
        auto size = etag_content_length("\"1a2b-1f4-gzip\"");
        REQUIRE(size.has_value());
        CHECK(*size == 500);
    }

    SECTION("Tags without a size field") {
        CHECK_FALSE(etag_content_length("\"abcdef\"").has_value());
        CHECK_FALSE(etag_content_length("\"1a2b-\"").has_value());
        CHECK_FALSE(etag_content_length("\"1a2b-xyz\"").has_value());
        CHECK_FALSE(etag_content_length("").has_value());
    }
}

TEST_CASE("is_recognized_server", "[integrity]") {
    CHECK(is_recognized_server("nginx"));
    CHECK(is_recognized_server("nginx/1.24.0"));
    CHECK_FALSE(is_recognized_server("Apache/2.4.57"));
    CHECK_FALSE(is_recognized_server(""));
}

TEST_CASE("verify_etag", "[integrity]") {
    auto path = make_file("volley_verify_etag.bin", 500);

    SECTION("Matching size") {
        auto ok = verify_etag(path, "\"1a2b-1f4\"");
        REQUIRE(ok.has_value());
        CHECK(*ok);
    }

    SECTION("Different size") {
        auto ok = verify_etag(path, "\"1a2b-1f5\"");
        REQUIRE(ok.has_value());
        CHECK_FALSE(*ok);
    }

    SECTION("Missing file") {
        auto ok = verify_etag(fs::temp_directory_path() / "volley_no_such_file.bin", "\"1a2b-1f4\"");
        REQUIRE_FALSE(ok.has_value());
        CHECK(ok.error() == volley::disk::DiskErrc::file_not_found);
    }

    fs::remove(path);
}

TEST_CASE("check_integrity", "[integrity]") {
    auto path = make_file("volley_check_integrity.bin", 500);

    SECTION("nginx tag with the right size") {
        CHECK(check_integrity(path, with("nginx/1.24.0", "\"1a2b-1f4\"")) == IntegrityStatus::match);
    }

    SECTION("nginx tag with the wrong size") {
        CHECK(check_integrity(path, with("nginx", "\"1a2b-3e8\"")) == IntegrityStatus::mismatch);
    }

    SECTION("Other servers are skipped") {
        CHECK(check_integrity(path, with("Apache", "\"1a2b-1f4\"")) == IntegrityStatus::skipped);
    }

    SECTION("No tag or no server is skipped") {
        CHECK(check_integrity(path, with("nginx", "")) == IntegrityStatus::skipped);
        CHECK(check_integrity(path, with("", "\"1a2b-1f4\"")) == IntegrityStatus::skipped);
    }

    SECTION("Unparseable nginx tag is skipped") {
        CHECK(check_integrity(path, with("nginx", "\"opaque\"")) == IntegrityStatus::skipped);
    }

    SECTION("Missing file is a mismatch") {
        auto missing = fs::temp_directory_path() / "volley_missing_output.bin";
        CHECK(check_integrity(missing, with("nginx", "\"1a2b-1f4\"")) == IntegrityStatus::mismatch);
    }

    fs::remove(path);
}

TEST_CASE("IntegrityStatus to_string", "[integrity]") {
    CHECK(to_string(IntegrityStatus::match) == "good");
    CHECK(to_string(IntegrityStatus::mismatch) == "bad");
    CHECK(to_string(IntegrityStatus::skipped) == "skipped");
}
