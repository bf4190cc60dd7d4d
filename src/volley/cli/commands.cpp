// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/cli/commands.hpp>
#include <volley/cli/status_view.hpp>
#include <volley/core/chunk.hpp>
#include <volley/core/connection_pool.hpp>
#include <volley/core/error.hpp>
#include <volley/core/fetch_engine.hpp>
#include <volley/core/integrity.hpp>
#include <volley/core/source_validator.hpp>
#include <volley/disk/file_writer.hpp>
#include <volley/version.hpp>
#include <curl/curlver.h>
#include <spdlog/spdlog.h>
#include <charconv>
#include <chrono>
#include <iomanip>
#include <iostream>

using namespace volley::core;

namespace chrono = std::chrono;

namespace volley::cli {

namespace {

bool is_url(std::string_view arg) noexcept {
    return arg.starts_with("http://") || arg.starts_with("https://");
}

// Next argument as an option value, or an error in args
const char* take_value(int argc, char* argv[], int& i, std::string_view option, CliArgs& args) {
    if (i + 1 >= argc) {
        args.error = std::string("Missing value for ") + std::string(option);
        return nullptr;
    }
    return argv[++i];
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

std::optional<std::uint64_t> parse_size(std::string_view text) noexcept {
    if (text.empty()) return std::nullopt;

    std::uint64_t multiplier = 1;
    switch (text.back()) {
        case 'k': case 'K': multiplier = 1024ULL; break;
        case 'm': case 'M': multiplier = 1024ULL * 1024; break;
        case 'g': case 'G': multiplier = 1024ULL * 1024 * 1024; break;
        default: break;
    }
    if (multiplier != 1) {
        text.remove_suffix(1);
    }

    std::uint64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    if (value > UINT64_MAX / multiplier) {
        return std::nullopt;
    }
    return value * multiplier;
}

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-i" || arg == "--info") {
            args.info_only = true;
        } else if (arg == "-k" || arg == "--insecure") {
            args.insecure = true;
        } else if (arg == "-s" || arg == "--source") {
            if (auto v = take_value(argc, argv, i, arg, args)) args.sources.emplace_back(v);
        } else if (arg == "-f" || arg == "--file") {
            if (auto v = take_value(argc, argv, i, arg, args)) args.filename = v;
        } else if (arg == "-o" || arg == "--output") {
            if (auto v = take_value(argc, argv, i, arg, args)) args.output_file = v;
        } else if (arg == "--config") {
            if (auto v = take_value(argc, argv, i, arg, args)) args.config_path = v;
        } else if (arg == "-c" || arg == "--chunk-size") {
            if (auto v = take_value(argc, argv, i, arg, args)) {
                auto size = parse_size(v);
                if (!size || *size == 0) {
                    args.error = std::string("Invalid chunk size: ") + v;
                } else {
                    args.chunk_size = *size;
                }
            }
        } else if (arg == "-m" || arg == "--max-connections") {
            if (auto v = take_value(argc, argv, i, arg, args)) {
                std::string_view text = v;
                std::uint32_t n = 0;
                auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), n);
                if (ec != std::errc{} || end != text.data() + text.size() || n == 0) {
                    args.error = std::string("Invalid connection count: ") + v;
                } else {
                    args.max_connections = n;
                }
            }
        } else if (is_url(arg)) {
            args.sources.emplace_back(arg);
        } else if (arg.starts_with("-")) {
            args.error = std::string("Unknown option: ") + std::string(arg);
        } else if (args.filename.empty()) {
            args.filename = arg;
        } else {
            args.error = std::string("Unexpected argument: ") + std::string(arg);
        }
    }

    return args;
}

std::expected<FetchSettings, std::error_code> resolve_settings(const CliArgs& args) {
    FetchSettings settings;

    if (!args.config_path.empty()) {
        auto loaded = load_settings(args.config_path);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        settings = std::move(*loaded);
    }

    if (!args.sources.empty()) {
        settings.sources.clear();
        for (const auto& url : args.sources) {
            auto source = Source::parse(url);
            if (!source) {
                spdlog::error("Invalid source URL: {}", url);
                return std::unexpected(source.error());
            }
            settings.sources.push_back(std::move(*source));
        }
    }

    if (!args.filename.empty()) settings.filename = args.filename;
    if (!args.output_file.empty()) settings.output_path = args.output_file;
    if (args.chunk_size > 0) settings.chunk_size = args.chunk_size;
    if (args.max_connections > 0) settings.max_connections = args.max_connections;
    if (args.insecure) settings.verify_tls = false;

    if (settings.filename.empty()) {
        spdlog::error("No filename specified");
        return std::unexpected(make_error_code(FetchErrc::invalid_config));
    }

    if (!settings.verify_tls) {
        for (const auto& source : settings.sources) {
            if (source.is_secure()) {
                spdlog::warn("TLS certificate checks disabled for {}", source.host());
            }
        }
    }

    return settings;
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const FetchSettings& settings, bool verbose, bool quiet) noexcept {
    try {
        const auto started = chrono::steady_clock::now();

        ConnectionPool pool(pool_config(settings));

        auto report = validate_sources(pool, settings.sources, settings.filename);
        if (!report) {
            std::cerr << "Error: invalid sources: " << report.error().message() << std::endl;
            return std::unexpected(report.error());
        }

        auto chunks = plan_chunks(settings.filename, report->file_size, settings.chunk_size, settings.sources);
        if (!chunks) {
            std::cerr << "Error: " << chunks.error().message() << std::endl;
            return std::unexpected(chunks.error());
        }

        spdlog::info("{} ({} bytes) in {} chunk(s) from {} source(s), up to {} connections",
                     settings.filename, report->file_size, chunks->size(),
                     settings.sources.size(), settings.max_connections);

        FetchEngine engine(pool);
        StatusView view(verbose);
        if (!quiet) {
            engine.callback([&view](std::span<const Chunk> snapshot) { view.update(snapshot); });
        }

        auto buffer = engine.fetch(*chunks, report->file_size);
        if (!buffer) {
            if (!quiet) view.clear();
            std::cerr << "Error: download failed: " << buffer.error().message() << std::endl;
            return std::unexpected(buffer.error());
        }
        if (!quiet) view.finish(*chunks);

        const auto elapsed = chrono::duration<double>(chrono::steady_clock::now() - started).count();

        const auto output = settings.effective_output();
        if (auto ec = disk::write_file(output, *buffer)) {
            std::cerr << "Error: cannot write " << output << ": " << ec.message() << std::endl;
            return std::unexpected(ec);
        }

        const auto n = settings.sources.size();
        std::cout << "\nDone! Downloaded " << settings.filename << " (" << buffer->size() << " bytes) from "
                  << n << " source" << (n > 1 ? "s" : "") << " in "
                  << std::fixed << std::setprecision(2) << elapsed << "s.\n" << std::endl;

        for (std::size_t i = 0; i < n; ++i) {
            const auto& meta = report->metadata[i];
            const auto& host = settings.sources[i].host();

            auto status = check_integrity(output, meta);
            if (status == IntegrityStatus::skipped) {
                std::cout << host << " sent no etag or an unknown etag type." << std::endl;
            } else {
                std::cout << host << " runs " << meta.server() << ", etag " << meta.etag()
                          << " looks " << to_string(status) << "." << std::endl;
            }
        }

        std::cout << "\nHave a nice day.\n" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(FetchErrc::network_error));
    }
}

CliResult info(const FetchSettings& settings) noexcept {
    try {
        ConnectionPool pool(pool_config(settings));

        auto metadata = fetch_source_metadata(pool, settings.sources, settings.filename);
        if (!metadata) {
            std::cerr << "Error: " << metadata.error().message() << std::endl;
            return std::unexpected(metadata.error());
        }

        for (std::size_t i = 0; i < metadata->size(); ++i) {
            const auto& meta = (*metadata)[i];
            std::cout << settings.sources[i].resource_url(settings.filename) << std::endl;
            std::cout << "  Content-Length: "
                      << (meta.has_content_length ? std::to_string(meta.content_length) : "-") << std::endl;
            std::cout << "  Accept-Ranges:  " << (meta.accepts_ranges ? "bytes" : "no") << std::endl;
            std::cout << "  ETag:           " << (meta.etag().empty() ? "-" : meta.etag()) << std::endl;
            std::cout << "  Server:         " << (meta.server().empty() ? "-" : meta.server()) << std::endl;
        }

        auto size = check_sources(*metadata);
        if (!size) {
            std::cout << "\nSources are not usable: " << size.error().message() << std::endl;
            return 1;
        }

        std::cout << "\nSources agree on " << *size << " bytes." << std::endl;
        if (settings.chunk_size > 0 && settings.chunk_size <= *size) {
            auto count = (*size + settings.chunk_size - 1) / settings.chunk_size;
            std::cout << count << " chunk(s) of up to " << settings.chunk_size << " bytes." << std::endl;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(FetchErrc::network_error));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Volley " << volley::version.to_string() << " - Fetch one file from several mirrors at once\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] -f <FILE> <SOURCE_URL>...\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help                  Show this help message\n";
    std::cout << "  -v, --version               Show version information\n";
    std::cout << "  -V, --verbose               Debug logging and a per-chunk status table\n";
    std::cout << "  -q, --quiet                 No progress display, warnings only\n";
    std::cout << "  -s, --source <URL>          Base URL of a source (repeatable)\n";
    std::cout << "  -f, --file <NAME>           File to fetch, relative to each source\n";
    std::cout << "  -o, --output <PATH>         Save to PATH (default: NAME)\n";
    std::cout << "  -c, --chunk-size <BYTES>    Chunk size, K/M/G suffixes allowed (default: 8M)\n";
    std::cout << "  -m, --max-connections <N>   Simultaneous connections (default: 64)\n";
    std::cout << "      --config <FILE>         Read settings from a JSON file\n";
    std::cout << "  -i, --info                  Show source metadata without downloading\n";
    std::cout << "  -k, --insecure              Do not verify TLS certificates\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " -f video.mp4 https://a.example/vid/ https://b.example/tmp/\n";
    std::cout << "  " << program_name << " -c 4M -m 16 -f image.iso https://mirror.example/iso/\n";
    std::cout << "  " << program_name << " --config mirrors.json\n";
}

void print_version() noexcept {
    std::cout << "Volley " << volley::version.to_string() << std::endl;
    std::cout << "Built with C++23, libcurl " << LIBCURL_VERSION << std::endl;
}

} // namespace volley::cli
