// Copyright (c) 2026 changcheng967. All rights reserved.

#include <manifold/cli/commands.hpp>
#include <manifold/cli/progress_bar.hpp>
#include <manifold/core/cloud_probe.hpp>
#include <manifold/core/endpoint_selector.hpp>
#include <manifold/core/http_session.hpp>
#include <manifold/core/log.hpp>
#include <manifold/core/manifest.hpp>
#include <manifold/core/range_downloader.hpp>
#include <manifold/version.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>

using namespace manifold::core;

namespace chrono = std::chrono;

namespace manifold::cli {

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto value_of = [&](int& i, std::string_view option) -> std::optional<std::string> {
        if (i + 1 < argc) {
            return std::string(argv[++i]);
        }
        args.errors.push_back("missing value for " + std::string(option));
        return std::nullopt;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

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
        } else if (arg == "--no-fallback") {
            args.no_fallback = true;
        } else if (arg == "-d" || arg == "--directory") {
            if (auto v = value_of(i, arg)) args.directory = std::move(*v);
        } else if (arg == "-p" || arg == "--priorities") {
            if (auto v = value_of(i, arg)) args.priorities = std::move(*v);
        } else if (arg == "-c" || arg == "--config") {
            if (auto v = value_of(i, arg)) args.config_path = std::move(*v);
        } else if (arg.starts_with("-") && arg.size() > 1) {
            args.errors.push_back("unknown option " + arg);
        } else if (args.manifest.empty()) {
            args.manifest = arg;
        } else {
            args.errors.push_back("unexpected argument " + arg);
        }
    }

    return args;
}

std::expected<ClientConfig, std::error_code> resolve_config(const CliArgs& args) noexcept {
    ClientConfig config;
    if (!args.config_path.empty()) {
        auto loaded = ClientConfig::load(args.config_path);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }

    if (args.directory) config.destination = *args.directory;
    if (args.priorities) config.priorities = parse_priorities(*args.priorities);
    if (args.no_fallback) config.fallback = false;
    if (args.verbose) config.log_level = "debug";
    if (args.quiet) config.quiet = true;

    return config;
}

//=============================================================================
// Commands
//=============================================================================

namespace {

// Live display for the entry currently transferring
class ProgressDisplay {
public:
    void start(const FileEntry& entry) {
        finish();
        label_ = entry.id;
        started_ = chrono::steady_clock::now();
        bar_.reset();
        spinner_.reset();
    }

    void update(const TransferProgress& p) {
        auto elapsed = chrono::duration_cast<chrono::milliseconds>(
            chrono::steady_clock::now() - started_).count();
        std::uint64_t fresh = p.bytes_written - p.resumed_from;
        std::uint64_t speed = elapsed > 0 ? fresh * 1000 / static_cast<std::uint64_t>(elapsed) : 0;

        if (p.total_bytes > 0) {
            if (!bar_) bar_ = std::make_unique<ProgressBar>(p.total_bytes, label_);
            bar_->update(p.bytes_written, speed);
        } else {
            if (!spinner_) spinner_ = std::make_unique<Spinner>();
            spinner_->update(p.bytes_written);
        }
    }

    void finish() {
        if (bar_) bar_->finish();
        if (spinner_) spinner_->finish();
        bar_.reset();
        spinner_.reset();
    }

private:
    std::string label_;
    chrono::steady_clock::time_point started_;
    std::unique_ptr<ProgressBar> bar_;
    std::unique_ptr<Spinner> spinner_;
};

} // namespace

CliResult transfer(const CliArgs& args) noexcept {
    auto config = resolve_config(args);
    if (!config) {
        std::cerr << "Error: cannot load config " << args.config_path << ": "
                  << config.error().message() << std::endl;
        return std::unexpected(config.error());
    }

    log::init(log::level_from_name(config->log_level));

    std::error_code ec;
    std::filesystem::create_directories(config->destination, ec);
    if (ec) {
        spdlog::error("cannot create {}: {}", config->destination, ec.message());
        return std::unexpected(ec);
    }

    auto manifest = load_manifest(args.manifest);
    if (!manifest) {
        spdlog::error("cannot read manifest {}: {}", args.manifest, manifest.error().message());
        return std::unexpected(manifest.error());
    }
    spdlog::debug("{} entries in {}", manifest->size(), args.manifest);

    HttpSession::global_init();

    InstanceMetadataProbe probe;
    EndpointSelector selector(probe);
    RangeDownloader downloader;
    TransferDriver driver(*config, selector, downloader);

    ProgressDisplay display;
    if (!config->quiet) {
        driver.on_attempt([&](const FileEntry& entry, const std::string& url) {
            spdlog::debug("{}: trying {}", entry.id, url);
            display.start(entry);
        });
        downloader.callback([&](const TransferProgress& p) { display.update(p); });
    }

    auto report = driver.run(*manifest);
    display.finish();

    HttpSession::global_cleanup();

    if (!config->quiet) {
        print_summary(report);
    }

    return report.ok() ? 0 : 1;
}

void print_summary(const TransferReport& report) noexcept {
    std::size_t width = 4;
    for (const auto& e : report.entries) {
        width = std::max(width, e.id.size());
    }

    std::cout << "\n" << std::left << std::setw(static_cast<int>(width)) << "FILE"
              << "  " << std::setw(18) << "STATUS" << "  SOURCE\n";
    for (const auto& e : report.entries) {
        std::cout << std::left << std::setw(static_cast<int>(width)) << e.id
                  << "  " << std::setw(18) << to_string(e.status)
                  << "  " << (e.url.empty() ? "-" : e.url);
        if (e.error) {
            std::cout << " (" << e.error.message() << ")";
        }
        std::cout << "\n";
    }

    std::cout << "\n" << report.entries.size() << " files: "
              << report.count(EntryStatus::completed) << " downloaded, "
              << report.count(EntryStatus::already_complete) << " already present, "
              << report.count(EntryStatus::no_endpoint) << " skipped, "
              << (report.count(EntryStatus::checksum_failed)
                  + report.count(EntryStatus::source_error)
                  + report.count(EntryStatus::write_failed)) << " failed" << std::endl;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Manifold " << version.to_string() << " - manifest-driven multi-source transfer client\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <MANIFEST>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "  -v, --version            Show version information\n";
    std::cout << "  -V, --verbose            Debug logging, including libcurl traces\n";
    std::cout << "  -q, --quiet              No progress bar or summary\n";
    std::cout << "  -d, --directory <DIR>    Save files to DIR (default: .)\n";
    std::cout << "  -p, --priorities <LIST>  Protocol order, e.g. S3,HTTP,FTP\n";
    std::cout << "  -c, --config <FILE>      Read settings from a JSON file\n";
    std::cout << "      --no-fallback        Do not try other endpoints when one fails\n";
    std::cout << "\n";
    std::cout << "The manifest is a JSON object keyed by file id, or a TSV file with\n";
    std::cout << "file_id, md5 and urls columns. Interrupted transfers resume from\n";
    std::cout << "<file>.partial on the next run.\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " manifest.json\n";
    std::cout << "  " << program_name << " -d data -p S3,HTTP manifest.tsv\n";
}

void print_version() noexcept {
    std::cout << "Manifold " << version.to_string() << std::endl;
    std::cout << "\n";
    std::cout << "Built with C++23, libcurl, OpenSSL, spdlog, nlohmann::json\n";
}

} // namespace manifold::cli
