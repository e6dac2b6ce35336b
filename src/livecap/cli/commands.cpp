// Copyright (c) 2026 changcheng967. All rights reserved.

#include <livecap/cli/commands.hpp>
#include <livecap/cli/status_line.hpp>
#include <livecap/capture/live_capture.hpp>
#include <livecap/core/http_client.hpp>
#include <livecap/core/url.hpp>
#include <livecap/disk/error.hpp>
#include <livecap/version.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <thread>

namespace chrono = std::chrono;

namespace livecap::cli {

namespace {

std::atomic<bool> g_interrupted{false};

void on_interrupt(int) {
    g_interrupted.store(true);
}

std::optional<std::uint32_t> parse_count(const char* text) noexcept {
    char* end = nullptr;
    unsigned long value = std::strtoul(text, &end, 10);
    if (end == text || *end != '\0' || value > UINT32_MAX) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(value);
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto value = [&](int& i, std::string_view name) -> const char* {
        if (i + 1 >= argc) {
            args.error = std::string(name) + " requires a value";
            return nullptr;
        }
        return argv[++i];
    };

    auto count = [&](int& i, std::string_view name, std::optional<std::uint32_t>& out) {
        if (const char* v = value(i, name)) {
            out = parse_count(v);
            if (!out) {
                args.error = std::string(name) + " expects a non-negative integer";
            }
        }
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
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
        } else if (arg == "-o" || arg == "--output") {
            if (const char* v = value(i, arg)) args.output_dir = v;
        } else if (arg == "-c" || arg == "--config") {
            if (const char* v = value(i, arg)) args.config_file = v;
        } else if (arg == "--remux-to") {
            if (const char* v = value(i, arg)) args.remux_to = v;
        } else if (arg == "-t" || arg == "--timeout") {
            count(i, arg, args.timeout_sec);
        } else if (arg == "-r" || arg == "--retries") {
            count(i, arg, args.max_retries);
        } else if (arg == "-j" || arg == "--jobs") {
            count(i, arg, args.jobs);
        } else if (arg == "--no-fail-fast") {
            args.no_fail_fast = true;
        } else if (arg == "--no-remux") {
            args.no_remux = true;
        } else if (arg.starts_with("-")) {
            args.error = "Unknown option " + arg;
        } else if (!args.url.empty()) {
            args.error = "Only one URL may be given";
        } else {
            args.url = arg;
        }
    }

    if (args.error.empty() && args.jobs && *args.jobs == 0) {
        args.error = "--jobs must be at least 1";
    }

    return args;
}

//=============================================================================
// Configuration
//=============================================================================

std::error_code load_config_file(const std::filesystem::path& path, CaptureConfig& config) noexcept {
    try {
        std::ifstream file(path);
        if (!file) {
            return make_error_code(disk::DiskErrc::open_failed);
        }

        auto j = nlohmann::json::parse(file);
        if (!j.is_object()) {
            return std::make_error_code(std::errc::invalid_argument);
        }

        if (j.contains("output")) {
            config.download.output_dir = j["output"].get<std::string>();
        }
        if (j.contains("timeout")) {
            config.network.timeout_sec = j["timeout"].get<std::uint32_t>();
        }
        if (j.contains("retries")) {
            config.network.max_retries = j["retries"].get<std::uint32_t>();
        }
        if (j.contains("jobs")) {
            config.network.max_concurrent_downloads = j["jobs"].get<std::uint32_t>();
            if (config.network.max_concurrent_downloads == 0) {
                return std::make_error_code(std::errc::invalid_argument);
            }
        }
        if (j.contains("fail_fast")) {
            config.download.fail_fast = j["fail_fast"].get<bool>();
        }
        if (j.contains("remux")) {
            config.download.remux = j["remux"].get<bool>();
        }
        if (j.contains("remux_to")) {
            config.download.remux_target = j["remux_to"].get<std::string>();
        }

        return {};
    } catch (const std::exception& e) {
        spdlog::error("Invalid config file {}: {}", path.string(), e.what());
        return std::make_error_code(std::errc::invalid_argument);
    }
}

std::expected<CaptureConfig, std::error_code> build_config(const CliArgs& args) noexcept {
    CaptureConfig config;

    if (args.config_file) {
        if (auto ec = load_config_file(*args.config_file, config)) {
            return std::unexpected(ec);
        }
    }

    if (args.output_dir) config.download.output_dir = *args.output_dir;
    if (args.timeout_sec) config.network.timeout_sec = *args.timeout_sec;
    if (args.max_retries) config.network.max_retries = *args.max_retries;
    if (args.jobs) config.network.max_concurrent_downloads = *args.jobs;
    if (args.no_fail_fast) config.download.fail_fast = false;
    if (args.no_remux) config.download.remux = false;
    if (args.remux_to) config.download.remux_target = *args.remux_to;

    return config;
}

//=============================================================================
// Commands
//=============================================================================

int run_capture(const std::string& url_str, const CaptureConfig& config, bool quiet) noexcept {
    auto url = core::Url::parse(url_str);
    if (!url) {
        spdlog::error("Invalid URL {}: {}", url_str, url.error().message());
        return EXIT_USAGE;
    }

    core::CurlHttpClient::global_init();

    auto created = capture::LiveCapture::create(*url, config.network);
    if (!created) {
        spdlog::error("Failed to start capture: {}", created.error().message());
        core::CurlHttpClient::global_cleanup();
        return EXIT_CAPTURE_FAILED;
    }
    auto& [live, stopper] = *created;

    spdlog::info("Capturing {} stream(s) into {}", live.streams().size(),
                 config.download.output_dir.string());

    // Ctrl-C ends the pollers; segments already requested still finish
    g_interrupted.store(false);
    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);
    std::jthread watcher([stopper = stopper](std::stop_token stoken) mutable {
        while (!stoken.stop_requested()) {
            if (g_interrupted.load()) {
                spdlog::warn("Interrupted, finishing in-flight segments");
                stopper.stop();
                return;
            }
            std::this_thread::sleep_for(chrono::milliseconds(100));
        }
    });

    StatusLine status;
    if (!quiet) {
        live.callback([&status](const capture::CaptureProgress& p) { status.update(p); });
    }

    std::error_code ec;
    try {
        ec = live.download(config.download);
    } catch (const std::exception& e) {
        spdlog::error("Capture aborted: {}", e.what());
        ec = make_error_code(capture::CaptureErrc::write_error);
    }

    if (!quiet) status.finish();

    watcher.request_stop();
    watcher.join();
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    core::CurlHttpClient::global_cleanup();

    if (ec) {
        spdlog::error("Capture failed: {}", ec.message());
        return EXIT_CAPTURE_FAILED;
    }

    spdlog::info("Saved {} segment(s)", live.manifest().size());
    for (const auto& output : live.outputs()) {
        spdlog::info("Wrote {}", output.string());
    }
    return EXIT_OK;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "livecap - capture HLS live streams to disk\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             Only log warnings and errors, no status line\n";
    std::cout << "  -o, --output <DIR>      Output directory (default: .)\n";
    std::cout << "  -t, --timeout <SEC>     Per-request timeout (default: " << core::DEFAULT_TIMEOUT_SEC << ")\n";
    std::cout << "  -r, --retries <N>       Retries for transient failures (default: " << core::DEFAULT_MAX_RETRIES << ")\n";
    std::cout << "  -j, --jobs <N>          Concurrent segment downloads (default: " << core::DEFAULT_MAX_CONCURRENT_DOWNLOADS << ")\n";
    std::cout << "      --no-fail-fast      Keep other streams running when one fails\n";
    std::cout << "      --no-remux          Keep only the segment files\n";
    std::cout << "      --remux-to <FILE>   Remux the main stream into FILE\n";
    std::cout << "  -c, --config <FILE>     Read options from a JSON file\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/live/master.m3u8\n";
    std::cout << "  " << program_name << " -o capture -j 8 --remux-to show.ts https://example.com/live.m3u8\n";
}

void print_version() noexcept {
    std::cout << PROJECT_NAME << " " << version.to_string() << std::endl;
    std::cout << "Built with C++23, libcurl, OpenSSL, spdlog\n";
}

} // namespace livecap::cli
