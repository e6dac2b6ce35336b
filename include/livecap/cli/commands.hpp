// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <livecap/core/config.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace livecap::cli {

// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_CAPTURE_FAILED = 1;
constexpr int EXIT_USAGE = 2;

// Command line arguments; unset options fall back to the config file, then defaults
struct CliArgs {
    std::string url;
    std::optional<std::filesystem::path> output_dir;
    std::optional<std::filesystem::path> config_file;
    std::optional<std::filesystem::path> remux_to;
    std::optional<std::uint32_t> timeout_sec;
    std::optional<std::uint32_t> max_retries;
    std::optional<std::uint32_t> jobs;
    bool no_fail_fast{false};
    bool no_remux{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;          // Set on a usage error
};

// Effective settings of a capture run
struct CaptureConfig {
    core::NetworkOptions network;
    core::DownloadOptions download;
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Apply a JSON config file onto `config`
[[nodiscard]] std::error_code load_config_file(const std::filesystem::path& path,
                                               CaptureConfig& config) noexcept;

// Defaults, then the config file, then command line flags
[[nodiscard]] std::expected<CaptureConfig, std::error_code> build_config(const CliArgs& args) noexcept;

// Capture a live stream; returns the process exit code
[[nodiscard]] int run_capture(const std::string& url, const CaptureConfig& config, bool quiet) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace livecap::cli
