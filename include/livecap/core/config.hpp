// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <filesystem>
#include <optional>

namespace livecap::core {

constexpr std::uint32_t DEFAULT_TIMEOUT_SEC = 30;
constexpr std::uint32_t DEFAULT_MAX_RETRIES = 3;
constexpr std::uint32_t DEFAULT_MAX_CONCURRENT_DOWNLOADS = 4;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 15;
constexpr std::uint32_t MAX_REDIRECTS = 10;

// Exponential backoff bounds for transient failures
constexpr std::chrono::milliseconds RETRY_MIN_BACKOFF{1000};
constexpr std::chrono::milliseconds RETRY_MAX_BACKOFF{10000};
constexpr std::uint32_t RETRY_BACKOFF_EXPONENT = 2;

constexpr std::size_t READ_BUFFER_SIZE = 256 * 1024;            // 256 KB

constexpr const char* SEGMENTS_DIRECTORY = "segments";
constexpr const char* MANIFEST_FILENAME = "manifest.json";

// Network behaviour shared by every request of a capture
struct NetworkOptions {
    std::uint32_t timeout_sec{DEFAULT_TIMEOUT_SEC};
    std::uint32_t max_retries{DEFAULT_MAX_RETRIES};
    std::uint32_t max_concurrent_downloads{DEFAULT_MAX_CONCURRENT_DOWNLOADS};
};

// Options for a single capture run
struct DownloadOptions {
    std::filesystem::path output_dir{"."};
    bool fail_fast{true};
    bool remux{true};
    std::optional<std::filesystem::path> remux_target;  // Relative to output_dir
};

} // namespace livecap::core
