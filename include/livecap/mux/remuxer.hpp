// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <livecap/disk/error.hpp>
#include <livecap/disk/manifest.hpp>
#include <livecap/media/stream.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace livecap::mux {

// Reassembles a capture's segment files into playable outputs
class Remuxer {
public:
    virtual ~Remuxer() = default;

    // Returns the files produced. `main_target` replaces the default output
    // path of the main stream.
    [[nodiscard]] virtual std::expected<std::vector<std::filesystem::path>, std::error_code>
    remux(const disk::CaptureManifest& manifest,
          const std::filesystem::path& output_dir,
          const std::optional<std::filesystem::path>& main_target) = 0;
};

// Concatenates each stream's segments in ordering-key order into one file.
// Repeated MP4 header boxes and WebVTT headers are dropped after the first file.
class ConcatRemuxer final : public Remuxer {
public:
    [[nodiscard]] std::expected<std::vector<std::filesystem::path>, std::error_code>
    remux(const disk::CaptureManifest& manifest,
          const std::filesystem::path& output_dir,
          const std::optional<std::filesystem::path>& main_target) override;

    // <output_dir>/<stem>.<ext>
    [[nodiscard]] static std::filesystem::path
    output_path(std::string_view stem, const std::vector<disk::ManifestEntry>& entries,
                const std::filesystem::path& output_dir);
};

// Offset of the first top-level box that is not ftyp or moov
[[nodiscard]] std::size_t skip_mp4_header(std::span<const std::uint8_t> data) noexcept;

// Offset just past the WEBVTT header block (first blank line)
[[nodiscard]] std::size_t skip_webvtt_header(std::span<const std::uint8_t> data) noexcept;

} // namespace livecap::mux
