// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <livecap/media/error.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string_view>

namespace livecap::media {

// Container of a downloaded segment, detected from its bytes
enum class MediaFormat : std::uint8_t {
    mpeg_ts,
    mp4,        // ISO-BMFF, usually fragmented
    webvtt,
    aac,        // ADTS, optionally behind an ID3 tag
    mp3,
    ac3,
    eac3,
};

// Classify segment bytes (after decryption and init prepending)
[[nodiscard]] std::expected<MediaFormat, std::error_code>
detect_format(std::span<const std::uint8_t> data) noexcept;

// File extension without the dot
[[nodiscard]] std::string_view extension(MediaFormat format) noexcept;

[[nodiscard]] std::string_view to_string(MediaFormat format) noexcept;
[[nodiscard]] std::optional<MediaFormat> format_from_string(std::string_view name) noexcept;

} // namespace livecap::media
