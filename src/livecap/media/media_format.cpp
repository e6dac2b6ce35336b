// Copyright (c) 2026 changcheng967. All rights reserved.

#include <livecap/media/media_format.hpp>
#include <array>

namespace livecap::media {

namespace {

constexpr std::size_t TS_PACKET_SIZE = 188;
constexpr std::uint8_t TS_SYNC_BYTE = 0x47;
constexpr std::size_t ID3_HEADER_SIZE = 10;

constexpr std::array<std::string_view, 7> MP4_TOP_LEVEL_BOXES = {
    "ftyp", "styp", "moof", "moov", "sidx", "emsg", "prft",
};

bool is_mpeg_ts(std::span<const std::uint8_t> d) noexcept {
    if (d.size() < TS_PACKET_SIZE || d[0] != TS_SYNC_BYTE) {
        return false;
    }
    return d.size() == TS_PACKET_SIZE || d[TS_PACKET_SIZE] == TS_SYNC_BYTE;
}

bool is_mp4(std::span<const std::uint8_t> d) noexcept {
    if (d.size() < 8) {
        return false;
    }
    std::string_view type(reinterpret_cast<const char*>(d.data() + 4), 4);
    for (auto box : MP4_TOP_LEVEL_BOXES) {
        if (type == box) return true;
    }
    return false;
}

bool is_webvtt(std::span<const std::uint8_t> d) noexcept {
    std::string_view text(reinterpret_cast<const char*>(d.data()), d.size());
    if (text.starts_with("\xEF\xBB\xBF")) {
        text.remove_prefix(3);
    }
    return text.starts_with("WEBVTT");
}

// Skip an ID3v2 tag (packed audio segments start with one carrying the PTS)
std::span<const std::uint8_t> skip_id3(std::span<const std::uint8_t> d) noexcept {
    while (d.size() >= ID3_HEADER_SIZE && d[0] == 'I' && d[1] == 'D' && d[2] == '3') {
        std::size_t size = (static_cast<std::size_t>(d[6] & 0x7F) << 21)
                         | (static_cast<std::size_t>(d[7] & 0x7F) << 14)
                         | (static_cast<std::size_t>(d[8] & 0x7F) << 7)
                         | static_cast<std::size_t>(d[9] & 0x7F);
        size += ID3_HEADER_SIZE;
        if (d[5] & 0x10) {
            size += ID3_HEADER_SIZE;  // Footer present
        }
        if (size >= d.size()) {
            return {};
        }
        d = d.subspan(size);
    }
    return d;
}

std::optional<MediaFormat> detect_audio(std::span<const std::uint8_t> d) noexcept {
    if (d.size() < 2) {
        return std::nullopt;
    }
    if (d[0] == 0xFF && (d[1] & 0xF6) == 0xF0) {
        return MediaFormat::aac;
    }
    if (d[0] == 0xFF && (d[1] & 0xE0) == 0xE0 && ((d[1] >> 1) & 0x03) != 0) {
        return MediaFormat::mp3;
    }
    if (d[0] == 0x0B && d[1] == 0x77) {
        // bsid 0-10 is AC-3, 11-16 is E-AC-3
        if (d.size() >= 6 && (d[5] >> 3) > 10) {
            return MediaFormat::eac3;
        }
        return MediaFormat::ac3;
    }
    return std::nullopt;
}

} // namespace

std::expected<MediaFormat, std::error_code>
detect_format(std::span<const std::uint8_t> data) noexcept {
    if (data.empty()) {
        return std::unexpected(make_error_code(MediaErrc::unknown_format));
    }
    if (is_mpeg_ts(data)) {
        return MediaFormat::mpeg_ts;
    }
    if (is_mp4(data)) {
        return MediaFormat::mp4;
    }
    if (is_webvtt(data)) {
        return MediaFormat::webvtt;
    }
    if (auto audio = detect_audio(skip_id3(data))) {
        return *audio;
    }
    return std::unexpected(make_error_code(MediaErrc::unknown_format));
}

std::string_view extension(MediaFormat format) noexcept {
    switch (format) {
        case MediaFormat::mpeg_ts: return "ts";
        case MediaFormat::mp4:     return "mp4";
        case MediaFormat::webvtt:  return "vtt";
        case MediaFormat::aac:     return "aac";
        case MediaFormat::mp3:     return "mp3";
        case MediaFormat::ac3:     return "ac3";
        case MediaFormat::eac3:    return "eac3";
    }
    return "bin";
}

std::string_view to_string(MediaFormat format) noexcept {
    switch (format) {
        case MediaFormat::mpeg_ts: return "mpeg_ts";
        case MediaFormat::mp4:     return "mp4";
        case MediaFormat::webvtt:  return "webvtt";
        case MediaFormat::aac:     return "aac";
        case MediaFormat::mp3:     return "mp3";
        case MediaFormat::ac3:     return "ac3";
        case MediaFormat::eac3:    return "eac3";
    }
    return "unknown";
}

std::optional<MediaFormat> format_from_string(std::string_view name) noexcept {
    for (auto f : {MediaFormat::mpeg_ts, MediaFormat::mp4, MediaFormat::webvtt,
                   MediaFormat::aac, MediaFormat::mp3, MediaFormat::ac3, MediaFormat::eac3}) {
        if (to_string(f) == name) return f;
    }
    return std::nullopt;
}

} // namespace livecap::media
