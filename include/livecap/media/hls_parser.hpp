// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <livecap/media/error.hpp>
#include <livecap/media/segment.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace livecap::media {

// EXT-X-KEY
struct HLSKey {
    std::string method;                   // NONE, AES-128, SAMPLE-AES, ...
    std::optional<std::string> uri;
    std::optional<std::string> iv;        // "0x..." as written
    std::optional<std::string> keyformat;

    bool operator==(const HLSKey&) const = default;
};

// EXT-X-MAP
struct HLSMap {
    std::string uri;
    std::optional<ByteRange> byte_range;
};

// Media segment entry. Key and map are recorded on the segment that follows
// the tag only; later segments inherit them implicitly.
struct HLSSegment {
    std::string uri;
    double duration{0.0};
    std::optional<ByteRange> byte_range;
    bool discontinuity{false};
    std::optional<HLSKey> key;
    std::optional<HLSMap> map;
};

struct HLSMediaPlaylist {
    double target_duration{0.0};            // Seconds
    std::uint64_t media_sequence{0};
    std::uint64_t discontinuity_sequence{0};
    bool end_list{false};
    std::vector<HLSSegment> segments;
};

// EXT-X-STREAM-INF
struct HLSVariant {
    std::string uri;
    std::string bandwidth;                  // As written; may not be numeric
    std::optional<std::string> resolution;
    std::optional<std::string> codecs;
    std::optional<std::string> audio;       // GROUP-ID references
    std::optional<std::string> video;
    std::optional<std::string> subtitles;

    [[nodiscard]] std::optional<std::uint64_t> bandwidth_bps() const noexcept;
};

enum class HLSMediaType {
    audio,
    video,
    subtitles,
    closed_captions
};

// EXT-X-MEDIA
struct HLSAlternative {
    HLSMediaType type{HLSMediaType::audio};
    std::string group_id;
    std::string name;
    std::optional<std::string> language;
    std::optional<std::string> uri;
};

struct HLSMasterPlaylist {
    std::vector<HLSVariant> variants;
    std::vector<HLSAlternative> alternatives;
};

using HLSPlaylist = std::variant<HLSMasterPlaylist, HLSMediaPlaylist>;

// HLS M3U8 parser
class HLSParser {
public:
    // Parse either playlist kind
    [[nodiscard]] static std::expected<HLSPlaylist, std::error_code>
    parse(std::string_view content) noexcept;

    [[nodiscard]] static std::expected<HLSMasterPlaylist, std::error_code>
    parse_master(std::string_view content) noexcept;

    [[nodiscard]] static std::expected<HLSMediaPlaylist, std::error_code>
    parse_media(std::string_view content) noexcept;

    // Attribute list: KEY=VALUE,KEY="quoted, value"
    [[nodiscard]] static std::map<std::string, std::string>
    parse_attributes(std::string_view list);
};

} // namespace livecap::media
