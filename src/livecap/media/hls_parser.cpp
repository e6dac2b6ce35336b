// Copyright (c) 2026 changcheng967. All rights reserved.

#include <livecap/media/hls_parser.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <exception>

namespace livecap::media {

namespace {

constexpr std::string_view TAG_HEADER = "#EXTM3U";
constexpr std::string_view TAG_EXTINF = "#EXTINF:";
constexpr std::string_view TAG_STREAM_INF = "#EXT-X-STREAM-INF:";
constexpr std::string_view TAG_MEDIA = "#EXT-X-MEDIA:";
constexpr std::string_view TAG_TARGET_DURATION = "#EXT-X-TARGETDURATION:";
constexpr std::string_view TAG_MEDIA_SEQUENCE = "#EXT-X-MEDIA-SEQUENCE:";
constexpr std::string_view TAG_DISCONTINUITY_SEQUENCE = "#EXT-X-DISCONTINUITY-SEQUENCE:";
constexpr std::string_view TAG_DISCONTINUITY = "#EXT-X-DISCONTINUITY";
constexpr std::string_view TAG_ENDLIST = "#EXT-X-ENDLIST";
constexpr std::string_view TAG_BYTERANGE = "#EXT-X-BYTERANGE:";
constexpr std::string_view TAG_KEY = "#EXT-X-KEY:";
constexpr std::string_view TAG_MAP = "#EXT-X-MAP:";

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

template<typename T>
std::optional<T> parse_number(std::string_view s) noexcept {
    s = trim(s);
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

// "<length>[@<offset>]"
std::optional<ByteRange> parse_byte_range(std::string_view value) noexcept {
    ByteRange range;
    auto at_pos = value.find('@');
    auto length = parse_number<std::uint64_t>(value.substr(0, at_pos));
    if (!length) {
        return std::nullopt;
    }
    range.length = *length;
    if (at_pos != std::string_view::npos) {
        auto offset = parse_number<std::uint64_t>(value.substr(at_pos + 1));
        if (!offset) {
            return std::nullopt;
        }
        range.offset = *offset;
    }
    return range;
}

std::optional<std::string> attribute(const std::map<std::string, std::string>& attrs,
                                     const std::string& name) {
    auto it = attrs.find(name);
    if (it == attrs.end()) {
        return std::nullopt;
    }
    return it->second;
}

// Non-empty, comment-free lines with trailing \r removed
std::vector<std::string_view> split_lines(std::string_view content) {
    std::vector<std::string_view> lines;
    std::size_t pos = 0;
    while (pos < content.size()) {
        auto end = content.find('\n', pos);
        if (end == std::string_view::npos) {
            end = content.size();
        }
        auto line = trim(content.substr(pos, end - pos));
        if (!line.empty()) {
            lines.push_back(line);
        }
        pos = end + 1;
    }
    return lines;
}

std::expected<std::vector<std::string_view>, std::error_code>
checked_lines(std::string_view content) {
    if (content.starts_with("\xEF\xBB\xBF")) {
        content.remove_prefix(3);
    }
    auto lines = split_lines(content);
    if (lines.empty()) {
        return std::unexpected(make_error_code(MediaErrc::empty_playlist));
    }
    if (lines.front() != TAG_HEADER) {
        return std::unexpected(make_error_code(MediaErrc::not_a_playlist));
    }
    return lines;
}

std::expected<HLSMediaPlaylist, std::error_code>
parse_media_lines(const std::vector<std::string_view>& lines) {
    HLSMediaPlaylist playlist;
    HLSSegment pending;

    // For BYTERANGE entries that omit the offset
    std::string last_range_uri;
    std::uint64_t next_range_offset = 0;

    for (auto line : lines) {
        if (line.front() != '#') {
            pending.uri = std::string(line);

            if (pending.byte_range) {
                auto& range = *pending.byte_range;
                if (!range.offset && last_range_uri == pending.uri) {
                    range.offset = next_range_offset;
                }
                next_range_offset = range.offset.value_or(0) + range.length;
                last_range_uri = pending.uri;
            }

            playlist.segments.push_back(std::move(pending));
            pending = HLSSegment{};
            continue;
        }

        if (line.starts_with(TAG_TARGET_DURATION)) {
            auto val = parse_number<double>(line.substr(TAG_TARGET_DURATION.size()));
            if (!val || !std::isfinite(*val) || *val < 0.0) {
                return std::unexpected(make_error_code(MediaErrc::malformed_tag));
            }
            playlist.target_duration = *val;
        } else if (line.starts_with(TAG_MEDIA_SEQUENCE)) {
            auto val = parse_number<std::uint64_t>(line.substr(TAG_MEDIA_SEQUENCE.size()));
            if (!val) {
                return std::unexpected(make_error_code(MediaErrc::malformed_tag));
            }
            playlist.media_sequence = *val;
        } else if (line.starts_with(TAG_DISCONTINUITY_SEQUENCE)) {
            auto val = parse_number<std::uint64_t>(line.substr(TAG_DISCONTINUITY_SEQUENCE.size()));
            if (!val) {
                return std::unexpected(make_error_code(MediaErrc::malformed_tag));
            }
            playlist.discontinuity_sequence = *val;
        } else if (line == TAG_DISCONTINUITY) {
            pending.discontinuity = true;
        } else if (line == TAG_ENDLIST) {
            playlist.end_list = true;
        } else if (line.starts_with(TAG_EXTINF)) {
            auto val = line.substr(TAG_EXTINF.size());
            auto comma_pos = val.find(',');
            auto duration = parse_number<double>(val.substr(0, comma_pos));
            if (!duration || !std::isfinite(*duration)) {
                return std::unexpected(make_error_code(MediaErrc::malformed_tag));
            }
            pending.duration = *duration;
        } else if (line.starts_with(TAG_BYTERANGE)) {
            auto range = parse_byte_range(line.substr(TAG_BYTERANGE.size()));
            if (!range) {
                return std::unexpected(make_error_code(MediaErrc::malformed_tag));
            }
            pending.byte_range = *range;
        } else if (line.starts_with(TAG_KEY)) {
            auto attrs = HLSParser::parse_attributes(line.substr(TAG_KEY.size()));
            auto method = attribute(attrs, "METHOD");
            if (!method) {
                return std::unexpected(make_error_code(MediaErrc::malformed_tag));
            }
            pending.key = HLSKey{*method, attribute(attrs, "URI"),
                                 attribute(attrs, "IV"), attribute(attrs, "KEYFORMAT")};
        } else if (line.starts_with(TAG_MAP)) {
            auto attrs = HLSParser::parse_attributes(line.substr(TAG_MAP.size()));
            auto uri = attribute(attrs, "URI");
            if (!uri) {
                return std::unexpected(make_error_code(MediaErrc::missing_uri));
            }
            HLSMap map{*uri, std::nullopt};
            if (auto br = attribute(attrs, "BYTERANGE")) {
                map.byte_range = parse_byte_range(*br);
                if (!map.byte_range) {
                    return std::unexpected(make_error_code(MediaErrc::malformed_tag));
                }
            }
            pending.map = std::move(map);
        } else if (line.starts_with(TAG_STREAM_INF)) {
            // Master playlist handed to the media parser
            return std::unexpected(make_error_code(MediaErrc::not_a_playlist));
        }
    }

    return playlist;
}

std::expected<HLSMasterPlaylist, std::error_code>
parse_master_lines(const std::vector<std::string_view>& lines) {
    HLSMasterPlaylist playlist;
    std::optional<HLSVariant> pending;

    for (auto line : lines) {
        if (line.front() != '#') {
            if (pending) {
                pending->uri = std::string(line);
                playlist.variants.push_back(std::move(*pending));
                pending.reset();
            }
            continue;
        }

        if (line.starts_with(TAG_STREAM_INF)) {
            if (pending) {
                return std::unexpected(make_error_code(MediaErrc::missing_uri));
            }
            auto attrs = HLSParser::parse_attributes(line.substr(TAG_STREAM_INF.size()));
            HLSVariant variant;
            variant.bandwidth = attribute(attrs, "BANDWIDTH").value_or("");
            variant.resolution = attribute(attrs, "RESOLUTION");
            variant.codecs = attribute(attrs, "CODECS");
            variant.audio = attribute(attrs, "AUDIO");
            variant.video = attribute(attrs, "VIDEO");
            variant.subtitles = attribute(attrs, "SUBTITLES");
            pending = std::move(variant);
        } else if (line.starts_with(TAG_MEDIA)) {
            auto attrs = HLSParser::parse_attributes(line.substr(TAG_MEDIA.size()));
            auto type = attribute(attrs, "TYPE");
            auto group_id = attribute(attrs, "GROUP-ID");
            auto name = attribute(attrs, "NAME");
            if (!type || !group_id || !name) {
                return std::unexpected(make_error_code(MediaErrc::malformed_tag));
            }

            HLSAlternative alt;
            if (*type == "AUDIO") {
                alt.type = HLSMediaType::audio;
            } else if (*type == "VIDEO") {
                alt.type = HLSMediaType::video;
            } else if (*type == "SUBTITLES") {
                alt.type = HLSMediaType::subtitles;
            } else if (*type == "CLOSED-CAPTIONS") {
                alt.type = HLSMediaType::closed_captions;
            } else {
                return std::unexpected(make_error_code(MediaErrc::malformed_tag));
            }
            alt.group_id = *group_id;
            alt.name = *name;
            alt.language = attribute(attrs, "LANGUAGE");
            alt.uri = attribute(attrs, "URI");
            playlist.alternatives.push_back(std::move(alt));
        }
    }

    if (pending) {
        return std::unexpected(make_error_code(MediaErrc::missing_uri));
    }

    return playlist;
}

bool looks_like_master(const std::vector<std::string_view>& lines) noexcept {
    return std::any_of(lines.begin(), lines.end(), [](std::string_view line) {
        return line.starts_with(TAG_STREAM_INF) || line.starts_with(TAG_MEDIA);
    });
}

} // namespace

std::optional<std::uint64_t> HLSVariant::bandwidth_bps() const noexcept {
    return parse_number<std::uint64_t>(bandwidth);
}

std::map<std::string, std::string> HLSParser::parse_attributes(std::string_view list) {
    std::map<std::string, std::string> attrs;
    std::size_t pos = 0;

    while (pos < list.size()) {
        auto eq = list.find('=', pos);
        if (eq == std::string_view::npos) {
            break;
        }
        auto name = trim(list.substr(pos, eq - pos));

        std::string value;
        std::size_t next = eq + 1;
        if (next < list.size() && list[next] == '"') {
            auto close = list.find('"', next + 1);
            if (close == std::string_view::npos) {
                close = list.size();
            }
            value = std::string(list.substr(next + 1, close - next - 1));
            next = list.find(',', close);
        } else {
            auto comma = list.find(',', next);
            value = std::string(trim(list.substr(next, comma == std::string_view::npos
                                                           ? std::string_view::npos
                                                           : comma - next)));
            next = comma;
        }

        attrs[std::string(name)] = std::move(value);
        if (next == std::string_view::npos) {
            break;
        }
        pos = next + 1;
    }

    return attrs;
}

std::expected<HLSPlaylist, std::error_code>
HLSParser::parse(std::string_view content) noexcept {
    try {
        auto lines = checked_lines(content);
        if (!lines) {
            return std::unexpected(lines.error());
        }
        if (looks_like_master(*lines)) {
            auto master = parse_master_lines(*lines);
            if (!master) return std::unexpected(master.error());
            return HLSPlaylist{std::move(*master)};
        }
        auto media = parse_media_lines(*lines);
        if (!media) return std::unexpected(media.error());
        return HLSPlaylist{std::move(*media)};
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(MediaErrc::malformed_tag));
    }
}

std::expected<HLSMasterPlaylist, std::error_code>
HLSParser::parse_master(std::string_view content) noexcept {
    try {
        auto lines = checked_lines(content);
        if (!lines) {
            return std::unexpected(lines.error());
        }
        return parse_master_lines(*lines);
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(MediaErrc::malformed_tag));
    }
}

std::expected<HLSMediaPlaylist, std::error_code>
HLSParser::parse_media(std::string_view content) noexcept {
    try {
        auto lines = checked_lines(content);
        if (!lines) {
            return std::unexpected(lines.error());
        }
        return parse_media_lines(*lines);
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(MediaErrc::malformed_tag));
    }
}

} // namespace livecap::media
