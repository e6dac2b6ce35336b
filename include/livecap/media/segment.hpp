// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <livecap/core/url.hpp>
#include <livecap/media/media_format.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace livecap::media {

// Sub-range of a resource (EXT-X-BYTERANGE / EXT-X-MAP BYTERANGE)
struct ByteRange {
    std::optional<std::uint64_t> offset;   // Defaults to 0 when building a request
    std::uint64_t length{0};

    bool operator==(const ByteRange&) const = default;

    // "bytes=<offset>-<offset+length-1>"
    [[nodiscard]] std::string header_value() const;
};

enum class SegmentKind : std::uint8_t {
    initialization,  // Container header shared by the stream
    sequence         // Media chunk
};

// (discontinuity generation, sequence number), compared lexicographically
using SegmentKey = std::pair<std::uint64_t, std::uint64_t>;

// One fetchable unit of a stream
class Segment {
public:
    static Segment initialization(core::Url url, std::optional<ByteRange> range = std::nullopt);
    static Segment sequence(core::Url url, std::optional<ByteRange> range,
                            std::uint64_t discontinuity, std::uint64_t sequence);

    [[nodiscard]] SegmentKind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_initialization() const noexcept { return kind_ == SegmentKind::initialization; }
    [[nodiscard]] const core::Url& url() const noexcept { return url_; }
    [[nodiscard]] const std::optional<ByteRange>& byte_range() const noexcept { return byte_range_; }

    // Meaningful for sequence segments only
    [[nodiscard]] std::uint64_t discontinuity() const noexcept { return discontinuity_; }
    [[nodiscard]] std::uint64_t sequence() const noexcept { return sequence_; }
    [[nodiscard]] SegmentKey key() const noexcept { return {discontinuity_, sequence_}; }

    // Unset until the writer has inspected the bytes
    [[nodiscard]] const std::optional<MediaFormat>& format() const noexcept { return format_; }
    void format(MediaFormat f) noexcept { format_ = f; }

    // "init" or "d<10 digits>s<10 digits>"; sorts like key()
    [[nodiscard]] std::string id() const;

    // Range header value when the segment is a sub-range
    [[nodiscard]] std::optional<std::string> range_header() const;

    // Identity ignores the detected format
    bool operator==(const Segment& other) const noexcept {
        return kind_ == other.kind_
            && url_ == other.url_
            && byte_range_ == other.byte_range_
            && discontinuity_ == other.discontinuity_
            && sequence_ == other.sequence_;
    }

private:
    Segment(SegmentKind kind, core::Url url, std::optional<ByteRange> range,
            std::uint64_t discontinuity, std::uint64_t sequence)
        : kind_(kind)
        , url_(std::move(url))
        , byte_range_(std::move(range))
        , discontinuity_(discontinuity)
        , sequence_(sequence) {}

    SegmentKind kind_;
    core::Url url_;
    std::optional<ByteRange> byte_range_;
    std::uint64_t discontinuity_{0};
    std::uint64_t sequence_{0};
    std::optional<MediaFormat> format_;
};

} // namespace livecap::media
