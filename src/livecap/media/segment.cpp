// Copyright (c) 2026 changcheng967. All rights reserved.

#include <livecap/media/segment.hpp>
#include <format>

namespace livecap::media {

std::string ByteRange::header_value() const {
    std::uint64_t start = offset.value_or(0);
    std::uint64_t end = start + (length > 0 ? length - 1 : 0);
    return std::format("bytes={}-{}", start, end);
}

Segment Segment::initialization(core::Url url, std::optional<ByteRange> range) {
    return Segment(SegmentKind::initialization, std::move(url), std::move(range), 0, 0);
}

Segment Segment::sequence(core::Url url, std::optional<ByteRange> range,
                          std::uint64_t discontinuity, std::uint64_t sequence) {
    return Segment(SegmentKind::sequence, std::move(url), std::move(range), discontinuity, sequence);
}

std::string Segment::id() const {
    if (kind_ == SegmentKind::initialization) {
        return "init";
    }
    return std::format("d{:010}s{:010}", discontinuity_, sequence_);
}

std::optional<std::string> Segment::range_header() const {
    if (!byte_range_) {
        return std::nullopt;
    }
    return byte_range_->header_value();
}

} // namespace livecap::media
