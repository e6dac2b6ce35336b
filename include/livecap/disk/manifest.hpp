// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <livecap/disk/error.hpp>
#include <livecap/media/segment.hpp>
#include <livecap/media/stream.hpp>
#include <expected>
#include <filesystem>
#include <unordered_map>
#include <vector>

namespace livecap::disk {

struct ManifestEntry {
    media::Segment segment;
    std::filesystem::path path;
};

// Per-stream list of persisted segments, in the order they were written
class CaptureManifest {
public:
    void append(const media::Stream& stream, media::Segment segment, std::filesystem::path path);

    // Streams in first-written order
    [[nodiscard]] const std::vector<media::Stream>& streams() const noexcept { return order_; }

    // Empty for a stream that never had a segment written
    [[nodiscard]] const std::vector<ManifestEntry>& entries(const media::Stream& stream) const;

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept { return order_.empty(); }

    // Sort every stream's entries by ordering key
    void sort();

    // <segments_dir>/manifest.json
    [[nodiscard]] static std::filesystem::path manifest_path(const std::filesystem::path& segments_dir);

    [[nodiscard]] std::error_code save(const std::filesystem::path& path) const noexcept;

    [[nodiscard]] static std::expected<CaptureManifest, std::error_code>
    load(const std::filesystem::path& path) noexcept;

private:
    std::vector<media::Stream> order_;
    std::unordered_map<media::Stream, std::vector<ManifestEntry>> entries_;
};

} // namespace livecap::disk
