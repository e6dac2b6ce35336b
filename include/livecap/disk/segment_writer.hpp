// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <livecap/core/http_client.hpp>
#include <livecap/disk/error.hpp>
#include <livecap/disk/manifest.hpp>
#include <livecap/media/media_format.hpp>
#include <livecap/media/segment.hpp>
#include <livecap/media/stream.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace livecap::disk {

// Replace characters that are unsafe in a file name with '_'
[[nodiscard]] std::string sanitize_filename(std::string_view name);

// File name stem of each stream: its sanitized display name, suffixed with
// "_2", "_3", ... when sanitizing makes two streams collide.
class FileStems {
public:
    FileStems() = default;

    // Assign stems in a fixed order so the same streams always get the same
    // names. Streams whose display name is already safe win collisions.
    explicit FileStems(std::vector<media::Stream> streams);

    // Streams not seen before get the next free stem
    [[nodiscard]] const std::string& stem(const media::Stream& stream);

private:
    std::unordered_map<media::Stream, std::string> stems_;
    std::unordered_set<std::string> used_;
};

// Outcome of persisting one sequence segment
struct WriteResult {
    media::Stream stream;
    media::Segment segment;
    std::expected<std::filesystem::path, std::error_code> path;
};

// Persists completed segments under one directory. Not thread-safe: a single
// consumer feeds it in completion order.
class SegmentWriter {
public:
    explicit SegmentWriter(std::filesystem::path segments_dir, std::vector<media::Stream> streams = {});

    // Create the segments directory
    [[nodiscard]] std::error_code prepare() noexcept;

    // Initialization segments are cached and release the sequence segments
    // held for their stream. A sequence segment with `needs_initialization`
    // is held until its stream's initialization arrives or fails; any other is
    // written at once with the cached initialization bytes prepended.
    // Returns the segments written by this call.
    [[nodiscard]] std::vector<WriteResult>
    write(const media::Stream& stream, media::Segment segment, const core::Bytes& bytes,
          bool needs_initialization = false);

    // The stream's initialization could not be fetched: write what is held
    // as is, and stop holding for that stream
    [[nodiscard]] std::vector<WriteResult> initialization_failed(const media::Stream& stream);

    // Write everything still held
    [[nodiscard]] std::vector<WriteResult> flush();

    [[nodiscard]] std::size_t held() const noexcept;

    [[nodiscard]] const CaptureManifest& manifest() const noexcept { return manifest_; }
    [[nodiscard]] CaptureManifest take_manifest() noexcept { return std::move(manifest_); }

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return dir_; }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return bytes_written_; }

    // "segment_<stem>_d<10>s<10>.<ext>"; sorts like the ordering key
    [[nodiscard]] static std::string segment_filename(std::string_view stem,
                                                      const media::Segment& segment,
                                                      media::MediaFormat format);

    // Same, with the stream's sanitized display name as the stem
    [[nodiscard]] static std::string segment_filename(const media::Stream& stream,
                                                      const media::Segment& segment,
                                                      media::MediaFormat format);

private:
    using Held = std::vector<std::pair<media::Segment, core::Bytes>>;

    [[nodiscard]] WriteResult write_file(const media::Stream& stream, media::Segment segment,
                                         const core::Bytes& bytes);
    [[nodiscard]] std::vector<WriteResult> release(const media::Stream& stream);

    std::filesystem::path dir_;
    FileStems stems_;
    std::unordered_map<media::Stream, core::Bytes> init_cache_;
    std::unordered_set<media::Stream> init_failed_;
    std::unordered_map<media::Stream, Held> held_;
    CaptureManifest manifest_;
    std::uint64_t bytes_written_{0};
};

} // namespace livecap::disk
