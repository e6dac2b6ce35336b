// Copyright (c) 2026 changcheng967. All rights reserved.

#include <livecap/disk/segment_writer.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <tuple>

namespace livecap::disk {

std::string sanitize_filename(std::string_view name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        bool safe = std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
        result += safe ? c : '_';
    }
    return result;
}

//=============================================================================
// FileStems
//=============================================================================

FileStems::FileStems(std::vector<media::Stream> streams) {
    auto order = [](const media::Stream& s) {
        auto display = s.display();
        bool renamed = sanitize_filename(display) != display;
        return std::tuple{renamed, std::move(display), s.lang().has_value(), s.lang().value_or("")};
    };
    std::sort(streams.begin(), streams.end(), [&](const media::Stream& a, const media::Stream& b) {
        return order(a) < order(b);
    });
    for (const auto& stream : streams) {
        (void)stem(stream);
    }
}

const std::string& FileStems::stem(const media::Stream& stream) {
    if (auto it = stems_.find(stream); it != stems_.end()) {
        return it->second;
    }

    auto base = sanitize_filename(stream.display());
    auto candidate = base;
    for (int n = 2; used_.contains(candidate); ++n) {
        candidate = std::format("{}_{}", base, n);
    }
    if (candidate != base) {
        spdlog::debug("Stream {} saved as {} to avoid a file name clash", stream.display(), candidate);
    }

    used_.insert(candidate);
    return stems_.emplace(stream, std::move(candidate)).first->second;
}

//=============================================================================
// SegmentWriter
//=============================================================================

SegmentWriter::SegmentWriter(std::filesystem::path segments_dir, std::vector<media::Stream> streams)
    : dir_(std::move(segments_dir))
    , stems_(std::move(streams)) {}

std::error_code SegmentWriter::prepare() noexcept {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        spdlog::error("Failed to create {}: {}", dir_.string(), ec.message());
        return make_error_code(DiskErrc::create_directory_failed);
    }
    return {};
}

std::string SegmentWriter::segment_filename(std::string_view stem,
                                            const media::Segment& segment,
                                            media::MediaFormat format) {
    return std::format("segment_{}_{}.{}", stem, segment.id(), media::extension(format));
}

std::string SegmentWriter::segment_filename(const media::Stream& stream,
                                            const media::Segment& segment,
                                            media::MediaFormat format) {
    return segment_filename(sanitize_filename(stream.display()), segment, format);
}

std::vector<WriteResult>
SegmentWriter::write(const media::Stream& stream, media::Segment segment, const core::Bytes& bytes,
                     bool needs_initialization) {
    if (segment.is_initialization()) {
        init_cache_[stream] = bytes;
        spdlog::debug("Cached {} byte initialization segment for {}", bytes.size(), stream.display());
        return release(stream);
    }

    bool waiting = needs_initialization
        && !init_cache_.contains(stream)
        && !init_failed_.contains(stream);
    if (waiting) {
        spdlog::trace("Holding {} until the initialization segment of {} arrives",
                      segment.url().full(), stream.display());
        held_[stream].emplace_back(std::move(segment), bytes);
        return {};
    }

    std::vector<WriteResult> results;
    results.push_back(write_file(stream, std::move(segment), bytes));
    return results;
}

std::vector<WriteResult> SegmentWriter::initialization_failed(const media::Stream& stream) {
    init_failed_.insert(stream);
    auto it = held_.find(stream);
    if (it != held_.end() && !it->second.empty()) {
        spdlog::warn("Writing {} segment(s) of {} without an initialization segment",
                     it->second.size(), stream.display());
    }
    return release(stream);
}

std::vector<WriteResult> SegmentWriter::flush() {
    std::vector<WriteResult> results;
    while (!held_.empty()) {
        auto stream = held_.begin()->first;
        for (auto& result : initialization_failed(stream)) {
            results.push_back(std::move(result));
        }
    }
    return results;
}

std::size_t SegmentWriter::held() const noexcept {
    std::size_t total = 0;
    for (const auto& [stream, segments] : held_) {
        total += segments.size();
    }
    return total;
}

std::vector<WriteResult> SegmentWriter::release(const media::Stream& stream) {
    std::vector<WriteResult> results;
    auto node = held_.extract(stream);
    if (node.empty()) {
        return results;
    }
    for (auto& [segment, bytes] : node.mapped()) {
        results.push_back(write_file(stream, std::move(segment), bytes));
    }
    return results;
}

WriteResult SegmentWriter::write_file(const media::Stream& stream, media::Segment segment,
                                      const core::Bytes& bytes) {
    // Every written segment is decodable on its own
    core::Bytes data;
    if (auto it = init_cache_.find(stream); it != init_cache_.end()) {
        data.reserve(it->second.size() + bytes.size());
        data.insert(data.end(), it->second.begin(), it->second.end());
    }
    data.insert(data.end(), bytes.begin(), bytes.end());

    auto format = media::detect_format(data);
    if (!format) {
        return WriteResult{stream, std::move(segment), std::unexpected(format.error())};
    }
    segment.format(*format);

    auto path = dir_ / segment_filename(stems_.stem(stream), segment, *format);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return WriteResult{stream, std::move(segment), std::unexpected(make_error_code(DiskErrc::open_failed))};
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.close();
    if (!file) {
        return WriteResult{stream, std::move(segment), std::unexpected(make_error_code(DiskErrc::write_error))};
    }

    spdlog::debug("Wrote {} bytes to {}", data.size(), path.string());
    bytes_written_ += data.size();
    manifest_.append(stream, segment, path);
    return WriteResult{stream, std::move(segment), std::move(path)};
}

} // namespace livecap::disk
