// Copyright (c) 2026 changcheng967. All rights reserved.

#include <livecap/mux/remuxer.hpp>
#include <livecap/disk/segment_writer.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <string_view>

namespace livecap::mux {

namespace {

std::uint64_t read_be32(std::span<const std::uint8_t> d, std::size_t pos) noexcept {
    return (static_cast<std::uint64_t>(d[pos]) << 24)
         | (static_cast<std::uint64_t>(d[pos + 1]) << 16)
         | (static_cast<std::uint64_t>(d[pos + 2]) << 8)
         | static_cast<std::uint64_t>(d[pos + 3]);
}

std::expected<core::Bytes, std::error_code> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error_code(disk::DiskErrc::open_failed));
    }
    core::Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
    return data;
}

} // namespace

std::size_t skip_mp4_header(std::span<const std::uint8_t> data) noexcept {
    std::size_t pos = 0;
    while (pos + 8 <= data.size()) {
        std::string_view type(reinterpret_cast<const char*>(data.data() + pos + 4), 4);
        if (type != "ftyp" && type != "moov") {
            break;
        }

        std::uint64_t size = read_be32(data, pos);
        if (size == 1) {
            if (pos + 16 > data.size()) {
                return data.size();
            }
            size = (read_be32(data, pos + 8) << 32) | read_be32(data, pos + 12);
        } else if (size == 0) {
            return data.size();  // Box runs to the end of the file
        }
        if (size < 8 || size > data.size() - pos) {
            return data.size();
        }
        pos += static_cast<std::size_t>(size);
    }
    return pos;
}

std::size_t skip_webvtt_header(std::span<const std::uint8_t> data) noexcept {
    std::string_view text(reinterpret_cast<const char*>(data.data()), data.size());
    std::size_t end = data.size();
    for (std::string_view blank : {"\r\n\r\n", "\n\n"}) {
        if (auto pos = text.find(blank); pos != std::string_view::npos) {
            end = std::min(end, pos + blank.size());
        }
    }
    return end;
}

std::filesystem::path ConcatRemuxer::output_path(std::string_view stem,
                                                 const std::vector<disk::ManifestEntry>& entries,
                                                 const std::filesystem::path& output_dir) {
    std::string ext = "bin";
    for (const auto& entry : entries) {
        if (entry.segment.format()) {
            ext = media::extension(*entry.segment.format());
            break;
        }
    }
    return output_dir / (std::string(stem) + "." + ext);
}

std::expected<std::vector<std::filesystem::path>, std::error_code>
ConcatRemuxer::remux(const disk::CaptureManifest& manifest,
                     const std::filesystem::path& output_dir,
                     const std::optional<std::filesystem::path>& main_target) {
    std::vector<std::filesystem::path> outputs;
    disk::FileStems stems(manifest.streams());

    for (const auto& stream : manifest.streams()) {
        auto entries = manifest.entries(stream);
        std::erase_if(entries, [](const disk::ManifestEntry& e) { return e.segment.is_initialization(); });
        if (entries.empty()) {
            continue;
        }
        std::stable_sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
            return a.segment.key() < b.segment.key();
        });

        auto target = output_path(stems.stem(stream), entries, output_dir);
        if (stream.kind() == media::StreamKind::main && main_target) {
            target = main_target->is_absolute() ? *main_target : output_dir / *main_target;
        }

        std::error_code ec;
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path(), ec);
            if (ec) {
                return std::unexpected(make_error_code(disk::DiskErrc::create_directory_failed));
            }
        }

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            return std::unexpected(make_error_code(disk::DiskErrc::open_failed));
        }

        bool first = true;
        for (const auto& entry : entries) {
            auto data = read_file(entry.path);
            if (!data) {
                spdlog::error("Failed to read {}: {}", entry.path.string(), data.error().message());
                return std::unexpected(data.error());
            }

            std::size_t skip = 0;
            if (!first && entry.segment.format() == media::MediaFormat::mp4) {
                skip = skip_mp4_header(*data);
            } else if (!first && entry.segment.format() == media::MediaFormat::webvtt) {
                skip = skip_webvtt_header(*data);
                out.put('\n');  // Cue blocks are separated by a blank line
            }
            first = false;

            out.write(reinterpret_cast<const char*>(data->data() + skip),
                      static_cast<std::streamsize>(data->size() - skip));
            if (!out) {
                return std::unexpected(make_error_code(disk::DiskErrc::write_error));
            }
        }

        out.close();
        if (!out) {
            return std::unexpected(make_error_code(disk::DiskErrc::write_error));
        }

        spdlog::info("Remuxed {} segments of {} into {}", entries.size(), stream.display(), target.string());
        outputs.push_back(std::move(target));
    }

    return outputs;
}

} // namespace livecap::mux
