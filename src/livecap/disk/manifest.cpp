// Copyright (c) 2026 changcheng967. All rights reserved.

#include <livecap/disk/manifest.hpp>
#include <livecap/core/config.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>

namespace livecap::disk {

namespace {

constexpr int MANIFEST_VERSION = 1;

std::optional<media::Stream> stream_from_json(const nlohmann::json& j) {
    auto kind = j.at("kind").get<std::string>();
    auto name = j.value("name", std::string{});
    std::optional<std::string> lang;
    if (j.contains("lang") && j["lang"].is_string()) {
        lang = j["lang"].get<std::string>();
    }

    if (kind == "main") return media::Stream::main();
    if (kind == "video") return media::Stream::video(std::move(name), std::move(lang));
    if (kind == "audio") return media::Stream::audio(std::move(name), std::move(lang));
    if (kind == "subtitle") return media::Stream::subtitle(std::move(name), std::move(lang));
    return std::nullopt;
}

nlohmann::json range_to_json(const std::optional<media::ByteRange>& range) {
    if (!range) {
        return nullptr;
    }
    nlohmann::json j;
    j["length"] = range->length;
    j["offset"] = range->offset ? nlohmann::json(*range->offset) : nlohmann::json(nullptr);
    return j;
}

std::optional<media::ByteRange> range_from_json(const nlohmann::json& j) {
    if (j.is_null()) {
        return std::nullopt;
    }
    media::ByteRange range;
    range.length = j.at("length").get<std::uint64_t>();
    if (j.contains("offset") && !j["offset"].is_null()) {
        range.offset = j["offset"].get<std::uint64_t>();
    }
    return range;
}

} // namespace

//=============================================================================
// CaptureManifest
//=============================================================================

void CaptureManifest::append(const media::Stream& stream, media::Segment segment,
                             std::filesystem::path path) {
    auto [it, inserted] = entries_.try_emplace(stream);
    if (inserted) {
        order_.push_back(stream);
    }
    it->second.push_back(ManifestEntry{std::move(segment), std::move(path)});
}

const std::vector<ManifestEntry>& CaptureManifest::entries(const media::Stream& stream) const {
    static const std::vector<ManifestEntry> no_entries;
    auto it = entries_.find(stream);
    return it == entries_.end() ? no_entries : it->second;
}

std::size_t CaptureManifest::size() const noexcept {
    std::size_t total = 0;
    for (const auto& [stream, list] : entries_) {
        total += list.size();
    }
    return total;
}

void CaptureManifest::sort() {
    for (auto& [stream, list] : entries_) {
        std::stable_sort(list.begin(), list.end(), [](const ManifestEntry& a, const ManifestEntry& b) {
            return a.segment.key() < b.segment.key();
        });
    }
}

std::filesystem::path CaptureManifest::manifest_path(const std::filesystem::path& segments_dir) {
    return segments_dir / core::MANIFEST_FILENAME;
}

std::error_code CaptureManifest::save(const std::filesystem::path& path) const noexcept {
    try {
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                return make_error_code(DiskErrc::create_directory_failed);
            }
        }

        nlohmann::json j;
        j["version"] = MANIFEST_VERSION;
        j["streams"] = nlohmann::json::array();

        for (const auto& stream : order_) {
            nlohmann::json js;
            js["kind"] = std::string(media::to_string(stream.kind()));
            js["name"] = stream.name();
            js["lang"] = stream.lang() ? nlohmann::json(*stream.lang()) : nlohmann::json(nullptr);
            js["segments"] = nlohmann::json::array();

            for (const auto& entry : entries(stream)) {
                const auto& seg = entry.segment;
                nlohmann::json jseg;
                jseg["kind"] = seg.is_initialization() ? "initialization" : "sequence";
                jseg["discontinuity"] = seg.discontinuity();
                jseg["sequence"] = seg.sequence();
                jseg["url"] = seg.url().full();
                jseg["range"] = range_to_json(seg.byte_range());
                jseg["format"] = seg.format() ? nlohmann::json(std::string(media::to_string(*seg.format())))
                                              : nlohmann::json(nullptr);
                jseg["path"] = entry.path.string();
                js["segments"].push_back(std::move(jseg));
            }

            j["streams"].push_back(std::move(js));
        }

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return make_error_code(DiskErrc::open_failed);
        }
        file << j.dump(2) << '\n';
        if (!file) {
            return make_error_code(DiskErrc::write_error);
        }
        return {};
    } catch (const std::exception& e) {
        spdlog::error("Failed to save manifest {}: {}", path.string(), e.what());
        return make_error_code(DiskErrc::write_error);
    }
}

std::expected<CaptureManifest, std::error_code>
CaptureManifest::load(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(DiskErrc::open_failed));
        }

        auto j = nlohmann::json::parse(file, nullptr, false);
        if (j.is_discarded() || !j.is_object() || !j.contains("streams") || !j["streams"].is_array()) {
            return std::unexpected(make_error_code(DiskErrc::invalid_manifest));
        }

        CaptureManifest manifest;
        for (const auto& js : j["streams"]) {
            auto stream = stream_from_json(js);
            if (!stream) {
                return std::unexpected(make_error_code(DiskErrc::invalid_manifest));
            }

            for (const auto& jseg : js.at("segments")) {
                auto url = core::Url::parse(jseg.at("url").get<std::string>());
                if (!url) {
                    return std::unexpected(make_error_code(DiskErrc::invalid_manifest));
                }
                auto range = range_from_json(jseg.value("range", nlohmann::json(nullptr)));

                auto segment = jseg.value("kind", std::string{"sequence"}) == "initialization"
                    ? media::Segment::initialization(std::move(*url), std::move(range))
                    : media::Segment::sequence(std::move(*url), std::move(range),
                                               jseg.at("discontinuity").get<std::uint64_t>(),
                                               jseg.at("sequence").get<std::uint64_t>());

                if (jseg.contains("format") && jseg["format"].is_string()) {
                    auto format = media::format_from_string(jseg["format"].get<std::string>());
                    if (!format) {
                        return std::unexpected(make_error_code(DiskErrc::invalid_manifest));
                    }
                    segment.format(*format);
                }

                manifest.append(*stream, std::move(segment), jseg.at("path").get<std::string>());
            }
        }

        return manifest;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load manifest {}: {}", path.string(), e.what());
        return std::unexpected(make_error_code(DiskErrc::invalid_manifest));
    }
}

} // namespace livecap::disk
