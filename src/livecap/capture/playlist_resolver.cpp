// Copyright (c) 2026 changcheng967. All rights reserved.

#include <livecap/capture/playlist_resolver.hpp>
#include <spdlog/spdlog.h>
#include <variant>

namespace livecap::capture {

const media::HLSVariant*
select_variant(const std::vector<media::HLSVariant>& variants) noexcept {
    const media::HLSVariant* best = nullptr;
    std::uint64_t best_bandwidth = 0;

    for (const auto& variant : variants) {
        auto bandwidth = variant.bandwidth_bps();
        if (!bandwidth) {
            continue;
        }
        if (!best || *bandwidth > best_bandwidth) {
            best = &variant;
            best_bandwidth = *bandwidth;
        }
    }
    return best;
}

std::expected<StreamMap, std::error_code>
PlaylistResolver::streams_from_master(const media::HLSMasterPlaylist& master, const core::Url& base) {
    const auto* variant = select_variant(master.variants);
    if (!variant) {
        spdlog::error("No variant with a usable bandwidth in {}", base.full());
        return std::unexpected(make_error_code(CaptureErrc::no_variants));
    }

    auto main_url = base.resolve(variant->uri);
    if (!main_url) {
        spdlog::error("Invalid variant URI {}: {}", variant->uri, main_url.error().message());
        return std::unexpected(make_error_code(CaptureErrc::playlist_error));
    }
    spdlog::debug("Selected variant {} ({} bps)", main_url->full(), variant->bandwidth);

    StreamMap streams;
    streams.emplace(media::Stream::main(), std::move(*main_url));

    auto add_group = [&](const std::optional<std::string>& group, media::HLSMediaType type)
        -> std::error_code {
        if (!group) {
            return {};
        }
        for (const auto& alt : master.alternatives) {
            if (alt.type != type || alt.group_id != *group || !alt.uri) {
                continue;
            }
            auto url = base.resolve(*alt.uri);
            if (!url) {
                spdlog::error("Invalid rendition URI {}: {}", *alt.uri, url.error().message());
                return make_error_code(CaptureErrc::playlist_error);
            }

            auto stream = type == media::HLSMediaType::audio ? media::Stream::audio(alt.name, alt.language)
                        : type == media::HLSMediaType::video ? media::Stream::video(alt.name, alt.language)
                        : media::Stream::subtitle(alt.name, alt.language);
            spdlog::debug("Added {} from {}", stream.display(), url->full());
            streams.insert_or_assign(std::move(stream), std::move(*url));
        }
        return {};
    };

    if (auto ec = add_group(variant->audio, media::HLSMediaType::audio)) {
        return std::unexpected(ec);
    }
    if (auto ec = add_group(variant->video, media::HLSMediaType::video)) {
        return std::unexpected(ec);
    }
    if (auto ec = add_group(variant->subtitles, media::HLSMediaType::subtitles)) {
        return std::unexpected(ec);
    }

    return streams;
}

std::expected<StreamMap, std::error_code>
PlaylistResolver::resolve(const core::Url& entry_url, std::stop_token stoken) const {
    spdlog::trace("Fetching {}", entry_url.full());
    auto response = client_->get(entry_url, std::move(stoken));
    if (!response) {
        spdlog::error("Failed to fetch {}: {}", entry_url.full(), response.error().message());
        return std::unexpected(make_error_code(CaptureErrc::playlist_error));
    }

    const core::Url& final_url = response->effective_url.empty() ? entry_url : response->effective_url;

    auto playlist = media::HLSParser::parse(response->text());
    if (!playlist) {
        spdlog::error("Failed to parse {}: {}", final_url.full(), playlist.error().message());
        return std::unexpected(make_error_code(CaptureErrc::playlist_error));
    }

    if (const auto* master = std::get_if<media::HLSMasterPlaylist>(&*playlist)) {
        return streams_from_master(*master, final_url);
    }

    StreamMap streams;
    streams.emplace(media::Stream::main(), final_url);
    return streams;
}

} // namespace livecap::capture
