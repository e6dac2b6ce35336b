// Copyright (c) 2026 changcheng967. All rights reserved.

#include <livecap/capture/playlist_poller.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdint>

namespace livecap::capture {

namespace {

std::chrono::milliseconds poll_interval(double target_duration, bool found_new) {
    constexpr double max_ms = static_cast<double>(MAX_POLL_INTERVAL.count());
    double ms = (found_new ? target_duration : target_duration / 2.0) * 1000.0;
    if (!(ms > 0.0)) {
        return MIN_POLL_INTERVAL;
    }
    auto interval = std::chrono::milliseconds(static_cast<std::int64_t>(std::min(ms, max_ms)));
    return std::max(interval, MIN_POLL_INTERVAL);
}

} // namespace

PlaylistPoller::PlaylistPoller(std::shared_ptr<core::HttpClient> client,
                               core::Stopper stopper,
                               Sender<SegmentRequest> sender,
                               media::Stream stream,
                               core::Url url)
    : client_(std::move(client))
    , stopper_(std::move(stopper))
    , sender_(std::move(sender))
    , stream_(std::move(stream))
    , url_(std::move(url)) {}

std::expected<PollStep, std::error_code>
PlaylistPoller::process(const media::HLSMediaPlaylist& playlist) {
    PollStep step;
    std::uint64_t discontinuity = playlist.discontinuity_sequence;
    std::uint64_t sequence = playlist.media_sequence;

    for (const auto& entry : playlist.segments) {
        std::uint64_t seq = sequence++;
        if (entry.discontinuity) {
            ++discontinuity;
        }
        media::SegmentKey key{discontinuity, seq};

        if (last_emitted_ && key <= *last_emitted_) {
            continue;
        }

        if (entry.key && entry.key != current_key_) {
            auto encryption = media::Encryption::resolve(*client_, *entry.key, url_, seq, stopper_.token());
            if (!encryption) {
                return std::unexpected(encryption.error());
            }
            encryption_ = *encryption;
            current_key_ = entry.key;
        }

        if (!initialization_sent_ && entry.map) {
            auto init_url = url_.resolve(entry.map->uri);
            if (!init_url) {
                return std::unexpected(init_url.error());
            }
            spdlog::trace("Found new initialization segment {}", init_url->full());
            auto init = media::Segment::initialization(std::move(*init_url), entry.map->byte_range);
            if (!sender_.send(SegmentRequest{stream_, std::move(init), media::Encryption::none()})) {
                step.receiver_closed = true;
                return step;
            }
            initialization_sent_ = true;
            ++step.emitted;
        }

        auto seg_url = url_.resolve(entry.uri);
        if (!seg_url) {
            return std::unexpected(seg_url.error());
        }
        spdlog::trace("Found new segment {}", seg_url->full());

        last_emitted_ = key;
        auto segment = media::Segment::sequence(std::move(*seg_url), entry.byte_range, key.first, key.second);
        if (!sender_.send(SegmentRequest{stream_, std::move(segment), encryption_.for_sequence(seq),
                                         initialization_sent_})) {
            step.receiver_closed = true;
            return step;
        }
        ++step.emitted;
    }

    step.end_list = playlist.end_list;
    step.next_poll = poll_interval(playlist.target_duration, step.emitted > 0);
    return step;
}

std::expected<PollStep, std::error_code> PlaylistPoller::poll_once() {
    spdlog::trace("Fetching {}", url_.full());
    auto response = client_->get(url_, stopper_.token());
    if (!response) {
        return std::unexpected(response.error());
    }

    auto playlist = media::HLSParser::parse_media(response->text());
    if (!playlist) {
        return std::unexpected(playlist.error());
    }

    return process(*playlist);
}

std::error_code PlaylistPoller::run() {
    while (!stopper_.stopped()) {
        auto start = core::Stopper::Clock::now();

        auto step = poll_once();
        if (!step) {
            if (stopper_.stopped()) {
                break;  // Request aborted by the stop
            }
            spdlog::error("Failed to poll {} ({}): {}", stream_.display(), url_.full(),
                          step.error().message());
            return make_error_code(CaptureErrc::poll_error);
        }

        if (step->receiver_closed) {
            spdlog::debug("Segment consumer closed, stopping {}", stream_.display());
            break;
        }
        if (step->end_list) {
            spdlog::trace("Playlist ended for {}", stream_.display());
            break;
        }

        // Scheduled from the start of the pass so fetch time does not drift the cadence
        (void)stopper_.wait_until(start + step->next_poll);
    }

    sender_.close();
    return {};
}

} // namespace livecap::capture
