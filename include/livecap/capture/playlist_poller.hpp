// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <livecap/capture/channel.hpp>
#include <livecap/capture/error.hpp>
#include <livecap/core/http_client.hpp>
#include <livecap/core/stopper.hpp>
#include <livecap/core/url.hpp>
#include <livecap/media/encryption.hpp>
#include <livecap/media/hls_parser.hpp>
#include <livecap/media/segment.hpp>
#include <livecap/media/stream.hpp>
#include <chrono>
#include <expected>
#include <memory>
#include <optional>

namespace livecap::capture {

// Work item for the fetch pool
struct SegmentRequest {
    media::Stream stream;
    media::Segment segment;
    media::Encryption encryption;
    bool needs_initialization{false};  // Stream's initialization segment was requested first
};

// Outcome of one pass over a media playlist
struct PollStep {
    std::size_t emitted{0};          // Segment requests sent, initialization included
    bool end_list{false};
    bool receiver_closed{false};     // Consumer is gone; stop quietly
    std::chrono::milliseconds next_poll{0};
};

// Bounds on the poll cadence, whatever the playlist declares
constexpr std::chrono::milliseconds MIN_POLL_INTERVAL{500};
constexpr std::chrono::milliseconds MAX_POLL_INTERVAL{std::chrono::minutes(10)};

// Follows one stream's media playlist and emits each new segment once
class PlaylistPoller {
public:
    PlaylistPoller(std::shared_ptr<core::HttpClient> client,
                   core::Stopper stopper,
                   Sender<SegmentRequest> sender,
                   media::Stream stream,
                   core::Url url);

    // Poll until the playlist ends, the stopper fires or the consumer goes
    // away. A failed fetch or parse is a poll_error.
    [[nodiscard]] std::error_code run();

    // Fetch and process the playlist once
    [[nodiscard]] std::expected<PollStep, std::error_code> poll_once();

    // Emit the segments of `playlist` that were not emitted before
    [[nodiscard]] std::expected<PollStep, std::error_code>
    process(const media::HLSMediaPlaylist& playlist);

    [[nodiscard]] const media::Stream& stream() const noexcept { return stream_; }
    [[nodiscard]] const std::optional<media::SegmentKey>& last_emitted() const noexcept { return last_emitted_; }
    [[nodiscard]] bool initialization_sent() const noexcept { return initialization_sent_; }

private:
    std::shared_ptr<core::HttpClient> client_;
    core::Stopper stopper_;
    Sender<SegmentRequest> sender_;
    media::Stream stream_;
    core::Url url_;

    std::optional<media::SegmentKey> last_emitted_;
    bool initialization_sent_{false};
    media::Encryption encryption_;
    std::optional<media::HLSKey> current_key_;
};

} // namespace livecap::capture
