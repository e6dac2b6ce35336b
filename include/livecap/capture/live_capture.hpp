// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <livecap/capture/error.hpp>
#include <livecap/capture/playlist_resolver.hpp>
#include <livecap/core/config.hpp>
#include <livecap/core/http_client.hpp>
#include <livecap/core/stopper.hpp>
#include <livecap/core/url.hpp>
#include <livecap/disk/manifest.hpp>
#include <livecap/mux/remuxer.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace livecap::capture {

// Snapshot reported after every completed fetch
struct CaptureProgress {
    std::uint64_t segments_saved{0};
    std::uint64_t segments_dropped{0};
    std::uint64_t bytes_written{0};
    std::size_t active_pollers{0};
};

using CaptureCallback = std::function<void(const CaptureProgress&)>;

// One live capture: the resolved streams, the shared client and the stopper.
// A LiveCapture is consumed by a single download() run.
class LiveCapture {
public:
    // Resolve the entry playlist. The returned Stopper is shared with the
    // capture; stopping it ends every poller.
    [[nodiscard]] static std::expected<std::pair<LiveCapture, core::Stopper>, std::error_code>
    create(const core::Url& url, const core::NetworkOptions& network,
           std::shared_ptr<core::HttpClient> client = nullptr);

    // Capture until every poller has ended. Dropped segments are not errors;
    // a failed poller makes the result poll_error.
    [[nodiscard]] std::error_code download(const core::DownloadOptions& options);

    [[nodiscard]] const StreamMap& streams() const noexcept { return streams_; }
    [[nodiscard]] const core::NetworkOptions& network() const noexcept { return network_; }

    // Segments persisted by the last download(), sorted by ordering key
    [[nodiscard]] const disk::CaptureManifest& manifest() const noexcept { return manifest_; }

    // Files produced by the remuxer in the last download()
    [[nodiscard]] const std::vector<std::filesystem::path>& outputs() const noexcept { return outputs_; }

    void callback(CaptureCallback cb) noexcept { callback_ = std::move(cb); }

    // Defaults to ConcatRemuxer
    void remuxer(std::shared_ptr<mux::Remuxer> remuxer) noexcept { remuxer_ = std::move(remuxer); }

private:
    LiveCapture(StreamMap streams, std::shared_ptr<core::HttpClient> client,
                core::Stopper stopper, core::NetworkOptions network);

    StreamMap streams_;
    std::shared_ptr<core::HttpClient> client_;
    core::Stopper stopper_;
    core::NetworkOptions network_;
    CaptureCallback callback_;
    std::shared_ptr<mux::Remuxer> remuxer_;
    disk::CaptureManifest manifest_;
    std::vector<std::filesystem::path> outputs_;
};

} // namespace livecap::capture
