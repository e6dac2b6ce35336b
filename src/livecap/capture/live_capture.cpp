// Copyright (c) 2026 changcheng967. All rights reserved.

#include <livecap/capture/live_capture.hpp>
#include <livecap/capture/channel.hpp>
#include <livecap/capture/playlist_poller.hpp>
#include <livecap/capture/segment_fetcher.hpp>
#include <livecap/core/retry_policy.hpp>
#include <livecap/disk/segment_writer.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <stop_token>
#include <thread>

namespace livecap::capture {

LiveCapture::LiveCapture(StreamMap streams, std::shared_ptr<core::HttpClient> client,
                         core::Stopper stopper, core::NetworkOptions network)
    : streams_(std::move(streams))
    , client_(std::move(client))
    , stopper_(std::move(stopper))
    , network_(network)
    , remuxer_(std::make_shared<mux::ConcatRemuxer>()) {}

std::expected<std::pair<LiveCapture, core::Stopper>, std::error_code>
LiveCapture::create(const core::Url& url, const core::NetworkOptions& network,
                    std::shared_ptr<core::HttpClient> client) {
    if (!client) {
        client = core::make_http_client(network);
    }

    PlaylistResolver resolver(client);
    auto streams = resolver.resolve(url);
    if (!streams) {
        return std::unexpected(streams.error());
    }

    for (const auto& [stream, stream_url] : *streams) {
        spdlog::debug("Stream {}: {}", stream.display(), stream_url.full());
    }

    core::Stopper stopper;
    return std::pair{LiveCapture(std::move(*streams), std::move(client), stopper, network), stopper};
}

std::error_code LiveCapture::download(const core::DownloadOptions& options) {
    std::vector<media::Stream> stream_list;
    stream_list.reserve(streams_.size());
    for (const auto& [stream, url] : streams_) {
        stream_list.push_back(stream);
    }

    disk::SegmentWriter writer(options.output_dir / core::SEGMENTS_DIRECTORY, std::move(stream_list));
    if (auto ec = writer.prepare()) {
        spdlog::error("Cannot prepare {}: {}", writer.directory().string(), ec.message());
        return make_error_code(CaptureErrc::write_error);
    }

    auto [request_tx, request_rx] = make_channel<SegmentRequest>();
    auto [result_tx, result_rx] = make_channel<FetchResult>();

    auto failed = std::make_shared<std::atomic<bool>>(false);
    auto active = std::make_shared<std::atomic<std::size_t>>(streams_.size());
    std::stop_source abandon;

    //=========================================================================
    // Pollers, one thread per stream
    //=========================================================================

    std::vector<std::error_code> poller_errors(streams_.size());
    std::vector<std::jthread> pollers;
    pollers.reserve(streams_.size());

    std::size_t index = 0;
    for (const auto& [stream, url] : streams_) {
        PlaylistPoller poller(client_, stopper_, request_tx, stream, url);
        auto* slot = &poller_errors[index++];

        pollers.emplace_back([poller = std::move(poller), slot, failed, active, abandon,
                              stopper = stopper_, fail_fast = options.fail_fast]() mutable {
            auto ec = poller.run();
            if (ec) {
                *slot = ec;
                failed->store(true, std::memory_order_release);
                if (fail_fast) {
                    spdlog::error("Stream {} failed, stopping capture", poller.stream().display());
                    stopper.stop();
                    abandon.request_stop();
                }
            }
            active->fetch_sub(1, std::memory_order_acq_rel);
        });
    }
    request_tx.close();

    //=========================================================================
    // Fetch pool
    //=========================================================================

    FetchPool pool(client_, request_rx, result_tx, network_.max_concurrent_downloads);
    request_rx.close();
    result_tx.close();

    //=========================================================================
    // Writer loop
    //=========================================================================

    CaptureProgress progress;
    auto record = [&](const std::vector<disk::WriteResult>& written) {
        for (const auto& w : written) {
            if (w.path) {
                ++progress.segments_saved;
            } else {
                ++progress.segments_dropped;
                spdlog::warn("Failed to save segment {} of {}: {}", w.segment.url().full(),
                             w.stream.display(), w.path.error().message());
            }
        }
    };
    auto report = [&] {
        progress.bytes_written = writer.bytes_written();
        progress.active_pollers = active->load(std::memory_order_acquire);
        if (callback_) {
            callback_(progress);
        }
    };

    while (auto result = result_rx.receive(abandon.get_token())) {
        const auto& stream = result->stream;
        const auto& segment = result->segment;

        if (!result->bytes) {
            ++progress.segments_dropped;
            spdlog::warn("Dropping segment {} of {}: {}", segment.url().full(), stream.display(),
                         result->bytes.error().message());
            if (segment.is_initialization()) {
                record(writer.initialization_failed(stream));
            }
        } else {
            record(writer.write(stream, segment, *result->bytes, result->needs_initialization));
        }
        report();

        if (stopper_.stopped() && failed->load(std::memory_order_acquire)) {
            break;
        }
    }

    if (stopper_.stopped() && failed->load(std::memory_order_acquire)) {
        spdlog::warn("Abandoning queued and in-flight segments");
        pool.stop();
    }
    result_rx.close();
    pool.join();
    for (auto& poller : pollers) {
        poller.join();
    }

    if (writer.held() > 0) {
        record(writer.flush());
        report();
    }

    //=========================================================================
    // Manifest and remux
    //=========================================================================

    manifest_ = writer.take_manifest();
    manifest_.sort();

    auto manifest_path = disk::CaptureManifest::manifest_path(writer.directory());
    if (auto ec = manifest_.save(manifest_path)) {
        spdlog::warn("Failed to save {}: {}", manifest_path.string(), ec.message());
    }

    std::error_code remux_ec;
    outputs_.clear();
    if (options.remux && !manifest_.empty() && remuxer_) {
        auto outputs = remuxer_->remux(manifest_, options.output_dir, options.remux_target);
        if (outputs) {
            outputs_ = std::move(*outputs);
        } else {
            spdlog::error("Remux failed: {}", outputs.error().message());
            remux_ec = make_error_code(CaptureErrc::remux_error);
        }
    }

    spdlog::debug("Capture finished: {} saved, {} dropped, {} bytes", progress.segments_saved,
                  progress.segments_dropped, progress.bytes_written);

    for (const auto& ec : poller_errors) {
        if (ec) {
            return ec;
        }
    }
    return remux_ec;
}

} // namespace livecap::capture
