// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <livecap/capture/channel.hpp>
#include <livecap/capture/playlist_poller.hpp>
#include <livecap/core/http_client.hpp>
#include <livecap/media/encryption.hpp>
#include <livecap/media/segment.hpp>
#include <expected>
#include <memory>
#include <stop_token>
#include <thread>
#include <vector>

namespace livecap::capture {

// Completed request; `bytes` holds the decrypted body or why it is missing
struct FetchResult {
    media::Stream stream;
    media::Segment segment;
    std::expected<core::Bytes, std::error_code> bytes;
    bool needs_initialization{false};
};

// GET the segment (ranged when it is a sub-range) and decrypt the body
[[nodiscard]] std::expected<core::Bytes, std::error_code>
fetch_segment(core::HttpClient& client, const media::Segment& segment,
              const media::Encryption& encryption, std::stop_token stoken = {});

// Fixed set of workers pulling segment requests. At most `workers` fetches
// are in flight; results are sent in completion order.
class FetchPool {
public:
    FetchPool(std::shared_ptr<core::HttpClient> client,
              Receiver<SegmentRequest> requests,
              Sender<FetchResult> results,
              std::size_t workers);
    ~FetchPool();

    FetchPool(const FetchPool&) = delete;
    FetchPool& operator=(const FetchPool&) = delete;

    // Abort in-flight fetches and stop pulling requests
    void stop() noexcept;

    // Wait for every worker to exit
    void join();

    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

private:
    static void worker_loop(std::stop_token stoken,
                            std::shared_ptr<core::HttpClient> client,
                            Receiver<SegmentRequest> requests,
                            Sender<FetchResult> results);

    std::vector<std::jthread> workers_;
};

} // namespace livecap::capture
