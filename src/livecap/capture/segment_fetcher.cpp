// Copyright (c) 2026 changcheng967. All rights reserved.

#include <livecap/capture/segment_fetcher.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace livecap::capture {

std::expected<core::Bytes, std::error_code>
fetch_segment(core::HttpClient& client, const media::Segment& segment,
              const media::Encryption& encryption, std::stop_token stoken) {
    core::HttpRequest request{segment.url(), segment.range_header()};

    auto response = client.perform(request, std::move(stoken));
    if (!response) {
        return std::unexpected(response.error());
    }

    auto bytes = encryption.decrypt(response->body);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }

    spdlog::info("Downloaded {} {}", segment.url().full(), request.range.value_or(""));
    return bytes;
}

//=============================================================================
// FetchPool
//=============================================================================

FetchPool::FetchPool(std::shared_ptr<core::HttpClient> client,
                     Receiver<SegmentRequest> requests,
                     Sender<FetchResult> results,
                     std::size_t workers) {
    workers = std::max<std::size_t>(workers, 1);
    workers_.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        workers_.emplace_back(&FetchPool::worker_loop, client, requests, results);
    }
}

FetchPool::~FetchPool() {
    stop();
    join();
}

void FetchPool::stop() noexcept {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
}

void FetchPool::join() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void FetchPool::worker_loop(std::stop_token stoken,
                            std::shared_ptr<core::HttpClient> client,
                            Receiver<SegmentRequest> requests,
                            Sender<FetchResult> results) {
    while (auto request = requests.receive(stoken)) {
        auto bytes = fetch_segment(*client, request->segment, request->encryption, stoken);
        if (stoken.stop_requested()) {
            break;
        }
        if (!results.send(FetchResult{std::move(request->stream), std::move(request->segment), std::move(bytes),
                                      request->needs_initialization})) {
            break;
        }
    }
}

} // namespace livecap::capture
