// Copyright (c) 2026 changcheng967. All rights reserved.

#include <livecap/core/retry_policy.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace livecap::core {

std::chrono::milliseconds RetryPolicy::backoff(std::uint32_t retry) const noexcept {
    auto wait = min_backoff;
    for (std::uint32_t i = 0; i < retry && wait < max_backoff; ++i) {
        wait *= exponent;
    }
    return std::min(wait, max_backoff);
}

//=============================================================================
// RetryingHttpClient
//=============================================================================

RetryingHttpClient::RetryingHttpClient(std::shared_ptr<HttpClient> inner, RetryPolicy policy) noexcept
    : inner_(std::move(inner))
    , policy_(policy) {}

std::expected<HttpResponse, std::error_code>
RetryingHttpClient::perform(const HttpRequest& request, std::stop_token stoken) {
    for (std::uint32_t retry = 0;; ++retry) {
        auto response = inner_->perform(request, stoken);
        if (response || !is_transient(response.error()) || retry >= policy_.max_retries) {
            return response;
        }

        auto wait = policy_.backoff(retry);
        spdlog::debug("Retrying {} in {} ms ({}/{}): {}",
                      request.url.full(), wait.count(), retry + 1, policy_.max_retries,
                      response.error().message());

        // Sleep, waking early if the request is cancelled
        std::mutex mutex;
        std::condition_variable_any cv;
        std::unique_lock lock(mutex);
        (void)cv.wait_for(lock, stoken, wait, [] { return false; });
        if (stoken.stop_requested()) {
            return std::unexpected(make_error_code(HttpErrc::cancelled));
        }
    }
}

std::shared_ptr<HttpClient> make_http_client(const NetworkOptions& options) {
    RetryPolicy policy;
    policy.max_retries = options.max_retries;
    return std::make_shared<RetryingHttpClient>(
        std::make_shared<CurlHttpClient>(options.timeout_sec), policy);
}

} // namespace livecap::core
