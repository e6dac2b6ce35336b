// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <livecap/core/config.hpp>
#include <livecap/core/http_client.hpp>
#include <chrono>
#include <cstdint>
#include <memory>

namespace livecap::core {

// Bounded exponential backoff for transient failures
struct RetryPolicy {
    std::chrono::milliseconds min_backoff{RETRY_MIN_BACKOFF};
    std::chrono::milliseconds max_backoff{RETRY_MAX_BACKOFF};
    std::uint32_t exponent{RETRY_BACKOFF_EXPONENT};
    std::uint32_t max_retries{DEFAULT_MAX_RETRIES};

    // Wait before retry number `retry` (0-based)
    [[nodiscard]] std::chrono::milliseconds backoff(std::uint32_t retry) const noexcept;
};

// Retries transient failures of the wrapped client
class RetryingHttpClient final : public HttpClient {
public:
    RetryingHttpClient(std::shared_ptr<HttpClient> inner, RetryPolicy policy) noexcept;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    perform(const HttpRequest& request, std::stop_token stoken) override;

    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }

private:
    std::shared_ptr<HttpClient> inner_;
    RetryPolicy policy_;
};

// Build the transport shared by a capture: libcurl wrapped in the retry policy
[[nodiscard]] std::shared_ptr<HttpClient> make_http_client(const NetworkOptions& options);

} // namespace livecap::core
