// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <livecap/core/error.hpp>
#include <livecap/core/url.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <expected>
#include <map>
#include <optional>
#include <stop_token>
#include <vector>

namespace livecap::core {

using Bytes = std::vector<std::uint8_t>;

struct HttpRequest {
    Url url;
    std::optional<std::string> range;  // Full header value, e.g. "bytes=0-1023"
};

struct HttpResponse {
    std::int32_t status_code{0};
    Url effective_url;                 // After redirects
    std::map<std::string, std::string> headers;  // Lower-cased names
    std::string content_type;
    Bytes body;

    [[nodiscard]] std::string_view text() const noexcept {
        return {reinterpret_cast<const char*>(body.data()), body.size()};
    }
};

// Map an HTTP status to an error (empty for 1xx-3xx)
[[nodiscard]] std::error_code status_to_error(std::int32_t status_code) noexcept;

// Transport used by every component of a capture. Implementations must be
// safe to call concurrently from several threads.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    perform(const HttpRequest& request, std::stop_token stoken) = 0;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const Url& url, std::stop_token stoken = {}) {
        return perform(HttpRequest{url, std::nullopt}, std::move(stoken));
    }
};

// libcurl transport, one easy handle per request
class CurlHttpClient final : public HttpClient {
public:
    explicit CurlHttpClient(std::uint32_t timeout_sec) noexcept;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    perform(const HttpRequest& request, std::stop_token stoken) override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    std::uint32_t timeout_sec_;
};

} // namespace livecap::core
