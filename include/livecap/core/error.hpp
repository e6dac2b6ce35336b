// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace livecap::core {

enum class HttpErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    not_found,
    client_error,
    server_error,
    throttled,
    too_many_redirects,
    ssl_error,
    dns_error,
    invalid_url,
    cancelled,
};

namespace detail {

struct HttpErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "livecap::http";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<HttpErrc>(ev)) {
            case HttpErrc::success:              return "Success";
            case HttpErrc::network_error:        return "Network error";
            case HttpErrc::timeout:              return "Operation timed out";
            case HttpErrc::refused:              return "Connection refused";
            case HttpErrc::not_found:            return "Resource not found (404)";
            case HttpErrc::client_error:         return "Client error (4xx)";
            case HttpErrc::server_error:         return "Server error (5xx)";
            case HttpErrc::throttled:            return "Request throttled (408/429)";
            case HttpErrc::too_many_redirects:   return "Too many redirects";
            case HttpErrc::ssl_error:            return "SSL/TLS error";
            case HttpErrc::dns_error:            return "DNS resolution failed";
            case HttpErrc::invalid_url:          return "Invalid URL";
            case HttpErrc::cancelled:            return "Request cancelled";
            default:                             return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::HttpErrcCategory& http_errc_category() noexcept {
    static detail::HttpErrcCategory category;
    return category;
}

inline std::error_code make_error_code(HttpErrc e) noexcept {
    return {static_cast<int>(e), http_errc_category()};
}

// Errors worth another attempt under the retry policy
[[nodiscard]] inline bool is_transient(const std::error_code& ec) noexcept {
    if (ec.category() != http_errc_category()) {
        return false;
    }
    switch (static_cast<HttpErrc>(ec.value())) {
        case HttpErrc::network_error:
        case HttpErrc::timeout:
        case HttpErrc::refused:
        case HttpErrc::server_error:
        case HttpErrc::throttled:
        case HttpErrc::dns_error:
            return true;
        default:
            return false;
    }
}

} // namespace livecap::core

namespace std {

template<>
struct is_error_code_enum<livecap::core::HttpErrc> : true_type {};

} // namespace std
