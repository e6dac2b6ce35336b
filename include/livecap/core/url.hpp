// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <livecap/core/error.hpp>
#include <string>
#include <string_view>
#include <expected>

namespace livecap::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    // Resolve a (possibly relative) reference against this URL
    [[nodiscard]] std::expected<Url, std::error_code> resolve(std::string_view reference) const noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }
    [[nodiscard]] std::string_view fragment() const noexcept { return fragment_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string base() const;  // scheme://[userinfo@]host[:port]
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }
    [[nodiscard]] bool empty() const noexcept { return host_.empty(); }

    bool operator==(const Url& other) const { return full() == other.full(); }

    Url() = default;

private:
    std::string scheme_;
    std::string userinfo_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

// Collapse "." and ".." segments of an absolute path
[[nodiscard]] std::string remove_dot_segments(std::string_view path);

} // namespace livecap::core
