// Copyright (c) 2026 changcheng967. All rights reserved.

#include <livecap/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <vector>

namespace livecap::core {

namespace {

// RFC 3986: scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
bool has_scheme(std::string_view ref) noexcept {
    auto colon = ref.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(ref[0]))) {
        return false;
    }
    for (std::size_t i = 1; i < colon; ++i) {
        auto c = static_cast<unsigned char>(ref[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    // Parse scheme
    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(HttpErrc::invalid_url));
    }

    url.scheme_.reserve(scheme_end);
    for (std::size_t i = 0; i < scheme_end; ++i) {
        url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
    }

    auto rest_start = scheme_end + 3; // Skip "://"

    auto path_start = url_str.find('/', rest_start);
    if (path_start == std::string_view::npos) {
        path_start = url_str.length();
    }

    auto query_start = url_str.find('?', rest_start);
    if (query_start == std::string_view::npos) {
        query_start = url_str.length();
    }

    auto fragment_start = url_str.find('#', rest_start);
    if (fragment_start == std::string_view::npos) {
        fragment_start = url_str.length();
    }

    // host_end is at the first of: /, ?, #, or end
    auto host_end = std::min({path_start, query_start, fragment_start, url_str.length()});

    std::size_t authority_start = rest_start;

    // Skip userinfo (user:pass@host:port)
    auto at_pos = url_str.find('@', rest_start);
    if (at_pos != std::string_view::npos && at_pos < host_end) {
        url.userinfo_ = std::string(url_str.substr(rest_start, at_pos - rest_start));
        authority_start = at_pos + 1;
    }

    auto authority = url_str.substr(authority_start, host_end - authority_start);

    if (!authority.empty() && authority.front() == '[') {
        // IPv6 literal [::1]:port
        auto bracket_end = authority.find(']');
        if (bracket_end == std::string_view::npos) {
            return std::unexpected(make_error_code(HttpErrc::invalid_url));
        }
        url.host_ = std::string(authority.substr(0, bracket_end + 1));
        if (bracket_end + 1 < authority.size() && authority[bracket_end + 1] == ':') {
            url.port_ = std::string(authority.substr(bracket_end + 2));
        }
    } else {
        auto colon_pos = authority.rfind(':');
        if (colon_pos != std::string_view::npos) {
            url.host_ = std::string(authority.substr(0, colon_pos));
            url.port_ = std::string(authority.substr(colon_pos + 1));
        } else {
            url.host_ = std::string(authority);
        }
    }

    for (char c : url.port_) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::unexpected(make_error_code(HttpErrc::invalid_url));
        }
    }

    // Extract path (if present)
    if (host_end < url_str.length() && url_str[host_end] == '/') {
        auto path_end = std::min(query_start, fragment_start);
        url.path_ = std::string(url_str.substr(host_end, path_end - host_end));
    } else {
        url.path_ = "/";
    }

    // Extract query (if present)
    if (query_start < url_str.length() && query_start < fragment_start) {
        url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
    }

    // Extract fragment (if present)
    if (fragment_start < url_str.length()) {
        url.fragment_ = std::string(url_str.substr(fragment_start + 1));
    }

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(HttpErrc::invalid_url));
    }

    return url;
}

std::expected<Url, std::error_code> Url::resolve(std::string_view reference) const noexcept {
    if (has_scheme(reference)) {
        return parse(reference);
    }

    if (reference.starts_with("//")) {
        return parse(scheme_ + ":" + std::string(reference));
    }

    Url result = *this;
    result.fragment_.clear();

    auto fragment_pos = reference.find('#');
    if (fragment_pos != std::string_view::npos) {
        result.fragment_ = std::string(reference.substr(fragment_pos + 1));
        reference = reference.substr(0, fragment_pos);
    }

    auto query_pos = reference.find('?');
    bool has_query = query_pos != std::string_view::npos;
    std::string_view ref_path = has_query ? reference.substr(0, query_pos) : reference;

    if (has_query) {
        result.query_ = std::string(reference.substr(query_pos + 1));
    }

    if (ref_path.empty()) {
        // Same document: keep base path and, unless overridden, base query
        return result;
    }

    if (!has_query) {
        result.query_.clear();
    }

    if (ref_path.front() == '/') {
        result.path_ = remove_dot_segments(ref_path);
    } else {
        auto last_slash = path_.rfind('/');
        std::string merged = last_slash == std::string::npos
            ? "/"
            : path_.substr(0, last_slash + 1);
        merged += ref_path;
        result.path_ = remove_dot_segments(merged);
    }

    return result;
}

std::string Url::full() const {
    std::string result = base();
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    if (!fragment_.empty()) {
        result += "#";
        result += fragment_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    if (!userinfo_.empty()) {
        result += userinfo_;
        result += "@";
    }
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::string remove_dot_segments(std::string_view path) {
    std::vector<std::string_view> out;
    bool trailing_slash = false;

    std::size_t pos = path.starts_with('/') ? 1 : 0;
    while (pos <= path.size()) {
        auto next = path.find('/', pos);
        bool last = next == std::string_view::npos;
        auto seg = path.substr(pos, last ? std::string_view::npos : next - pos);

        if (seg == ".") {
            trailing_slash = true;
        } else if (seg == "..") {
            if (!out.empty()) {
                out.pop_back();
            }
            trailing_slash = true;
        } else {
            out.push_back(seg);
            trailing_slash = false;
        }

        if (last) break;
        pos = next + 1;
    }

    std::string result = "/";
    for (std::size_t i = 0; i < out.size(); ++i) {
        if (i > 0) result += '/';
        result += out[i];
    }
    if (trailing_slash && !out.empty()) {
        result += '/';
    }
    return result;
}

} // namespace livecap::core
