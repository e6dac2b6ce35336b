// Copyright (c) 2026 changcheng967. All rights reserved.

#include <livecap/core/http_client.hpp>
#include <livecap/core/config.hpp>
#include <livecap/version.hpp>
#include <curl/curl.h>
#include <cctype>
#include <cstring>

namespace livecap::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct HeaderList {
    curl_slist* ptr = nullptr;

    HeaderList() = default;
    ~HeaderList() { if (ptr) curl_slist_free_all(ptr); }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void append(const std::string& header) { ptr = curl_slist_append(ptr, header.c_str()); }
};

// Header callback for GET responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);

    // A new status line starts the header block of a redirect target
    if (header.starts_with("HTTP/")) {
        headers->clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* body = static_cast<Bytes*>(userdata);
    if (!body) return 0;

    std::size_t total = size * nitems;
    const std::size_t offset = body->size();
    body->resize(offset + total);
    std::memcpy(body->data() + offset, ptr, total);
    return total;
}

// Returning non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* stoken = static_cast<const std::stop_token*>(userdata);
    return (stoken && stoken->stop_requested()) ? 1 : 0;
}

std::error_code curl_to_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:
            return {};
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(HttpErrc::timeout);
        case CURLE_COULDNT_CONNECT:
            return make_error_code(HttpErrc::refused);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(HttpErrc::dns_error);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(HttpErrc::too_many_redirects);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(HttpErrc::ssl_error);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(HttpErrc::invalid_url);
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(HttpErrc::cancelled);
        default:
            return make_error_code(HttpErrc::network_error);
    }
}

} // namespace

std::error_code status_to_error(std::int32_t status_code) noexcept {
    if (status_code < 400) {
        return {};
    }
    if (status_code == 404 || status_code == 410) {
        return make_error_code(HttpErrc::not_found);
    }
    if (status_code == 408 || status_code == 429) {
        return make_error_code(HttpErrc::throttled);
    }
    if (status_code >= 500) {
        return make_error_code(HttpErrc::server_error);
    }
    return make_error_code(HttpErrc::client_error);
}

//=============================================================================
// CurlHttpClient
//=============================================================================

CurlHttpClient::CurlHttpClient(std::uint32_t timeout_sec) noexcept
    : timeout_sec_(timeout_sec) {}

std::expected<HttpResponse, std::error_code>
CurlHttpClient::perform(const HttpRequest& request, std::stop_token stoken) {
    if (stoken.stop_requested()) {
        return std::unexpected(make_error_code(HttpErrc::cancelled));
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(HttpErrc::network_error));
    }

    HttpResponse response{};
    const std::string url = request.url.full();
    const std::string agent = livecap::user_agent();

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, agent.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);

    HeaderList headers;
    if (request.range) {
        headers.append("Range: " + *request.range);
        curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, headers.ptr);
    }

    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, static_cast<long>(timeout_sec_));
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.ptr, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(READ_BUFFER_SIZE));

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &response.body);

    // Let the stop token interrupt long transfers
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &stoken);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (auto ec = curl_to_error(result)) {
        return std::unexpected(ec);
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);
    if (auto ec = status_to_error(response.status_code)) {
        return std::unexpected(ec);
    }

    char* effective = nullptr;
    if (curl_easy_getinfo(curl.ptr, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
        auto parsed = Url::parse(effective);
        response.effective_url = parsed ? std::move(*parsed) : request.url;
    } else {
        response.effective_url = request.url;
    }

    char* ct = nullptr;
    if (curl_easy_getinfo(curl.ptr, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct) {
        response.content_type = ct;
    }

    return response;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void CurlHttpClient::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlHttpClient::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace livecap::core
