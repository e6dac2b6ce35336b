// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <livecap/capture/error.hpp>
#include <livecap/core/http_client.hpp>
#include <livecap/core/url.hpp>
#include <livecap/media/hls_parser.hpp>
#include <livecap/media/stream.hpp>
#include <expected>
#include <memory>
#include <stop_token>
#include <unordered_map>
#include <vector>

namespace livecap::capture {

// Stream -> absolute media playlist URL
using StreamMap = std::unordered_map<media::Stream, core::Url>;

// Highest numeric BANDWIDTH; the first one wins a tie. Variants whose
// bandwidth is not a number are skipped. nullptr when none qualifies.
[[nodiscard]] const media::HLSVariant*
select_variant(const std::vector<media::HLSVariant>& variants) noexcept;

// Builds the stream map of a capture from its entry playlist
class PlaylistResolver {
public:
    explicit PlaylistResolver(std::shared_ptr<core::HttpClient> client) noexcept
        : client_(std::move(client)) {}

    [[nodiscard]] std::expected<StreamMap, std::error_code>
    resolve(const core::Url& entry_url, std::stop_token stoken = {}) const;

    // Master playlist already parsed; `base` is the URL it was served from
    [[nodiscard]] static std::expected<StreamMap, std::error_code>
    streams_from_master(const media::HLSMasterPlaylist& master, const core::Url& base);

private:
    std::shared_ptr<core::HttpClient> client_;
};

} // namespace livecap::capture
