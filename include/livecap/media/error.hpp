// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace livecap::media {

enum class MediaErrc {
    success = 0,
    empty_playlist,
    not_a_playlist,
    malformed_tag,
    missing_uri,
    unsupported_encryption,
    invalid_key,
    invalid_iv,
    decrypt_failed,
    unknown_format,
};

namespace detail {

struct MediaErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "livecap::media";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<MediaErrc>(ev)) {
            case MediaErrc::success:                return "Success";
            case MediaErrc::empty_playlist:         return "Playlist is empty";
            case MediaErrc::not_a_playlist:         return "Not an M3U8 playlist";
            case MediaErrc::malformed_tag:          return "Malformed playlist tag";
            case MediaErrc::missing_uri:            return "Playlist entry has no URI";
            case MediaErrc::unsupported_encryption: return "Unsupported encryption method";
            case MediaErrc::invalid_key:            return "Invalid encryption key";
            case MediaErrc::invalid_iv:             return "Invalid initialization vector";
            case MediaErrc::decrypt_failed:         return "Decryption failed";
            case MediaErrc::unknown_format:         return "Unrecognized media format";
            default:                                return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::MediaErrcCategory& media_errc_category() noexcept {
    static detail::MediaErrcCategory category;
    return category;
}

inline std::error_code make_error_code(MediaErrc e) noexcept {
    return {static_cast<int>(e), media_errc_category()};
}

} // namespace livecap::media

namespace std {

template<>
struct is_error_code_enum<livecap::media::MediaErrc> : true_type {};

} // namespace std
