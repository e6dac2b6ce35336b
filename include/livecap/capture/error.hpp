// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace livecap::capture {

enum class CaptureErrc {
    success = 0,
    playlist_error,     // Entry playlist unusable, nothing started
    no_variants,        // Master playlist without a usable variant
    poll_error,         // A stream's playlist failed mid-capture
    fetch_error,        // One segment could not be fetched or decrypted
    write_error,        // One segment could not be persisted
    remux_error,
};

namespace detail {

struct CaptureErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "livecap::capture";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<CaptureErrc>(ev)) {
            case CaptureErrc::success:        return "Success";
            case CaptureErrc::playlist_error: return "Failed to load the playlist";
            case CaptureErrc::no_variants:    return "Playlist has no usable variant";
            case CaptureErrc::poll_error:     return "Failed to poll a stream playlist";
            case CaptureErrc::fetch_error:    return "Failed to fetch a segment";
            case CaptureErrc::write_error:    return "Failed to write a segment";
            case CaptureErrc::remux_error:    return "Failed to remux the capture";
            default:                          return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::CaptureErrcCategory& capture_errc_category() noexcept {
    static detail::CaptureErrcCategory category;
    return category;
}

inline std::error_code make_error_code(CaptureErrc e) noexcept {
    return {static_cast<int>(e), capture_errc_category()};
}

} // namespace livecap::capture

namespace std {

template<>
struct is_error_code_enum<livecap::capture::CaptureErrc> : true_type {};

} // namespace std
