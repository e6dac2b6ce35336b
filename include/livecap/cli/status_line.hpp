// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <livecap/capture/live_capture.hpp>
#include <cstdint>
#include <string>

namespace livecap::cli {

// Single-line capture status with a spinner, redrawn in place
class StatusLine {
public:
    void update(const capture::CaptureProgress& progress);

    // Leave the last status on screen
    void finish() noexcept;

    // Erase the line
    void clear() noexcept;

    [[nodiscard]] static std::string render(const capture::CaptureProgress& progress,
                                            std::size_t frame);
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);

private:
    std::size_t frame_{0};
    std::size_t last_width_{0};
    bool drawn_{false};
};

} // namespace livecap::cli
