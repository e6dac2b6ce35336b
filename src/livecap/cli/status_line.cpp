// Copyright (c) 2026 changcheng967. All rights reserved.

#include <livecap/cli/status_line.hpp>
#include <format>
#include <iostream>

namespace livecap::cli {

namespace {

const char* SPINNER_FRAMES[] = {"-", "\\", "|", "/"};

} // namespace

std::string StatusLine::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    if (bytes >= GB) {
        return std::format("{:.2f} GB", static_cast<double>(bytes) / GB);
    } else if (bytes >= MB) {
        return std::format("{:.1f} MB", static_cast<double>(bytes) / MB);
    } else if (bytes >= KB) {
        return std::format("{:.0f} KB", static_cast<double>(bytes) / KB);
    }
    return std::format("{} B", bytes);
}

std::string StatusLine::render(const capture::CaptureProgress& progress, std::size_t frame) {
    std::string line = std::format("{} {} segments, {}", SPINNER_FRAMES[frame % 4],
                                   progress.segments_saved, format_bytes(progress.bytes_written));
    if (progress.segments_dropped > 0) {
        line += std::format(", {} dropped", progress.segments_dropped);
    }
    line += std::format(" ({} live)", progress.active_pollers);
    return line;
}

void StatusLine::update(const capture::CaptureProgress& progress) {
    auto line = render(progress, frame_++);
    std::size_t width = line.size();
    if (width < last_width_) {
        line += std::string(last_width_ - width, ' ');
    }
    last_width_ = width;
    drawn_ = true;
    std::cout << '\r' << line << std::flush;
}

void StatusLine::finish() noexcept {
    if (drawn_) {
        std::cout << std::endl;
        drawn_ = false;
    }
}

void StatusLine::clear() noexcept {
    if (drawn_) {
        std::cout << '\r' << std::string(last_width_, ' ') << '\r' << std::flush;
        drawn_ = false;
    }
}

} // namespace livecap::cli
