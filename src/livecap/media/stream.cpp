// Copyright (c) 2026 changcheng967. All rights reserved.

#include <livecap/media/stream.hpp>

namespace livecap::media {

std::string_view to_string(StreamKind kind) noexcept {
    switch (kind) {
        case StreamKind::main:     return "main";
        case StreamKind::video:    return "video";
        case StreamKind::audio:    return "audio";
        case StreamKind::subtitle: return "subtitle";
    }
    return "unknown";
}

std::string Stream::display() const {
    if (kind_ == StreamKind::main) {
        return "main";
    }
    std::string result(to_string(kind_));
    result += '_';
    result += name_;
    return result;
}

} // namespace livecap::media
