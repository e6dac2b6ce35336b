// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace livecap::media {

enum class StreamKind : std::uint8_t {
    main,       // Selected variant
    video,      // Alternative renditions
    audio,
    subtitle
};

[[nodiscard]] std::string_view to_string(StreamKind kind) noexcept;

// Identity of one logical track of a capture. Immutable once built.
class Stream {
public:
    static Stream main() { return Stream(StreamKind::main, {}, std::nullopt); }
    static Stream video(std::string name, std::optional<std::string> lang = std::nullopt) {
        return Stream(StreamKind::video, std::move(name), std::move(lang));
    }
    static Stream audio(std::string name, std::optional<std::string> lang = std::nullopt) {
        return Stream(StreamKind::audio, std::move(name), std::move(lang));
    }
    static Stream subtitle(std::string name, std::optional<std::string> lang = std::nullopt) {
        return Stream(StreamKind::subtitle, std::move(name), std::move(lang));
    }

    [[nodiscard]] StreamKind kind() const noexcept { return kind_; }

    // Empty for the main stream
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::optional<std::string>& lang() const noexcept { return lang_; }

    // "main", "video_<name>", "audio_<name>" or "subtitle_<name>"
    [[nodiscard]] std::string display() const;

    bool operator==(const Stream&) const = default;

private:
    Stream(StreamKind kind, std::string name, std::optional<std::string> lang)
        : kind_(kind), name_(std::move(name)), lang_(std::move(lang)) {}

    StreamKind kind_;
    std::string name_;
    std::optional<std::string> lang_;
};

} // namespace livecap::media

template<>
struct std::hash<livecap::media::Stream> {
    std::size_t operator()(const livecap::media::Stream& s) const noexcept {
        std::size_t h = std::hash<std::uint8_t>{}(static_cast<std::uint8_t>(s.kind()));
        h ^= std::hash<std::string>{}(s.name()) + 0x9e3779b9 + (h << 6) + (h >> 2);
        if (s.lang()) {
            h ^= std::hash<std::string>{}(*s.lang()) + 0x9e3779b9 + (h << 6) + (h >> 2);
        }
        return h;
    }
};
