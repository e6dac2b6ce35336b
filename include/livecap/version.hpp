// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace livecap {

constexpr std::string_view PROJECT_NAME = "livecap";

constexpr struct Version {
    std::uint32_t major = 0;
    std::uint32_t minor = 3;
    std::uint32_t patch = 0;

    constexpr auto operator<=>(const Version&) const = default;

    [[nodiscard]] std::string to_string() const {
        return std::format("{}.{}.{}", major, minor, patch);
    }
} version;

// Sent with every HTTP request
[[nodiscard]] inline std::string user_agent() {
    return std::format("{}/{}", PROJECT_NAME, version.to_string());
}

} // namespace livecap
