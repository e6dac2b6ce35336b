// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <livecap/core/http_client.hpp>
#include <livecap/core/url.hpp>
#include <livecap/media/error.hpp>
#include <livecap/media/hls_parser.hpp>
#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <stop_token>

namespace livecap::media {

enum class EncryptionMethod : std::uint8_t {
    none,
    aes_128
};

constexpr std::size_t AES_BLOCK_SIZE = 16;

using AesKey = std::array<std::uint8_t, AES_BLOCK_SIZE>;
using AesIv = std::array<std::uint8_t, AES_BLOCK_SIZE>;

// Decryption context of a media playlist, in force until the next EXT-X-KEY
class Encryption {
public:
    Encryption() noexcept = default;

    static Encryption none() noexcept { return Encryption{}; }
    static Encryption aes_128(const AesKey& key, std::optional<AesIv> iv) noexcept;

    // Fetch the key named by `key` (relative to the playlist URL)
    [[nodiscard]] static std::expected<Encryption, std::error_code>
    resolve(core::HttpClient& client, const HLSKey& key, const core::Url& playlist_url,
            std::uint64_t sequence, std::stop_token stoken = {});

    // Same key, IV bound to `sequence` unless the playlist declared one
    [[nodiscard]] Encryption for_sequence(std::uint64_t sequence) const noexcept;

    [[nodiscard]] std::expected<core::Bytes, std::error_code>
    decrypt(std::span<const std::uint8_t> data) const;

    [[nodiscard]] EncryptionMethod method() const noexcept { return method_; }
    [[nodiscard]] bool is_none() const noexcept { return method_ == EncryptionMethod::none; }
    [[nodiscard]] const AesIv& iv() const noexcept { return iv_; }

private:
    EncryptionMethod method_{EncryptionMethod::none};
    AesKey key_{};
    AesIv iv_{};
    bool explicit_iv_{false};
};

// "0x" followed by 32 hex digits
[[nodiscard]] std::optional<AesIv> parse_iv(std::string_view text) noexcept;

// Big-endian 128-bit media sequence number
[[nodiscard]] AesIv iv_from_sequence(std::uint64_t sequence) noexcept;

} // namespace livecap::media
