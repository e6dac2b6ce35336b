// Copyright (c) 2026 changcheng967. All rights reserved.

#include <livecap/media/encryption.hpp>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <memory>

namespace livecap::media {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::optional<AesIv> parse_iv(std::string_view text) noexcept {
    if (text.starts_with("0x") || text.starts_with("0X")) {
        text.remove_prefix(2);
    } else {
        return std::nullopt;
    }
    if (text.empty() || text.size() > AES_BLOCK_SIZE * 2) {
        return std::nullopt;
    }

    // Right-align shorter values
    AesIv iv{};
    std::size_t nibble = AES_BLOCK_SIZE * 2 - text.size();
    for (char c : text) {
        int v = hex_value(c);
        if (v < 0) {
            return std::nullopt;
        }
        auto& byte = iv[nibble / 2];
        byte = static_cast<std::uint8_t>(nibble % 2 == 0 ? (v << 4) : (byte | v));
        ++nibble;
    }
    return iv;
}

AesIv iv_from_sequence(std::uint64_t sequence) noexcept {
    AesIv iv{};
    for (std::size_t i = 0; i < 8; ++i) {
        iv[AES_BLOCK_SIZE - 1 - i] = static_cast<std::uint8_t>(sequence >> (8 * i));
    }
    return iv;
}

Encryption Encryption::aes_128(const AesKey& key, std::optional<AesIv> iv) noexcept {
    Encryption enc;
    enc.method_ = EncryptionMethod::aes_128;
    enc.key_ = key;
    if (iv) {
        enc.iv_ = *iv;
        enc.explicit_iv_ = true;
    }
    return enc;
}

std::expected<Encryption, std::error_code>
Encryption::resolve(core::HttpClient& client, const HLSKey& key, const core::Url& playlist_url,
                    std::uint64_t sequence, std::stop_token stoken) {
    if (key.method == "NONE") {
        return Encryption::none();
    }
    if (key.method != "AES-128") {
        spdlog::error("Unsupported encryption method {}", key.method);
        return std::unexpected(make_error_code(MediaErrc::unsupported_encryption));
    }
    if (!key.uri) {
        return std::unexpected(make_error_code(MediaErrc::missing_uri));
    }

    std::optional<AesIv> iv;
    if (key.iv) {
        iv = parse_iv(*key.iv);
        if (!iv) {
            return std::unexpected(make_error_code(MediaErrc::invalid_iv));
        }
    }

    auto key_url = playlist_url.resolve(*key.uri);
    if (!key_url) {
        return std::unexpected(key_url.error());
    }

    auto response = client.get(*key_url, std::move(stoken));
    if (!response) {
        spdlog::error("Failed to fetch key {}: {}", key_url->full(), response.error().message());
        return std::unexpected(response.error());
    }
    if (response->body.size() != AES_BLOCK_SIZE) {
        spdlog::error("Key {} is {} bytes, expected {}", key_url->full(),
                      response->body.size(), AES_BLOCK_SIZE);
        return std::unexpected(make_error_code(MediaErrc::invalid_key));
    }

    AesKey aes_key{};
    std::copy(response->body.begin(), response->body.end(), aes_key.begin());
    return aes_128(aes_key, iv).for_sequence(sequence);
}

Encryption Encryption::for_sequence(std::uint64_t sequence) const noexcept {
    Encryption enc = *this;
    if (method_ == EncryptionMethod::aes_128 && !explicit_iv_) {
        enc.iv_ = iv_from_sequence(sequence);
    }
    return enc;
}

std::expected<core::Bytes, std::error_code>
Encryption::decrypt(std::span<const std::uint8_t> data) const {
    if (method_ == EncryptionMethod::none) {
        return core::Bytes(data.begin(), data.end());
    }
    if (data.empty() || data.size() % AES_BLOCK_SIZE != 0) {
        return std::unexpected(make_error_code(MediaErrc::decrypt_failed));
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::unexpected(make_error_code(MediaErrc::decrypt_failed));
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, key_.data(), iv_.data()) != 1) {
        return std::unexpected(make_error_code(MediaErrc::decrypt_failed));
    }

    core::Bytes out(data.size() + AES_BLOCK_SIZE);
    int out_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), out.data(), &out_len, data.data(),
                          static_cast<int>(data.size())) != 1) {
        return std::unexpected(make_error_code(MediaErrc::decrypt_failed));
    }

    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + out_len, &final_len) != 1) {
        // Bad PKCS#7 padding, usually a wrong key or IV
        return std::unexpected(make_error_code(MediaErrc::decrypt_failed));
    }

    out.resize(static_cast<std::size_t>(out_len + final_len));
    return out;
}

} // namespace livecap::media
