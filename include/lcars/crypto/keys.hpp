#pragma once

#include "lcars/core/error.hpp"
#include <array>
#include <vector>
#include <span>
#include <string>
#include <string_view>
#include <cstdint>

namespace lcars::crypto {

// Curve25519 keys as used by WireGuard
constexpr size_t WIREGUARD_KEY_SIZE = 32;

// BitTorrent-sized digest for content-addressed source ids
constexpr size_t SOURCE_DIGEST_SIZE = 20;

using SourceDigest = std::array<std::uint8_t, SOURCE_DIGEST_SIZE>;

// Byte buffer that is wiped on destruction
struct SecureBytes {
    std::vector<std::uint8_t> data;

    SecureBytes() = default;
    explicit SecureBytes(size_t size);
    SecureBytes(std::span<const std::uint8_t> bytes);

    ~SecureBytes();

    SecureBytes(const SecureBytes&) = delete;
    SecureBytes& operator=(const SecureBytes&) = delete;

    SecureBytes(SecureBytes&& other) noexcept;
    SecureBytes& operator=(SecureBytes&& other) noexcept;

    std::uint8_t* data_ptr() { return data.data(); }
    const std::uint8_t* data_ptr() const { return data.data(); }
    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }

    std::span<const std::uint8_t> span() const { return std::span(data); }

    void clear();
};

// Must succeed before any other function here is used
bool initialize();

core::ValueResult<SecureBytes> decode_key(std::string_view base64);
std::string encode_key(std::span<const std::uint8_t> key);

// Base64 public key for a base64 private key
core::ValueResult<std::string> derive_public_key(std::string_view private_key_base64);

SourceDigest source_digest(std::string_view content);
std::string source_digest_hex(std::string_view content);

} // namespace lcars::crypto
