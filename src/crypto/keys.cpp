#include "lcars/crypto/keys.hpp"
#include "lcars/core/logger.hpp"
#include "lcars/core/utils.hpp"
#include <sodium.h>

namespace lcars::crypto {

SecureBytes::SecureBytes(size_t size) : data(size) {
    sodium_memzero(data.data(), data.size());
}

SecureBytes::SecureBytes(std::span<const std::uint8_t> bytes)
    : data(bytes.begin(), bytes.end()) {}

SecureBytes::~SecureBytes() {
    clear();
}

SecureBytes::SecureBytes(SecureBytes&& other) noexcept
    : data(std::move(other.data)) {
    other.data.clear();
}

SecureBytes& SecureBytes::operator=(SecureBytes&& other) noexcept {
    if (this != &other) {
        clear();
        data = std::move(other.data);
        other.data.clear();
    }
    return *this;
}

void SecureBytes::clear() {
    if (!data.empty()) {
        sodium_memzero(data.data(), data.size());
        data.clear();
    }
}

bool initialize() {
    if (sodium_init() < 0) {
        LOG_CRITICAL("Failed to initialize libsodium");
        return false;
    }
    return true;
}

core::ValueResult<SecureBytes> decode_key(std::string_view base64) {
    if (base64.empty()) {
        return core::Result(core::ErrorCode::INVALID_INPUT, "Key is empty");
    }

    SecureBytes key(WIREGUARD_KEY_SIZE + 1);
    size_t decoded_length = 0;
    const char* end = nullptr;

    int rc = sodium_base642bin(key.data_ptr(), key.size(),
                               base64.data(), base64.size(),
                               nullptr, &decoded_length, &end,
                               sodium_base64_VARIANT_ORIGINAL);
    if (rc != 0 || end != base64.data() + base64.size()) {
        return core::Result(core::ErrorCode::INVALID_INPUT, "Key is not valid base64");
    }

    if (decoded_length != WIREGUARD_KEY_SIZE) {
        return core::Result(core::ErrorCode::INVALID_INPUT,
                            "Key must decode to 32 bytes, got " + std::to_string(decoded_length));
    }

    return SecureBytes(std::span<const std::uint8_t>(key.data_ptr(), WIREGUARD_KEY_SIZE));
}

std::string encode_key(std::span<const std::uint8_t> key) {
    std::string encoded(sodium_base64_ENCODED_LEN(key.size(), sodium_base64_VARIANT_ORIGINAL), '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), key.data(), key.size(),
                      sodium_base64_VARIANT_ORIGINAL);
    // Drop the terminator sodium writes
    encoded.resize(std::char_traits<char>::length(encoded.c_str()));
    return encoded;
}

core::ValueResult<std::string> derive_public_key(std::string_view private_key_base64) {
    auto private_key = decode_key(private_key_base64);
    if (!private_key) {
        return private_key.status;
    }

    std::array<std::uint8_t, WIREGUARD_KEY_SIZE> public_key{};
    if (crypto_scalarmult_base(public_key.data(), private_key->data_ptr()) != 0) {
        return core::Result(core::ErrorCode::INVALID_INPUT, "Failed to derive public key");
    }

    return encode_key(public_key);
}

SourceDigest source_digest(std::string_view content) {
    SourceDigest digest{};
    crypto_generichash(digest.data(), digest.size(),
                       reinterpret_cast<const unsigned char*>(content.data()), content.size(),
                       nullptr, 0);
    return digest;
}

std::string source_digest_hex(std::string_view content) {
    auto digest = source_digest(content);
    return core::utils::StringUtils::to_hex(digest.data(), digest.size());
}

}
