#pragma once

#include "lcars/core/error.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lcars::tunnel {

struct WireGuardPeer {
    std::string public_key;
    std::optional<std::string> preshared_key;
    std::string endpoint;
    std::vector<std::string> allowed_ips;
    uint16_t persistent_keepalive = 25;
};

// wg-quick style configuration with one [Interface] and one [Peer]
struct WireGuardConfig {
    static constexpr uint32_t DEFAULT_MTU = 1420;

    std::string private_key;
    std::vector<std::string> addresses;
    std::optional<uint16_t> listen_port;
    std::vector<std::string> dns;
    std::optional<uint32_t> mtu;

    WireGuardPeer peer;

    ~WireGuardConfig();
    WireGuardConfig() = default;
    WireGuardConfig(const WireGuardConfig&) = default;
    WireGuardConfig& operator=(const WireGuardConfig&) = default;
    WireGuardConfig(WireGuardConfig&&) = default;
    WireGuardConfig& operator=(WireGuardConfig&&) = default;

    static core::ValueResult<WireGuardConfig> parse(const std::string& text);
    static core::ValueResult<WireGuardConfig> load(const std::filesystem::path& path);

    // Required fields present and every key decodes to 32 bytes
    core::Result validate() const;
};

} // namespace lcars::tunnel
