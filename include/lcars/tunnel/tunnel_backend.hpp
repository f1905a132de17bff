#pragma once

#include "lcars/core/error.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace lcars::tunnel {

struct InterfaceStats {
    uint64_t rx_bytes = 0;
    uint64_t tx_bytes = 0;
    std::optional<std::chrono::system_clock::time_point> last_handshake;
};

struct LinkInfo {
    std::string interface_name;
    std::string endpoint;
    std::optional<std::chrono::system_clock::time_point> last_handshake;
};

// Privileged side of the tunnel. The TunnelService drives it and never
// touches the network itself.
class TunnelBackend {
public:
    // Polled while bring_up() waits; true abandons the attempt
    using CancelCheck = std::function<bool()>;

    virtual ~TunnelBackend() = default;

    virtual core::Result check_privileges() = 0;

    // Creates the interface and waits for the first handshake
    virtual core::ValueResult<LinkInfo> bring_up(const CancelCheck& cancelled) = 0;

    // Attempts every teardown step; reports the first failure
    virtual core::Result tear_down() = 0;

    virtual core::ValueResult<InterfaceStats> read_stats() = 0;

    virtual std::string interface_name() const = 0;
};

} // namespace lcars::tunnel
