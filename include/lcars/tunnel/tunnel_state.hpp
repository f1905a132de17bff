#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace lcars::tunnel {

enum class TunnelStatus {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    RECONNECTING,
    ERROR
};

const char* tunnel_status_to_string(TunnelStatus status);

struct TunnelState {
    TunnelStatus status = TunnelStatus::DISCONNECTED;
    std::string error_message;   // set while status is ERROR

    std::string interface_name;
    std::string endpoint;
    std::optional<std::chrono::system_clock::time_point> connected_since;
    std::optional<std::chrono::system_clock::time_point> last_handshake;
    uint64_t rx_bytes = 0;
    uint64_t tx_bytes = 0;

    uint32_t reconnect_attempt = 0;
    uint64_t connection_epoch = 0;   // bumped on every entry into CONNECTED

    bool is_connected() const { return status == TunnelStatus::CONNECTED; }
};

} // namespace lcars::tunnel
