#pragma once

#include "lcars/transfer/transfer.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace lcars::events {

using transfer::MediaRef;
using transfer::PauseReason;
using transfer::TransferStatus;

// Transfer events

struct TransferAdded {
    std::string source_id;
    MediaRef media_ref;
    std::string source_uri;
};

struct TransferProgress {
    std::string source_id;
    MediaRef media_ref;
    double progress = 0.0;
    uint64_t download_rate = 0;
    uint64_t upload_rate = 0;
    uint32_t peer_count = 0;
    double ratio = 0.0;
};

struct TransferStatusChanged {
    std::string source_id;
    MediaRef media_ref;
    TransferStatus old_status = TransferStatus::QUEUED;
    TransferStatus new_status = TransferStatus::QUEUED;
    std::optional<PauseReason> pause_reason;
};

struct TransferCompleted {
    std::string source_id;
    MediaRef media_ref;
    std::optional<uint64_t> size_bytes;
};

struct TransferError {
    std::string source_id;
    MediaRef media_ref;
    core::ErrorCode error = core::ErrorCode::SUCCESS;
    std::string message;
};

struct TransferRemoved {
    std::string source_id;
    MediaRef media_ref;
    bool data_deleted = false;
};

// Tunnel events

struct TunnelConnecting {
    std::string interface_name;
};

struct TunnelConnected {
    std::string interface_name;
    std::string endpoint;
    uint64_t connection_epoch = 0;
};

struct TunnelDisconnected {
    std::string interface_name;
    std::string reason;
};

struct TunnelReconnecting {
    uint32_t attempt = 0;
    std::chrono::milliseconds delay{0};
};

struct TunnelStatsUpdate {
    uint64_t rx_bytes = 0;
    uint64_t tx_bytes = 0;
    std::optional<std::chrono::system_clock::time_point> last_handshake;
};

struct TunnelError {
    std::string message;
    bool will_retry = false;
};

using Event = std::variant<
    TransferAdded,
    TransferProgress,
    TransferStatusChanged,
    TransferCompleted,
    TransferError,
    TransferRemoved,
    TunnelConnecting,
    TunnelConnected,
    TunnelDisconnected,
    TunnelReconnecting,
    TunnelStatsUpdate,
    TunnelError>;

const char* event_name(const Event& event);

// Source id for transfer events, empty for tunnel events
std::string event_source_id(const Event& event);

bool is_tunnel_event(const Event& event);

} // namespace lcars::events
