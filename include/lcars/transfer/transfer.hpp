#pragma once

#include "lcars/core/error.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace lcars::transfer {

enum class TransferStatus {
    QUEUED,
    DOWNLOADING,
    SEEDING,
    PROCESSING,   // set by the post-download organizer, never by the engine
    COMPLETED,
    FAILED,
    PAUSED
};

enum class PauseReason {
    USER_REQUESTED,
    KILL_SWITCH
};

const char* transfer_status_to_string(TransferStatus status);
const char* pause_reason_to_string(PauseReason reason);

inline bool is_terminal(TransferStatus status) {
    return status == TransferStatus::COMPLETED || status == TransferStatus::FAILED;
}

inline bool is_running(TransferStatus status) {
    return status == TransferStatus::DOWNLOADING || status == TransferStatus::SEEDING;
}

// Opaque reference into the external media catalog
struct MediaRef {
    std::string media_type;
    int64_t media_id = 0;

    bool operator==(const MediaRef&) const = default;
};

struct Transfer {
    std::string source_id;
    std::string source_uri;
    MediaRef media_ref;

    TransferStatus status = TransferStatus::QUEUED;
    std::optional<PauseReason> pause_reason;

    double progress = 0.0;
    uint64_t download_rate = 0;
    uint64_t upload_rate = 0;
    uint64_t bytes_downloaded = 0;
    uint64_t bytes_uploaded = 0;
    std::optional<uint64_t> size_bytes;
    double ratio = 0.0;
    uint32_t peer_count = 0;

    std::optional<core::Result> error;

    std::chrono::system_clock::time_point added_at;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> completed_at;
};

// Source URI validation and content-addressed identifiers
struct SourceUri {
    std::string source_id;
    std::string display_name;

    // magnet:?xt=urn:btih:<40 hex | 32 base32>, or a provider URI such as slsk://
    static core::ValueResult<SourceUri> parse(const std::string& uri);
};

} // namespace lcars::transfer
