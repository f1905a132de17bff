#pragma once

#include "lcars/core/error.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace lcars::transfer {

enum class BackendErrorKind {
    TRANSIENT_NETWORK,
    FATAL_STORAGE
};

struct BackendError {
    BackendErrorKind kind;
    std::string message;
};

// Snapshot of one transfer as reported by the peer-transfer engine
struct BackendStats {
    bool active = false;           // metadata resolved and exchanging data
    double progress = 0.0;
    uint64_t download_rate = 0;
    uint64_t upload_rate = 0;
    uint64_t bytes_downloaded = 0;
    uint64_t bytes_uploaded = 0;
    std::optional<uint64_t> size_bytes;
    uint32_t peer_count = 0;
    std::optional<BackendError> error;
};

// Peer-transfer engine boundary. Implementations own the wire protocol;
// the TransferEngine owns the lifecycle.
class TransferBackend {
public:
    virtual ~TransferBackend() = default;

    virtual core::Result start(const std::string& source_id,
                               const std::string& source_uri,
                               const std::filesystem::path& download_directory) = 0;
    virtual core::Result pause(const std::string& source_id) = 0;
    virtual core::Result resume(const std::string& source_id) = 0;

    // Retry after a transient error
    virtual core::Result restart(const std::string& source_id) = 0;

    virtual core::Result remove(const std::string& source_id, bool delete_data) = 0;

    virtual std::optional<BackendStats> poll(const std::string& source_id) = 0;

    // Outbound sockets must carry this mark and bind to this interface
    virtual core::Result set_traffic_mark(uint32_t fwmark, const std::string& interface_name) = 0;
};

} // namespace lcars::transfer
