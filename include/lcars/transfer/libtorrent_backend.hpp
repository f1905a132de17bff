#pragma once

#include "lcars/core/settings.hpp"
#include "lcars/transfer/transfer_backend.hpp"
#include <libtorrent/fwd.hpp>
#include <libtorrent/torrent_handle.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace lcars::transfer {

// Peer-transfer engine backed by a libtorrent session. One torrent per
// source_id; the TransferEngine decides when each one runs.
class LibtorrentBackend : public TransferBackend {
public:
    explicit LibtorrentBackend(const core::TransferSettings& settings);
    ~LibtorrentBackend() override;

    LibtorrentBackend(const LibtorrentBackend&) = delete;
    LibtorrentBackend& operator=(const LibtorrentBackend&) = delete;

    core::Result start(const std::string& source_id,
                       const std::string& source_uri,
                       const std::filesystem::path& download_directory) override;
    core::Result pause(const std::string& source_id) override;
    core::Result resume(const std::string& source_id) override;
    core::Result restart(const std::string& source_id) override;
    core::Result remove(const std::string& source_id, bool delete_data) override;
    std::optional<BackendStats> poll(const std::string& source_id) override;

    // libtorrent cannot mark sockets, so peers are bound to the interface
    // instead (SO_BINDTODEVICE); the fwmark rules cover everything else
    core::Result set_traffic_mark(uint32_t fwmark, const std::string& interface_name) override;

    static BackendStats to_backend_stats(const libtorrent::torrent_status& status);

    // "0.0.0.0:6881,[::]:6881" or "wg0:6881"
    static std::string listen_interfaces(uint16_t port, const std::string& interface_name = "");

private:
    core::TransferSettings settings_;
    std::unique_ptr<libtorrent::session> session_;
    std::map<std::string, libtorrent::torrent_handle> torrents_;
    mutable std::mutex mutex_;

    // Called with mutex_ held
    core::ValueResult<libtorrent::torrent_handle> find(const std::string& source_id) const;
    void log_alerts();
};

} // namespace lcars::transfer
