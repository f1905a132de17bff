#include "lcars/transfer/libtorrent_backend.hpp"
#include "lcars/core/logger.hpp"
#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/alert_types.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <libtorrent/session.hpp>
#include <libtorrent/settings_pack.hpp>
#include <libtorrent/torrent_flags.hpp>
#include <libtorrent/torrent_status.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <vector>

namespace lt = libtorrent;

namespace lcars::transfer {

using core::ErrorCode;
using core::Result;

namespace {
const char* const USER_AGENT = "lcars-netcore/0.4.0";

lt::settings_pack make_settings(const core::TransferSettings& settings) {
    lt::settings_pack pack;
    pack.set_int(lt::settings_pack::alert_mask, lt::alert_category::error | lt::alert_category::storage);
    pack.set_str(lt::settings_pack::user_agent, USER_AGENT);
    pack.set_str(lt::settings_pack::listen_interfaces,
                 LibtorrentBackend::listen_interfaces(settings.port_range.first));
    pack.set_int(lt::settings_pack::connections_limit, static_cast<int>(settings.max_connections));
    pack.set_int(lt::settings_pack::stop_tracker_timeout, 1);

    // Port mapping would announce the tunnel's address to the local router
    pack.set_bool(lt::settings_pack::enable_upnp, false);
    pack.set_bool(lt::settings_pack::enable_natpmp, false);
    pack.set_bool(lt::settings_pack::enable_lsd, false);
    pack.set_bool(lt::settings_pack::enable_dht, true);
    return pack;
}
}

LibtorrentBackend::LibtorrentBackend(const core::TransferSettings& settings)
    : settings_(settings)
    , session_(std::make_unique<lt::session>(make_settings(settings))) {
    LOG_INFO("libtorrent session listening on port {}", settings_.port_range.first);
}

LibtorrentBackend::~LibtorrentBackend() {
    LOG_DEBUG("Closing libtorrent session with {} torrent(s)", torrents_.size());
}

std::string LibtorrentBackend::listen_interfaces(uint16_t port, const std::string& interface_name) {
    if (!interface_name.empty()) {
        return fmt::format("{}:{}", interface_name, port);
    }
    return fmt::format("0.0.0.0:{},[::]:{}", port, port);
}

core::ValueResult<lt::torrent_handle> LibtorrentBackend::find(const std::string& source_id) const {
    auto it = torrents_.find(source_id);
    if (it == torrents_.end() || !it->second.is_valid()) {
        return Result(ErrorCode::NOT_FOUND, "No torrent for " + source_id);
    }
    return it->second;
}

Result LibtorrentBackend::start(const std::string& source_id,
                                const std::string& source_uri,
                                const std::filesystem::path& download_directory) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (torrents_.count(source_id) > 0) {
        return Result(ErrorCode::INVALID_TRANSITION, "Torrent already added: " + source_id);
    }

    lt::error_code ec;
    auto params = lt::parse_magnet_uri(source_uri, ec);
    if (ec) {
        return Result(ErrorCode::INVALID_INPUT, "libtorrent rejected " + source_uri + ": " + ec.message());
    }

    params.save_path = download_directory.string();
    // The engine owns pause and resume
    params.flags &= ~lt::torrent_flags::auto_managed;
    params.flags &= ~lt::torrent_flags::paused;

    auto handle = session_->add_torrent(std::move(params), ec);
    if (ec) {
        return Result(ErrorCode::FATAL_STORAGE, "Cannot add torrent " + source_id + ": " + ec.message());
    }

    torrents_[source_id] = handle;
    LOG_DEBUG("libtorrent started {} into {}", source_id, download_directory.string());
    return Result();
}

Result LibtorrentBackend::pause(const std::string& source_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto handle = find(source_id);
    if (!handle) {
        return handle.status;
    }
    handle->pause();
    return Result();
}

Result LibtorrentBackend::resume(const std::string& source_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto handle = find(source_id);
    if (!handle) {
        return handle.status;
    }
    handle->resume();
    return Result();
}

Result LibtorrentBackend::restart(const std::string& source_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto handle = find(source_id);
    if (!handle) {
        return handle.status;
    }
    handle->clear_error();
    handle->resume();
    handle->force_reannounce();
    return Result();
}

Result LibtorrentBackend::remove(const std::string& source_id, bool delete_data) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto handle = find(source_id);
    if (!handle) {
        return handle.status;
    }

    torrents_.erase(source_id);
    session_->remove_torrent(*handle, delete_data ? lt::session::delete_files : lt::remove_flags_t{});
    return Result();
}

std::optional<BackendStats> LibtorrentBackend::poll(const std::string& source_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    log_alerts();

    auto handle = find(source_id);
    if (!handle) {
        return std::nullopt;
    }
    return to_backend_stats(handle->status());
}

Result LibtorrentBackend::set_traffic_mark(uint32_t fwmark, const std::string& interface_name) {
    std::lock_guard<std::mutex> lock(mutex_);

    lt::settings_pack pack;
    pack.set_str(lt::settings_pack::outgoing_interfaces, interface_name);
    pack.set_str(lt::settings_pack::listen_interfaces,
                 listen_interfaces(settings_.port_range.first, interface_name));
    session_->apply_settings(std::move(pack));

    LOG_INFO("Peer sockets bound to {} (routing mark {:#x})", interface_name, fwmark);
    return Result();
}

BackendStats LibtorrentBackend::to_backend_stats(const lt::torrent_status& status) {
    BackendStats stats;

    stats.active = status.has_metadata &&
                   (status.state == lt::torrent_status::downloading ||
                    status.state == lt::torrent_status::finished ||
                    status.state == lt::torrent_status::seeding);
    stats.progress = static_cast<double>(status.progress);
    stats.download_rate = static_cast<uint64_t>(std::max(status.download_payload_rate, 0));
    stats.upload_rate = static_cast<uint64_t>(std::max(status.upload_payload_rate, 0));
    stats.bytes_downloaded = static_cast<uint64_t>(std::max<std::int64_t>(status.total_done, 0));
    stats.bytes_uploaded = static_cast<uint64_t>(std::max<std::int64_t>(status.all_time_upload, 0));
    if (status.has_metadata) {
        stats.size_bytes = static_cast<uint64_t>(std::max<std::int64_t>(status.total_wanted, 0));
    }
    stats.peer_count = static_cast<uint32_t>(std::max(status.num_peers, 0));

    if (status.errc) {
        // A file index (or the part file) means the disk failed, not the swarm
        bool storage = static_cast<int>(status.error_file) >= 0 ||
                       status.error_file == lt::torrent_status::error_file_partfile;
        stats.error = BackendError{
            storage ? BackendErrorKind::FATAL_STORAGE : BackendErrorKind::TRANSIENT_NETWORK,
            status.errc.message()};
    }

    return stats;
}

void LibtorrentBackend::log_alerts() {
    std::vector<lt::alert*> alerts;
    session_->pop_alerts(&alerts);

    for (const lt::alert* alert : alerts) {
        if (lt::alert_cast<lt::torrent_error_alert>(alert) || lt::alert_cast<lt::file_error_alert>(alert)) {
            LOG_WARN("libtorrent: {}", alert->message());
        } else {
            LOG_DEBUG("libtorrent: {}", alert->message());
        }
    }
}

}
