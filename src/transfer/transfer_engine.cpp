#include "lcars/transfer/transfer_engine.hpp"
#include "lcars/core/logger.hpp"
#include "lcars/core/utils.hpp"
#include <algorithm>
#include <cmath>

namespace lcars::transfer {

using core::ErrorCode;
using core::Result;

namespace {
// A backend call that throws is reported like one that failed
template<typename Call>
Result backend_call(const char* operation, const std::string& source_id, Call&& call) {
    try {
        return call();
    } catch (const std::exception& e) {
        return Result(ErrorCode::TRANSIENT_NETWORK,
                      std::string("Backend ") + operation + " of " + source_id + " threw: " + e.what());
    }
}
}

TransferEngine::TransferEngine(const core::TransferSettings& settings,
                               std::shared_ptr<TransferBackend> backend,
                               std::shared_ptr<events::EventBus> bus)
    : settings_(settings)
    , backend_(std::move(backend))
    , bus_(std::move(bus))
    , held_(false)
    , running_(false)
    , io_context_()
    , tick_timer_(io_context_) {

    if (!core::utils::FileUtils::create_directories(settings_.download_directory)) {
        LOG_WARN("Download directory {} is not available", settings_.download_directory.string());
    }

    LOG_INFO("Transfer engine initialized (download directory: {}, seeding: {})",
             settings_.download_directory.string(), settings_.seeding.enabled ? "on" : "off");
}

TransferEngine::~TransferEngine() {
    stop();
}

bool TransferEngine::start() {
    if (running_) {
        LOG_WARN("Transfer engine already running");
        return false;
    }

    running_ = true;
    io_context_.restart();
    schedule_tick();

    io_thread_ = std::thread([this]() {
        LOG_DEBUG("Transfer engine tick loop started");

        while (running_) {
            try {
                io_context_.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("Transfer engine IO error: {}", e.what());
                if (!running_) break;

                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                io_context_.restart();
            }
        }

        LOG_DEBUG("Transfer engine tick loop stopped");
    });

    return true;
}

void TransferEngine::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    io_context_.stop();

    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    tick_timer_.cancel();
}

void TransferEngine::schedule_tick() {
    tick_timer_.expires_after(settings_.tick_interval);
    tick_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_) {
            return;
        }
        tick();
        schedule_tick();
    });
}

// Transfer control

core::ValueResult<std::string> TransferEngine::add(const std::string& source_uri, const MediaRef& media_ref) {
    auto parsed = SourceUri::parse(source_uri);
    if (!parsed) {
        LOG_WARN("Rejected source URI: {}", parsed.status.message);
        return parsed.status;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const auto& source_id = parsed->source_id;
    if (transfers_.count(source_id) > 0) {
        LOG_DEBUG("Transfer {} already managed", source_id);
        return source_id;
    }

    Record record;
    record.transfer.source_id = source_id;
    record.transfer.source_uri = core::utils::StringUtils::trim(source_uri);
    record.transfer.media_ref = media_ref;
    record.transfer.status = TransferStatus::QUEUED;
    record.transfer.added_at = core::utils::TimeUtils::now();

    auto& added = transfers_.emplace(source_id, std::move(record)).first->second;

    bus_->publish(events::TransferAdded{source_id, media_ref, added.transfer.source_uri});
    LOG_INFO("Added transfer {} for {}:{}", source_id, media_ref.media_type, media_ref.media_id);

    if (held_) {
        added.resume_to = TransferStatus::QUEUED;
        pause_for(added, PauseReason::KILL_SWITCH);
        return source_id;
    }

    auto started = start_traffic(added);
    if (!started) {
        fail(added, started.error, started.message);
    }

    return source_id;
}

Result TransferEngine::pause(const std::string& source_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = transfers_.find(source_id);
    if (it == transfers_.end()) {
        return Result(ErrorCode::NOT_FOUND, "Transfer not found: " + source_id);
    }

    auto& record = it->second;
    auto status = record.transfer.status;

    if (status == TransferStatus::PAUSED) {
        if (record.transfer.pause_reason == PauseReason::KILL_SWITCH) {
            // User intent outlives the tunnel outage
            record.transfer.pause_reason = PauseReason::USER_REQUESTED;
            LOG_INFO("Transfer {} kill-switch pause converted to user pause", source_id);
        }
        return Result();
    }

    if (!transfer::is_running(status)) {
        return Result(ErrorCode::INVALID_TRANSITION,
                      std::string("Cannot pause transfer in state ") + transfer_status_to_string(status));
    }

    auto result = backend_call("pause", source_id, [&] { return backend_->pause(source_id); });
    if (!result) {
        LOG_ERROR("Failed to pause transfer {}: {}", source_id, result.message);
        return result;
    }

    record.resume_to = status;
    pause_for(record, PauseReason::USER_REQUESTED);
    return Result();
}

Result TransferEngine::resume(const std::string& source_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = transfers_.find(source_id);
    if (it == transfers_.end()) {
        return Result(ErrorCode::NOT_FOUND, "Transfer not found: " + source_id);
    }

    auto& record = it->second;
    auto status = record.transfer.status;

    if (transfer::is_running(status)) {
        return Result();
    }

    if (status != TransferStatus::PAUSED) {
        return Result(ErrorCode::INVALID_TRANSITION,
                      std::string("Cannot resume transfer in state ") + transfer_status_to_string(status));
    }

    if (held_) {
        // Restarts with the tunnel instead
        record.transfer.pause_reason = PauseReason::KILL_SWITCH;
        LOG_INFO("Transfer {} will resume when the tunnel reconnects", source_id);
        return Result();
    }

    auto result = start_traffic(record);
    if (!result) {
        LOG_ERROR("Failed to resume transfer {}: {}", source_id, result.message);
        return result;
    }

    set_status(record, record.resume_to);
    return Result();
}

Result TransferEngine::remove(const std::string& source_id, bool delete_data) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = transfers_.find(source_id);
    if (it == transfers_.end()) {
        return Result(ErrorCode::NOT_FOUND, "Transfer not found: " + source_id);
    }

    Result first_error;

    // Every step runs even when an earlier one fails
    if (it->second.backend_started) {
        auto removed = backend_call("remove", source_id, [&] { return backend_->remove(source_id, delete_data); });
        if (!removed) {
            LOG_ERROR("Backend failed to remove {}: {}", source_id, removed.message);
            first_error = removed;
        }
    }

    auto media_ref = it->second.transfer.media_ref;
    transfers_.erase(it);

    bus_->publish(events::TransferRemoved{source_id, media_ref, delete_data && first_error.success()});
    LOG_INFO("Removed transfer {} (delete data: {})", source_id, delete_data);

    return first_error;
}

void TransferEngine::pause_all() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!held_) {
        LOG_WARN("Kill switch engaged: pausing all transfers");
    }
    held_ = true;

    for (auto& [source_id, record] : transfers_) {
        auto status = record.transfer.status;
        if (status != TransferStatus::QUEUED && !transfer::is_running(status)) {
            continue;
        }

        if (record.backend_started) {
            // Routing is already fail-closed; the pause proceeds regardless
            auto result = backend_call("pause", source_id, [&] { return backend_->pause(source_id); });
            if (!result) {
                LOG_ERROR("Backend failed to pause {}: {}", source_id, result.message);
            }
        }

        record.resume_to = status;
        pause_for(record, PauseReason::KILL_SWITCH);
    }
}

void TransferEngine::resume_all() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (held_) {
        LOG_INFO("Kill switch released: resuming transfers");
    }
    held_ = false;

    for (auto& [source_id, record] : transfers_) {
        if (record.transfer.status != TransferStatus::PAUSED ||
            record.transfer.pause_reason != PauseReason::KILL_SWITCH) {
            continue;
        }

        auto result = start_traffic(record);
        if (!result) {
            fail(record, result.error, result.message);
            continue;
        }
        set_status(record, record.resume_to);
    }
}

bool TransferEngine::is_held() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_;
}

Result TransferEngine::set_traffic_mark(uint32_t fwmark, const std::string& interface_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_call("traffic mark", interface_name,
                        [&] { return backend_->set_traffic_mark(fwmark, interface_name); });
}

// Stats tick

void TransferEngine::tick() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::steady_clock::now();
    for (auto& [source_id, record] : transfers_) {
        auto status = record.transfer.status;
        if (is_terminal(status) || status == TransferStatus::PAUSED ||
            status == TransferStatus::PROCESSING) {
            continue;
        }
        tick_record(record, now);
    }
}

void TransferEngine::tick_record(Record& record, std::chrono::steady_clock::time_point now) {
    auto& transfer = record.transfer;

    if (record.retry_at) {
        if (now < *record.retry_at) {
            return;
        }
        record.retry_at.reset();

        LOG_INFO("Retrying transfer {} (attempt {}/{})",
                 transfer.source_id, record.retry_count, settings_.max_retries);
        auto restarted = backend_call("restart", transfer.source_id,
                                      [&] { return backend_->restart(transfer.source_id); });
        if (!restarted) {
            LOG_WARN("Restart of {} failed: {}", transfer.source_id, restarted.message);
        }
        return;
    }

    auto stats = backend_->poll(transfer.source_id);
    if (!stats) {
        LOG_DEBUG("No stats for transfer {}", transfer.source_id);
        return;
    }

    if (stats->error) {
        if (stats->error->kind == BackendErrorKind::FATAL_STORAGE) {
            fail(record, ErrorCode::FATAL_STORAGE, stats->error->message);
            return;
        }

        record.retry_count++;
        if (record.retry_count > settings_.max_retries) {
            fail(record, ErrorCode::TRANSIENT_NETWORK,
                 stats->error->message + " (gave up after " +
                 std::to_string(settings_.max_retries) + " retries)");
            return;
        }

        auto delay = retry_delay(record.retry_count);
        record.retry_at = now + delay;
        LOG_WARN("Transfer {} network error: {}; retrying in {}",
                 transfer.source_id, stats->error->message,
                 core::utils::StringUtils::format_duration(delay));
        return;
    }

    if (stats->active) {
        record.retry_count = 0;
    }

    // Refresh statistics
    if (transfer.status == TransferStatus::DOWNLOADING || transfer.status == TransferStatus::QUEUED) {
        transfer.progress = std::max(transfer.progress, std::clamp(stats->progress, 0.0, 1.0));
    }
    transfer.download_rate = stats->download_rate;
    transfer.upload_rate = stats->upload_rate;
    transfer.bytes_downloaded = stats->bytes_downloaded;
    transfer.bytes_uploaded = stats->bytes_uploaded;
    transfer.peer_count = stats->peer_count;
    if (stats->size_bytes && *stats->size_bytes > 0) {
        transfer.size_bytes = stats->size_bytes;
    }
    transfer.ratio = transfer.size_bytes
        ? static_cast<double>(transfer.bytes_uploaded) / static_cast<double>(*transfer.size_bytes)
        : 0.0;

    if (transfer.size_bytes && !record.space_checked) {
        record.space_checked = true;
        auto remaining = *transfer.size_bytes - std::min(*transfer.size_bytes, transfer.bytes_downloaded);
        if (!settings_.has_sufficient_space(remaining)) {
            fail(record, ErrorCode::FATAL_STORAGE,
                 "Insufficient disk space for " + core::utils::StringUtils::format_bytes(remaining));
            return;
        }
    }

    bus_->publish(events::TransferProgress{
        transfer.source_id, transfer.media_ref, transfer.progress,
        transfer.download_rate, transfer.upload_rate, transfer.peer_count, transfer.ratio});

    // Transitions
    if (transfer.status == TransferStatus::QUEUED && stats->active) {
        transfer.started_at = core::utils::TimeUtils::now();
        set_status(record, TransferStatus::DOWNLOADING);
    }

    if (transfer.status == TransferStatus::DOWNLOADING && transfer.progress >= 1.0) {
        record.seeding_since = now;
        set_status(record, TransferStatus::SEEDING);
    }

    if (transfer.status == TransferStatus::SEEDING && seeding_limit_reached(record, now)) {
        complete(record);
    }
}

bool TransferEngine::seeding_limit_reached(const Record& record, std::chrono::steady_clock::time_point now) const {
    const auto& seeding = settings_.seeding;
    if (!seeding.enabled) {
        return true;
    }

    if (seeding.ratio_limit && record.transfer.ratio >= *seeding.ratio_limit) {
        return true;
    }

    if (seeding.time_limit && record.seeding_since &&
        now - *record.seeding_since >= *seeding.time_limit) {
        return true;
    }

    return false;
}

std::chrono::milliseconds TransferEngine::retry_delay(uint32_t attempt) const {
    auto base = static_cast<double>(settings_.retry_min_delay.count());
    auto delay = base * std::pow(2.0, static_cast<double>(attempt > 0 ? attempt - 1 : 0));
    auto capped = std::min(delay, static_cast<double>(settings_.retry_max_delay.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

// State changes, called with mutex_ held

void TransferEngine::set_status(Record& record, TransferStatus status) {
    auto& transfer = record.transfer;
    auto old_status = transfer.status;

    transfer.status = status;
    if (status != TransferStatus::PAUSED) {
        transfer.pause_reason.reset();
    }

    LOG_DEBUG("Transfer {}: {} -> {}", transfer.source_id,
              transfer_status_to_string(old_status), transfer_status_to_string(status));

    bus_->publish(events::TransferStatusChanged{
        transfer.source_id, transfer.media_ref, old_status, status, transfer.pause_reason});
}

void TransferEngine::pause_for(Record& record, PauseReason reason) {
    record.transfer.pause_reason = reason;
    record.transfer.download_rate = 0;
    record.transfer.upload_rate = 0;
    set_status(record, TransferStatus::PAUSED);
}

Result TransferEngine::start_traffic(Record& record) {
    const auto& source_id = record.transfer.source_id;

    if (!record.backend_started) {
        auto started = backend_call("start", source_id, [&] {
            return backend_->start(source_id, record.transfer.source_uri, settings_.download_directory);
        });
        if (started) {
            record.backend_started = true;
        }
        return started;
    }

    return backend_call("resume", source_id, [&] { return backend_->resume(source_id); });
}

void TransferEngine::complete(Record& record) {
    auto& transfer = record.transfer;

    auto paused = backend_call("pause", transfer.source_id, [&] { return backend_->pause(transfer.source_id); });
    if (!paused) {
        LOG_WARN("Failed to stop seeding {}: {}", transfer.source_id, paused.message);
    }

    transfer.completed_at = core::utils::TimeUtils::now();
    transfer.download_rate = 0;
    transfer.upload_rate = 0;
    set_status(record, TransferStatus::COMPLETED);

    bus_->publish(events::TransferCompleted{transfer.source_id, transfer.media_ref, transfer.size_bytes});
    LOG_INFO("Transfer {} completed (ratio {:.2f})", transfer.source_id, transfer.ratio);
}

void TransferEngine::fail(Record& record, ErrorCode code, const std::string& message) {
    auto& transfer = record.transfer;

    if (record.backend_started) {
        auto paused = backend_call("pause", transfer.source_id, [&] { return backend_->pause(transfer.source_id); });
        if (!paused) {
            LOG_WARN("Failed to stop failed transfer {}: {}", transfer.source_id, paused.message);
        }
    }

    record.retry_at.reset();
    transfer.error = Result(code, message);
    transfer.download_rate = 0;
    transfer.upload_rate = 0;
    set_status(record, TransferStatus::FAILED);

    bus_->publish(events::TransferError{transfer.source_id, transfer.media_ref, code, message});
    LOG_ERROR("Transfer {} failed: {}", transfer.source_id, transfer.error->to_string());
}

// Queries

std::optional<Transfer> TransferEngine::get(const std::string& source_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(source_id);
    if (it == transfers_.end()) {
        return std::nullopt;
    }
    return it->second.transfer;
}

std::vector<Transfer> TransferEngine::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Transfer> result;
    result.reserve(transfers_.size());
    for (const auto& [_, record] : transfers_) {
        result.push_back(record.transfer);
    }
    return result;
}

size_t TransferEngine::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(transfers_.begin(), transfers_.end(),
        [](const auto& entry) { return transfer::is_running(entry.second.transfer.status); }));
}

}
