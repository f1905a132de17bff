#pragma once

#include "lcars/core/error.hpp"
#include "lcars/core/settings.hpp"
#include "lcars/events/event_bus.hpp"
#include "lcars/transfer/transfer.hpp"
#include "lcars/transfer/transfer_backend.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lcars::transfer {

class TransferEngine {
public:
    TransferEngine(const core::TransferSettings& settings,
                   std::shared_ptr<TransferBackend> backend,
                   std::shared_ptr<events::EventBus> bus);
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    // Periodic stats tick on a dedicated io thread
    bool start();
    void stop();
    bool is_running() const { return running_; }

    // Transfer control
    core::ValueResult<std::string> add(const std::string& source_uri, const MediaRef& media_ref);
    core::Result pause(const std::string& source_id);
    core::Result resume(const std::string& source_id);
    core::Result remove(const std::string& source_id, bool delete_data);

    // Kill switch hold. Only kill-switch pauses are undone by resume_all().
    void pause_all();
    void resume_all();
    bool is_held() const;

    void tick();

    core::Result set_traffic_mark(uint32_t fwmark, const std::string& interface_name);

    // Queries
    std::optional<Transfer> get(const std::string& source_id) const;
    std::vector<Transfer> list() const;
    size_t active_count() const;

private:
    struct Record {
        Transfer transfer;
        TransferStatus resume_to = TransferStatus::QUEUED;
        bool backend_started = false;
        bool space_checked = false;
        uint32_t retry_count = 0;
        std::optional<std::chrono::steady_clock::time_point> retry_at;
        std::optional<std::chrono::steady_clock::time_point> seeding_since;
    };

    core::TransferSettings settings_;
    std::shared_ptr<TransferBackend> backend_;
    std::shared_ptr<events::EventBus> bus_;

    std::map<std::string, Record> transfers_;
    bool held_;
    mutable std::mutex mutex_;

    std::atomic<bool> running_;
    boost::asio::io_context io_context_;
    boost::asio::steady_timer tick_timer_;
    std::thread io_thread_;

    // Called with mutex_ held
    void tick_record(Record& record, std::chrono::steady_clock::time_point now);
    void set_status(Record& record, TransferStatus status);
    void pause_for(Record& record, PauseReason reason);
    core::Result start_traffic(Record& record);
    void complete(Record& record);
    void fail(Record& record, core::ErrorCode code, const std::string& message);
    bool seeding_limit_reached(const Record& record, std::chrono::steady_clock::time_point now) const;
    std::chrono::milliseconds retry_delay(uint32_t attempt) const;

    void schedule_tick();
};

} // namespace lcars::transfer
