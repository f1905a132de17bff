#pragma once

#include "lcars/events/event_bus.hpp"
#include "lcars/transfer/transfer_engine.hpp"
#include "lcars/tunnel/tunnel_service.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace lcars::network {

// Holds the transfer engine whenever the tunnel is not connected.
// Pauses run synchronously inside tunnel transitions; resumes are tied to
// the connection epoch that announced them.
class KillSwitchCoordinator {
public:
    KillSwitchCoordinator(std::shared_ptr<transfer::TransferEngine> engine,
                          std::shared_ptr<tunnel::TunnelService> tunnel,
                          std::shared_ptr<events::EventBus> bus);
    ~KillSwitchCoordinator();

    KillSwitchCoordinator(const KillSwitchCoordinator&) = delete;
    KillSwitchCoordinator& operator=(const KillSwitchCoordinator&) = delete;

    bool start();
    void stop();
    bool is_running() const { return running_; }

    uint64_t resync_count() const { return resyncs_; }

private:
    static constexpr auto RECEIVE_TIMEOUT = std::chrono::milliseconds(200);

    std::shared_ptr<transfer::TransferEngine> engine_;
    std::shared_ptr<tunnel::TunnelService> tunnel_;
    std::shared_ptr<events::EventBus> bus_;

    std::shared_ptr<events::Subscription> subscription_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> resyncs_;
    std::thread thread_;

    void run();
    void handle(const events::Event& event);
    void resync();
};

} // namespace lcars::network
