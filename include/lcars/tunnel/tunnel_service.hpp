#pragma once

#include "lcars/core/error.hpp"
#include "lcars/core/settings.hpp"
#include "lcars/events/event_bus.hpp"
#include "lcars/tunnel/tunnel_backend.hpp"
#include "lcars/tunnel/tunnel_state.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace lcars::tunnel {

class TunnelService {
public:
    // Runs synchronously inside every transition that leaves CONNECTED and
    // after every failed connect, before any event is published
    using DisconnectGuard = std::function<void()>;

    using BindingApply = std::function<core::Result(const std::string& interface_name)>;
    using BindingRemove = std::function<core::Result()>;

    TunnelService(const core::TunnelSettings& settings,
                  std::shared_ptr<TunnelBackend> backend,
                  std::shared_ptr<events::EventBus> bus);
    ~TunnelService();

    TunnelService(const TunnelService&) = delete;
    TunnelService& operator=(const TunnelService&) = delete;

    // Lifecycle runtime: health checks and reconnect timers
    bool start();
    void stop();
    bool is_running() const { return running_; }

    core::Result connect();

    // Cancels an in-flight bring-up, then releases the interface and binding.
    // Always ends DISCONNECTED; reports the first teardown step that failed.
    core::Result disconnect();
    void health_check();

    TunnelState get_status() const;

    // Runs fn under the transition lock only while CONNECTED with this epoch
    bool run_if_connected(uint64_t epoch, const std::function<void()>& fn);

    void set_disconnect_guard(DisconnectGuard guard);
    void set_traffic_binding(BindingApply apply, BindingRemove remove);

    std::chrono::milliseconds reconnect_delay(uint32_t attempt) const;

private:
    core::TunnelSettings settings_;
    std::shared_ptr<TunnelBackend> backend_;
    std::shared_ptr<events::EventBus> bus_;

    DisconnectGuard disconnect_guard_;
    BindingApply binding_apply_;
    BindingRemove binding_remove_;

    // Serializes every state transition
    mutable std::mutex transition_mutex_;

    TunnelState state_;
    mutable std::mutex state_mutex_;

    // Invalidates timers and bring-ups started for an earlier attempt. Bumped by
    // disconnect() before it takes the transition lock.
    std::atomic<uint64_t> generation_;

    std::atomic<bool> running_;
    boost::asio::io_context io_context_;
    boost::asio::steady_timer health_timer_;
    boost::asio::steady_timer reconnect_timer_;
    std::thread io_thread_;

    // Called with transition_mutex_ held
    core::Result attempt_connect();
    void enter_connected(const LinkInfo& link);
    core::Result leave_connected();
    void enter_reconnecting();
    void enter_error(const std::string& message);
    core::Result fire_guard();
    core::Result tear_down_backend();
    void update_state(const std::function<void(TunnelState&)>& update);

    void schedule_health_check();
    void schedule_reconnect(uint64_t generation, std::chrono::milliseconds delay);
    void on_reconnect_timer(uint64_t generation);
};

} // namespace lcars::tunnel
