#pragma once

#include "lcars/core/error.hpp"
#include "lcars/core/settings.hpp"
#include "lcars/events/event_bus.hpp"
#include "lcars/network/command_runner.hpp"
#include "lcars/network/kill_switch.hpp"
#include "lcars/network/traffic_binding.hpp"
#include "lcars/transfer/transfer_engine.hpp"
#include "lcars/tunnel/tunnel_service.hpp"
#include <memory>

namespace lcars::core {

// Owns and wires the transport components for one process
class TransportCore {
public:
    // tunnel_backend may be null when the tunnel is disabled
    TransportCore(const Settings& settings,
                  std::shared_ptr<transfer::TransferBackend> transfer_backend,
                  std::shared_ptr<tunnel::TunnelBackend> tunnel_backend,
                  std::shared_ptr<network::CommandRunner> runner);
    ~TransportCore();

    TransportCore(const TransportCore&) = delete;
    TransportCore& operator=(const TransportCore&) = delete;

    // Builds the WireGuard backend from tunnel.config_file
    static ValueResult<std::shared_ptr<TransportCore>> create(
        const Settings& settings,
        std::shared_ptr<transfer::TransferBackend> transfer_backend,
        std::shared_ptr<network::CommandRunner> runner);

    Result start();
    void shutdown();
    bool is_started() const { return started_; }

    const Settings& settings() const { return settings_; }
    std::shared_ptr<events::EventBus> bus() const { return bus_; }
    std::shared_ptr<transfer::TransferEngine> engine() const { return engine_; }
    std::shared_ptr<tunnel::TunnelService> tunnel() const { return tunnel_; }
    std::shared_ptr<network::TrafficBindingPolicy> binding() const { return binding_; }
    std::shared_ptr<network::KillSwitchCoordinator> kill_switch() const { return kill_switch_; }

private:
    Settings settings_;
    bool started_;

    std::shared_ptr<events::EventBus> bus_;
    std::shared_ptr<transfer::TransferEngine> engine_;
    std::shared_ptr<tunnel::TunnelService> tunnel_;
    std::shared_ptr<network::TrafficBindingPolicy> binding_;
    std::shared_ptr<network::KillSwitchCoordinator> kill_switch_;
};

} // namespace lcars::core
