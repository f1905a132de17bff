#include "lcars/core/transport_core.hpp"
#include "lcars/core/logger.hpp"
#include "lcars/tunnel/wireguard_backend.hpp"
#include "lcars/tunnel/wireguard_config.hpp"

namespace lcars::core {

TransportCore::TransportCore(const Settings& settings,
                             std::shared_ptr<transfer::TransferBackend> transfer_backend,
                             std::shared_ptr<tunnel::TunnelBackend> tunnel_backend,
                             std::shared_ptr<network::CommandRunner> runner)
    : settings_(settings)
    , started_(false)
    , bus_(std::make_shared<events::EventBus>(settings.event_capacity))
    , engine_(std::make_shared<transfer::TransferEngine>(settings.transfer, std::move(transfer_backend), bus_)) {

    if (!settings_.tunnel.enabled || !tunnel_backend) {
        LOG_WARN("Tunnel disabled: transfer traffic uses the default route");
        return;
    }

    tunnel_ = std::make_shared<tunnel::TunnelService>(settings_.tunnel, std::move(tunnel_backend), bus_);
    binding_ = std::make_shared<network::TrafficBindingPolicy>(settings_.binding, std::move(runner));

    auto engine = engine_;
    binding_->set_mark_handler([engine](uint32_t fwmark, const std::string& interface_name) {
        return engine->set_traffic_mark(fwmark, interface_name);
    });

    auto binding = binding_;
    tunnel_->set_traffic_binding(
        [binding](const std::string& interface_name) { return binding->apply(interface_name); },
        [binding]() { return binding->remove(); });

    if (settings_.kill_switch_active()) {
        kill_switch_ = std::make_shared<network::KillSwitchCoordinator>(engine_, tunnel_, bus_);
    } else {
        LOG_WARN("Kill switch disabled: transfers keep running while the tunnel is down");
    }
}

TransportCore::~TransportCore() {
    shutdown();
}

ValueResult<std::shared_ptr<TransportCore>> TransportCore::create(
    const Settings& settings,
    std::shared_ptr<transfer::TransferBackend> transfer_backend,
    std::shared_ptr<network::CommandRunner> runner) {

    auto valid = settings.validate();
    if (!valid) {
        return valid;
    }

    std::shared_ptr<tunnel::TunnelBackend> tunnel_backend;
    if (settings.tunnel.enabled) {
        auto config = tunnel::WireGuardConfig::load(settings.tunnel.config_file);
        if (!config) {
            return config.status;
        }
        tunnel_backend = std::make_shared<tunnel::WireGuardBackend>(
            settings.tunnel.interface_name, std::move(*config), settings.tunnel, runner);
    }

    return std::make_shared<TransportCore>(settings, std::move(transfer_backend),
                                           std::move(tunnel_backend), std::move(runner));
}

Result TransportCore::start() {
    if (started_) {
        return Result(ErrorCode::INVALID_TRANSITION, "Transport core already started");
    }

    // Nothing moves until the kill switch has seen the tunnel state
    if (kill_switch_) {
        engine_->pause_all();
    }

    if (!engine_->start()) {
        return Result(ErrorCode::INVALID_TRANSITION, "Transfer engine failed to start");
    }
    started_ = true;

    if (!tunnel_) {
        LOG_INFO("Transport core started without tunnel");
        return Result();
    }

    // Marked traffic has nowhere to go until the tunnel is up
    auto blocked = binding_->remove();
    if (!blocked) {
        LOG_ERROR("Could not install fail-closed route: {}", blocked.message);
    }

    if (!tunnel_->start()) {
        LOG_WARN("Tunnel runtime already running");
    }
    if (kill_switch_ && !kill_switch_->start()) {
        LOG_WARN("Kill switch already armed");
    }

    auto connected = tunnel_->connect();
    if (!connected && !settings_.tunnel.auto_reconnect) {
        return connected;
    }

    LOG_INFO("Transport core started (tunnel {}, kill switch {})",
             tunnel::tunnel_status_to_string(tunnel_->get_status().status),
             kill_switch_ ? "armed" : "off");
    return Result();
}

void TransportCore::shutdown() {
    if (!started_) {
        return;
    }
    started_ = false;

    LOG_INFO("Shutting down transport core");

    if (tunnel_) {
        // Disconnect with the kill switch still armed so transfers pause first
        auto disconnected = tunnel_->disconnect();
        if (!disconnected) {
            LOG_ERROR("Tunnel disconnect failed: {}", disconnected.message);
        }
        if (kill_switch_) {
            kill_switch_->stop();
        }
        tunnel_->stop();

        auto released = binding_->release();
        if (!released) {
            LOG_WARN("Traffic binding release incomplete: {}", released.message);
        }
    }

    engine_->stop();
}

}
