#include "lcars/network/kill_switch.hpp"
#include "lcars/core/logger.hpp"

namespace lcars::network {

KillSwitchCoordinator::KillSwitchCoordinator(std::shared_ptr<transfer::TransferEngine> engine,
                                             std::shared_ptr<tunnel::TunnelService> tunnel,
                                             std::shared_ptr<events::EventBus> bus)
    : engine_(std::move(engine))
    , tunnel_(std::move(tunnel))
    , bus_(std::move(bus))
    , running_(false)
    , resyncs_(0) {
}

KillSwitchCoordinator::~KillSwitchCoordinator() {
    stop();
}

bool KillSwitchCoordinator::start() {
    if (running_) {
        LOG_WARN("Kill switch already running");
        return false;
    }

    // Subscribe before reading tunnel state so no transition slips between
    subscription_ = bus_->subscribe();

    auto engine = engine_;
    tunnel_->set_disconnect_guard([engine]() { engine->pause_all(); });

    running_ = true;
    resync();

    thread_ = std::thread([this]() { run(); });

    LOG_INFO("Kill switch armed");
    return true;
}

void KillSwitchCoordinator::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    tunnel_->set_disconnect_guard(nullptr);
    if (subscription_) {
        subscription_->close();
    }

    if (thread_.joinable()) {
        thread_.join();
    }
    subscription_.reset();

    LOG_INFO("Kill switch disarmed");
}

void KillSwitchCoordinator::run() {
    while (running_) {
        auto event = subscription_->receive(RECEIVE_TIMEOUT);

        auto lagged = subscription_->take_lagged();
        if (lagged > 0) {
            LOG_WARN("Kill switch missed {} events, re-syncing with tunnel state", lagged);
            resync();
        }

        if (event) {
            handle(*event);
        }
    }
}

void KillSwitchCoordinator::handle(const events::Event& event) {
    if (std::holds_alternative<events::TunnelDisconnected>(event) ||
        std::holds_alternative<events::TunnelError>(event)) {
        engine_->pause_all();
        return;
    }

    if (const auto* connected = std::get_if<events::TunnelConnected>(&event)) {
        auto engine = engine_;
        bool resumed = tunnel_->run_if_connected(connected->connection_epoch,
                                                 [engine]() { engine->resume_all(); });
        if (!resumed) {
            LOG_DEBUG("Ignoring stale TunnelConnected (epoch {})", connected->connection_epoch);
        }
    }
}

void KillSwitchCoordinator::resync() {
    resyncs_++;

    auto state = tunnel_->get_status();
    if (state.is_connected()) {
        auto engine = engine_;
        if (tunnel_->run_if_connected(state.connection_epoch, [engine]() { engine->resume_all(); })) {
            return;
        }
    }

    engine_->pause_all();
}

}
