#include "lcars/tunnel/tunnel_service.hpp"
#include "lcars/core/logger.hpp"
#include "lcars/core/utils.hpp"
#include <algorithm>
#include <cmath>

namespace lcars::tunnel {

using core::ErrorCode;
using core::Result;

namespace {
const char* const REASON_USER_REQUESTED = "user_requested";
const char* const REASON_HANDSHAKE_STALE = "handshake_stale";

// Runs one teardown step; an exception becomes a failed Result so the
// remaining steps still run
template<typename Step>
Result run_step(const char* name, Step&& step) {
    try {
        return step();
    } catch (const std::exception& e) {
        return Result(ErrorCode::TUNNEL_SETUP, std::string(name) + " threw: " + e.what());
    }
}
}

const char* tunnel_status_to_string(TunnelStatus status) {
    switch (status) {
        case TunnelStatus::DISCONNECTED: return "Disconnected";
        case TunnelStatus::CONNECTING: return "Connecting";
        case TunnelStatus::CONNECTED: return "Connected";
        case TunnelStatus::RECONNECTING: return "Reconnecting";
        case TunnelStatus::ERROR: return "Error";
    }
    return "Unknown";
}

TunnelService::TunnelService(const core::TunnelSettings& settings,
                             std::shared_ptr<TunnelBackend> backend,
                             std::shared_ptr<events::EventBus> bus)
    : settings_(settings)
    , backend_(std::move(backend))
    , bus_(std::move(bus))
    , generation_(0)
    , running_(false)
    , io_context_()
    , health_timer_(io_context_)
    , reconnect_timer_(io_context_) {

    state_.interface_name = backend_->interface_name();
    LOG_INFO("Tunnel service initialized for interface {}", state_.interface_name);
}

TunnelService::~TunnelService() {
    stop();
}

bool TunnelService::start() {
    if (running_) {
        LOG_WARN("Tunnel service already running");
        return false;
    }

    running_ = true;
    io_context_.restart();
    schedule_health_check();

    io_thread_ = std::thread([this]() {
        LOG_DEBUG("Tunnel service runtime started");

        while (running_) {
            try {
                io_context_.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("Tunnel service IO error: {}", e.what());
                if (!running_) break;

                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                io_context_.restart();
            }
        }

        LOG_DEBUG("Tunnel service runtime stopped");
    });

    return true;
}

void TunnelService::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    io_context_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    health_timer_.cancel();
    reconnect_timer_.cancel();
}

void TunnelService::set_disconnect_guard(DisconnectGuard guard) {
    std::lock_guard<std::mutex> lock(transition_mutex_);
    disconnect_guard_ = std::move(guard);
}

void TunnelService::set_traffic_binding(BindingApply apply, BindingRemove remove) {
    std::lock_guard<std::mutex> lock(transition_mutex_);
    binding_apply_ = std::move(apply);
    binding_remove_ = std::move(remove);
}

// Connection management

Result TunnelService::connect() {
    std::lock_guard<std::mutex> lock(transition_mutex_);

    auto status = get_status().status;
    if (status != TunnelStatus::DISCONNECTED && status != TunnelStatus::ERROR) {
        return Result(ErrorCode::INVALID_TRANSITION,
                      std::string("Cannot connect while ") + tunnel_status_to_string(status));
    }

    auto privileges = backend_->check_privileges();
    if (!privileges) {
        enter_error(privileges.message);
        return privileges;
    }

    generation_++;
    update_state([](TunnelState& state) {
        state.status = TunnelStatus::CONNECTING;
        state.error_message.clear();
        state.reconnect_attempt = 0;
    });

    bus_->publish(events::TunnelConnecting{backend_->interface_name()});
    LOG_INFO("Connecting tunnel {}", backend_->interface_name());

    auto generation = generation_.load();
    auto result = attempt_connect();
    if (result) {
        return result;
    }

    if (generation != generation_.load()) {
        // A concurrent disconnect() owns the transition from here
        LOG_INFO("Tunnel connect cancelled: {}", result.message);
        return result;
    }

    LOG_ERROR("Tunnel connect failed: {}", result.message);

    if (settings_.auto_reconnect) {
        fire_guard();
        bus_->publish(events::TunnelError{result.message, true});
        enter_reconnecting();
    } else {
        enter_error(result.message);
    }

    return result;
}

Result TunnelService::disconnect() {
    // Abandons a bring-up that currently holds the transition lock
    generation_++;

    std::lock_guard<std::mutex> lock(transition_mutex_);

    Result released;
    auto status = get_status().status;
    if (status == TunnelStatus::CONNECTED) {
        released = leave_connected();
    } else {
        released = fire_guard();
    }

    update_state([](TunnelState& state) {
        state.status = TunnelStatus::DISCONNECTED;
        state.error_message.clear();
        state.endpoint.clear();
        state.connected_since.reset();
        state.reconnect_attempt = 0;
    });

    bus_->publish(events::TunnelDisconnected{backend_->interface_name(), REASON_USER_REQUESTED});
    LOG_INFO("Tunnel {} disconnected ({} before)", backend_->interface_name(), tunnel_status_to_string(status));

    return released;
}

void TunnelService::health_check() {
    std::lock_guard<std::mutex> lock(transition_mutex_);

    auto state = get_status();
    if (state.status != TunnelStatus::CONNECTED) {
        return;
    }

    auto stats = backend_->read_stats();
    if (stats) {
        update_state([&stats](TunnelState& s) {
            s.rx_bytes = stats->rx_bytes;
            s.tx_bytes = stats->tx_bytes;
            if (stats->last_handshake) {
                s.last_handshake = stats->last_handshake;
            }
        });
        state = get_status();

        bus_->publish(events::TunnelStatsUpdate{state.rx_bytes, state.tx_bytes, state.last_handshake});
    } else {
        LOG_WARN("Failed to read tunnel statistics: {}", stats.status.message);
    }

    if (!state.last_handshake) {
        return;
    }

    auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
        core::utils::TimeUtils::now() - *state.last_handshake);
    if (age <= settings_.handshake_stale_after) {
        return;
    }

    LOG_WARN("Tunnel handshake is stale ({} old)", core::utils::StringUtils::format_duration(age));
    auto released = leave_connected();
    if (!released) {
        LOG_WARN("Stale tunnel teardown incomplete: {}", released.message);
    }

    if (!settings_.auto_reconnect) {
        enter_error("Handshake stale for " + core::utils::StringUtils::format_duration(age));
        return;
    }

    generation_++;
    update_state([](TunnelState& s) {
        s.status = TunnelStatus::RECONNECTING;
        s.connected_since.reset();
        s.reconnect_attempt = 0;
    });
    bus_->publish(events::TunnelDisconnected{backend_->interface_name(), REASON_HANDSHAKE_STALE});
    enter_reconnecting();
}

TunnelState TunnelService::get_status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool TunnelService::run_if_connected(uint64_t epoch, const std::function<void()>& fn) {
    std::lock_guard<std::mutex> lock(transition_mutex_);

    auto state = get_status();
    if (state.status != TunnelStatus::CONNECTED || state.connection_epoch != epoch) {
        LOG_DEBUG("Skipping action for stale connection epoch {} (current {}, {})",
                  epoch, state.connection_epoch, tunnel_status_to_string(state.status));
        return false;
    }

    fn();
    return true;
}

std::chrono::milliseconds TunnelService::reconnect_delay(uint32_t attempt) const {
    auto base = static_cast<double>(settings_.reconnect_min_delay.count());
    auto exponent = static_cast<double>(attempt > 0 ? attempt - 1 : 0);
    auto delay = base * std::pow(settings_.reconnect_backoff_factor, exponent);
    auto capped = std::min(delay, static_cast<double>(settings_.reconnect_max_delay.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

// Transitions, called with transition_mutex_ held

Result TunnelService::attempt_connect() {
    auto generation = generation_.load();
    auto cancelled = [this, generation]() { return generation_.load() != generation; };

    LinkInfo link;
    auto up = run_step("bring-up", [&]() -> Result {
        auto result = backend_->bring_up(cancelled);
        if (!result) {
            return result.status;
        }
        link = *result;
        return Result();
    });
    if (!up) {
        auto cleanup = tear_down_backend();
        if (!cleanup) {
            LOG_DEBUG("Cleanup after failed bring-up: {}", cleanup.message);
        }
        return Result(ErrorCode::TUNNEL_SETUP, up.message);
    }

    if (binding_apply_) {
        auto bound = run_step("binding apply", [&]() { return binding_apply_(link.interface_name); });
        if (!bound) {
            if (binding_remove_) {
                auto removed = run_step("binding remove", binding_remove_);
                if (!removed) {
                    LOG_ERROR("Failed to restore fail-closed routing: {}", removed.message);
                }
            }
            auto cleanup = tear_down_backend();
            if (!cleanup) {
                LOG_WARN("Teardown after binding failure: {}", cleanup.message);
            }
            return Result(ErrorCode::TUNNEL_SETUP, "Traffic binding failed: " + bound.message);
        }
    }

    enter_connected(link);
    return Result();
}

void TunnelService::enter_connected(const LinkInfo& link) {
    auto now = core::utils::TimeUtils::now();
    uint64_t epoch = 0;

    update_state([&](TunnelState& state) {
        state.status = TunnelStatus::CONNECTED;
        state.error_message.clear();
        state.interface_name = link.interface_name;
        state.endpoint = link.endpoint;
        state.connected_since = now;
        state.last_handshake = link.last_handshake ? link.last_handshake : now;
        state.reconnect_attempt = 0;
        epoch = ++state.connection_epoch;
    });

    bus_->publish(events::TunnelConnected{link.interface_name, link.endpoint, epoch});
    LOG_INFO("Tunnel {} connected to {} (epoch {})", link.interface_name, link.endpoint, epoch);
}

Result TunnelService::leave_connected() {
    // Every step runs even when an earlier one fails
    auto first_error = fire_guard();

    if (binding_remove_) {
        auto removed = run_step("binding remove", binding_remove_);
        if (!removed) {
            LOG_ERROR("Failed to remove traffic binding: {}", removed.message);
            if (first_error) first_error = removed;
        }
    }

    auto torn_down = tear_down_backend();
    if (!torn_down) {
        LOG_WARN("Tunnel teardown incomplete: {}", torn_down.message);
        if (first_error) first_error = torn_down;
    }

    return first_error;
}

Result TunnelService::tear_down_backend() {
    return run_step("teardown", [this]() { return backend_->tear_down(); });
}

void TunnelService::enter_reconnecting() {
    auto attempt = get_status().reconnect_attempt + 1;

    if (settings_.max_reconnect_attempts > 0 && attempt > settings_.max_reconnect_attempts) {
        enter_error("Reconnect attempts exhausted after " +
                    std::to_string(settings_.max_reconnect_attempts) + " tries");
        return;
    }

    auto delay = reconnect_delay(attempt);
    update_state([attempt](TunnelState& state) {
        state.status = TunnelStatus::RECONNECTING;
        state.reconnect_attempt = attempt;
    });

    bus_->publish(events::TunnelReconnecting{attempt, delay});
    LOG_INFO("Tunnel reconnect attempt {} in {}", attempt, core::utils::StringUtils::format_duration(delay));

    schedule_reconnect(generation_, delay);
}

void TunnelService::enter_error(const std::string& message) {
    fire_guard();

    update_state([&message](TunnelState& state) {
        state.status = TunnelStatus::ERROR;
        state.error_message = message;
        state.connected_since.reset();
    });

    bus_->publish(events::TunnelError{message, false});
    LOG_ERROR("Tunnel error: {}", message);
}

// Logs its own failure; callers that only need transfers held ignore the result
Result TunnelService::fire_guard() {
    if (!disconnect_guard_) {
        return Result();
    }

    auto result = run_step("disconnect guard", [this]() {
        disconnect_guard_();
        return Result();
    });
    if (!result) {
        LOG_ERROR("Disconnect guard failed: {}", result.message);
    }
    return result;
}

void TunnelService::update_state(const std::function<void(TunnelState&)>& update) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    update(state_);
}

// Timers, run on the io thread

void TunnelService::schedule_health_check() {
    health_timer_.expires_after(settings_.health_check_interval);
    health_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_) {
            return;
        }
        health_check();
        schedule_health_check();
    });
}

void TunnelService::schedule_reconnect(uint64_t generation, std::chrono::milliseconds delay) {
    boost::asio::post(io_context_, [this, generation, delay]() {
        reconnect_timer_.expires_after(delay);
        reconnect_timer_.async_wait([this, generation](const boost::system::error_code& ec) {
            if (ec || !running_) {
                return;
            }
            on_reconnect_timer(generation);
        });
    });
}

void TunnelService::on_reconnect_timer(uint64_t generation) {
    std::lock_guard<std::mutex> lock(transition_mutex_);

    if (generation != generation_ || get_status().status != TunnelStatus::RECONNECTING) {
        return;
    }

    auto result = attempt_connect();
    if (result || generation != generation_.load()) {
        return;
    }

    auto attempt = get_status().reconnect_attempt;
    LOG_WARN("Tunnel reconnect attempt {} failed: {}", attempt, result.message);

    if (settings_.max_reconnect_attempts > 0 && attempt >= settings_.max_reconnect_attempts) {
        enter_error("Reconnect attempts exhausted after " + std::to_string(attempt) +
                    " tries: " + result.message);
        return;
    }

    fire_guard();
    bus_->publish(events::TunnelError{result.message, true});
    enter_reconnecting();
}

}
