#include "lcars/core/command_handler.hpp"
#include "lcars/core/config.hpp"
#include "lcars/core/logger.hpp"
#include "lcars/core/transport_core.hpp"
#include "lcars/core/utils.hpp"
#include "lcars/crypto/keys.hpp"
#include "lcars/network/command_runner.hpp"
#include "lcars/network/traffic_binding.hpp"
#include "lcars/transfer/libtorrent_backend.hpp"
#include "lcars/transfer/transfer.hpp"
#include "lcars/tunnel/wireguard_config.hpp"
#include <boost/asio.hpp>
#include <fmt/format.h>
#include <atomic>
#include <csignal>
#include <functional>
#include <iostream>
#include <thread>
#include <type_traits>

namespace lcars::core {

using utils::StringUtils;

namespace {

std::string describe(const events::Event& event) {
    return std::visit([](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, events::TunnelConnecting>) {
            return fmt::format("connecting {}", e.interface_name);
        } else if constexpr (std::is_same_v<T, events::TunnelConnected>) {
            return fmt::format("connected {} via {} (epoch {})", e.interface_name, e.endpoint, e.connection_epoch);
        } else if constexpr (std::is_same_v<T, events::TunnelDisconnected>) {
            return fmt::format("disconnected {} ({})", e.interface_name, e.reason);
        } else if constexpr (std::is_same_v<T, events::TunnelReconnecting>) {
            return fmt::format("reconnect attempt {} in {}", e.attempt, StringUtils::format_duration(e.delay));
        } else if constexpr (std::is_same_v<T, events::TunnelStatsUpdate>) {
            return fmt::format("rx {} tx {}", StringUtils::format_bytes(e.rx_bytes), StringUtils::format_bytes(e.tx_bytes));
        } else if constexpr (std::is_same_v<T, events::TunnelError>) {
            return fmt::format("error: {}{}", e.message, e.will_retry ? " (retrying)" : "");
        } else if constexpr (std::is_same_v<T, events::TransferStatusChanged>) {
            return fmt::format("{} {} -> {}", e.source_id,
                               transfer::transfer_status_to_string(e.old_status),
                               transfer::transfer_status_to_string(e.new_status));
        } else {
            return e.source_id;
        }
    }, event);
}

std::string format_limit(const std::optional<double>& limit) {
    return limit ? fmt::format("{:.2f}", *limit) : "none";
}

std::string format_limit(const std::optional<std::chrono::milliseconds>& limit) {
    return limit ? StringUtils::format_duration(*limit) : "none";
}

// Prints matching events until SIGINT/SIGTERM or until done() returns true
void stream_events(events::Subscription& subscription,
                   const std::function<bool(const events::Event&)>& wanted,
                   const std::function<bool()>& done) {
    std::atomic<bool> stop_requested{false};
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&stop_requested](const boost::system::error_code& ec, int signal) {
        if (!ec) {
            LOG_INFO("Received signal {}, stopping", signal);
            stop_requested = true;
        }
    });
    std::thread signal_thread([&signal_context]() { signal_context.run(); });

    while (!stop_requested && !done()) {
        auto event = subscription.receive(std::chrono::milliseconds(500));
        if (event && wanted(*event)) {
            std::cout << "[" << utils::TimeUtils::to_iso_string(utils::TimeUtils::now()) << "] "
                      << events::event_name(*event) << ": " << describe(*event) << "\n";
        }
    }

    signal_context.stop();
    signal_thread.join();
}

} // namespace

ValueResult<Settings> load_settings() {
    return Settings::from_config(Config::instance());
}

// CheckConfigCommandHandler Implementation
CommandResult CheckConfigCommandHandler::execute(const std::vector<std::string>&) {
    auto settings = load_settings();
    if (!settings) {
        return CommandResult::error(settings.status.to_string());
    }

    const auto& s = *settings;
    std::cout << "Configuration OK\n\n";
    std::cout << "Transfers:\n";
    std::cout << "  Download directory: " << s.transfer.download_directory.string() << "\n";
    std::cout << "  Ports: " << s.transfer.port_range.first << "-" << s.transfer.port_range.second << "\n";
    std::cout << "  Max connections: " << s.transfer.max_connections << "\n";
    std::cout << "  Seeding: " << (s.transfer.seeding.enabled ? "enabled" : "disabled")
              << " (ratio " << format_limit(s.transfer.seeding.ratio_limit)
              << ", time " << format_limit(s.transfer.seeding.time_limit) << ")\n";

    auto space = utils::FileUtils::available_space(s.transfer.download_directory);
    if (space) {
        std::cout << "  Free space: " << StringUtils::format_bytes(*space) << "\n";
    }

    std::cout << "\nTunnel:\n";
    if (!s.tunnel.enabled) {
        std::cout << "  Disabled (transfers use the default route)\n";
        return CommandResult::ok();
    }

    std::cout << "  Interface: " << s.tunnel.interface_name << "\n";
    std::cout << "  Config file: " << s.tunnel.config_file.string() << "\n";
    std::cout << "  Kill switch: " << (s.kill_switch_active() ? "armed" : "off") << "\n";
    std::cout << "  Auto reconnect: " << (s.tunnel.auto_reconnect ? "yes" : "no")
              << " (" << StringUtils::format_duration(s.tunnel.reconnect_min_delay) << " .. "
              << StringUtils::format_duration(s.tunnel.reconnect_max_delay) << ")\n";
    std::cout << "  Health check: every " << StringUtils::format_duration(s.tunnel.health_check_interval)
              << ", stale after " << StringUtils::format_duration(s.tunnel.handshake_stale_after) << "\n";

    auto wireguard = tunnel::WireGuardConfig::load(s.tunnel.config_file);
    if (!wireguard) {
        return CommandResult::error(wireguard.status.to_string());
    }
    std::cout << "  Peer: " << wireguard->peer.endpoint << "\n";

    return CommandResult::ok();
}

// WireGuardShowCommandHandler Implementation
CommandResult WireGuardShowCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto config = tunnel::WireGuardConfig::load(args[1]);
    if (!config) {
        return CommandResult::error(config.status.to_string());
    }

    auto public_key = crypto::derive_public_key(config->private_key);
    if (!public_key) {
        return CommandResult::error(public_key.status.to_string());
    }

    std::cout << "[Interface]\n";
    std::cout << "  Public key: " << *public_key << "\n";
    std::cout << "  Addresses: " << StringUtils::join(config->addresses, ", ") << "\n";
    if (config->listen_port) {
        std::cout << "  Listen port: " << *config->listen_port << "\n";
    }
    if (!config->dns.empty()) {
        std::cout << "  DNS: " << StringUtils::join(config->dns, ", ") << "\n";
    }
    std::cout << "  MTU: " << config->mtu.value_or(tunnel::WireGuardConfig::DEFAULT_MTU) << "\n";

    std::cout << "[Peer]\n";
    std::cout << "  Public key: " << config->peer.public_key << "\n";
    std::cout << "  Preshared key: " << (config->peer.preshared_key ? "(hidden)" : "none") << "\n";
    std::cout << "  Endpoint: " << config->peer.endpoint << "\n";
    std::cout << "  Allowed IPs: " << StringUtils::join(config->peer.allowed_ips, ", ") << "\n";
    std::cout << "  Keepalive: " << config->peer.persistent_keepalive << "s\n";

    return CommandResult::ok();
}

// BindingPlanCommandHandler Implementation
CommandResult BindingPlanCommandHandler::execute(const std::vector<std::string>& args) {
    auto settings = load_settings();
    if (!settings) {
        return CommandResult::error(settings.status.to_string());
    }

    std::string interface_name = args.size() > 1 ? args[1] : settings->tunnel.interface_name;
    if (interface_name.empty()) {
        interface_name = "wg0";
    }

    network::TrafficBindingPolicy policy(settings->binding, std::make_shared<network::ProcessCommandRunner>());

    auto print = [](const std::string& title, const std::vector<network::Command>& commands) {
        std::cout << title << ":\n";
        for (const auto& command : commands) {
            std::cout << "  " << network::format_command(command) << "\n";
        }
        std::cout << "\n";
    };

    auto on_connect = policy.apply_commands(interface_name);
    auto rules = policy.rule_commands("add");
    on_connect.insert(on_connect.end(), rules.begin(), rules.end());

    print("On connect", on_connect);
    print("On disconnect (fail-closed)", policy.remove_commands());
    print("On shutdown", policy.release_commands());

    return CommandResult::ok();
}

// TunnelUpCommandHandler Implementation
CommandResult TunnelUpCommandHandler::execute(const std::vector<std::string>&) {
    auto settings = load_settings();
    if (!settings) {
        return CommandResult::error(settings.status.to_string());
    }

    if (!settings->tunnel.enabled) {
        return CommandResult::error("tunnel.enabled is false; nothing to bring up");
    }

    auto core = TransportCore::create(*settings, std::make_shared<transfer::LibtorrentBackend>(settings->transfer),
                                      std::make_shared<network::ProcessCommandRunner>());
    if (!core) {
        return CommandResult::error(core.status.to_string());
    }

    auto transport = *core;
    auto subscription = transport->bus()->subscribe();

    std::cout << "Bringing up " << settings->tunnel.interface_name << "...\n";
    std::cout << "Press Ctrl+C to stop\n";

    auto started = transport->start();
    if (!started) {
        transport->shutdown();
        return CommandResult::error(started.to_string());
    }

    stream_events(*subscription, events::is_tunnel_event, [] { return false; });

    transport->shutdown();
    std::cout << "Tunnel down\n";
    return CommandResult::ok();
}

// FetchCommandHandler Implementation
CommandResult FetchCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    std::vector<std::string> uris(args.begin() + 1, args.end());
    for (const auto& uri : uris) {
        auto source = transfer::SourceUri::parse(uri);
        if (!source) {
            return CommandResult::error(source.status.to_string());
        }
    }

    auto settings = load_settings();
    if (!settings) {
        return CommandResult::error(settings.status.to_string());
    }

    auto core = TransportCore::create(*settings, std::make_shared<transfer::LibtorrentBackend>(settings->transfer),
                                      std::make_shared<network::ProcessCommandRunner>());
    if (!core) {
        return CommandResult::error(core.status.to_string());
    }

    auto transport = *core;
    auto subscription = transport->bus()->subscribe();

    auto started = transport->start();
    if (!started) {
        transport->shutdown();
        return CommandResult::error(started.to_string());
    }

    std::vector<std::string> source_ids;
    for (size_t i = 0; i < uris.size(); ++i) {
        auto added = transport->engine()->add(uris[i], transfer::MediaRef{"cli", static_cast<int64_t>(i + 1)});
        if (!added) {
            transport->shutdown();
            return CommandResult::error(added.status.to_string());
        }
        std::cout << "Added " << *added << "\n";
        source_ids.push_back(*added);
    }
    std::cout << "Press Ctrl+C to stop\n";

    auto engine = transport->engine();
    auto finished = [&engine, &source_ids]() {
        for (const auto& source_id : source_ids) {
            auto current = engine->get(source_id);
            if (current && !transfer::is_terminal(current->status)) {
                return false;
            }
        }
        return true;
    };

    stream_events(*subscription, [](const events::Event& event) {
        return std::holds_alternative<events::TransferStatusChanged>(event) || events::is_tunnel_event(event);
    }, finished);

    transport->shutdown();
    return finished() ? CommandResult::ok() : CommandResult::ok("Stopped");
}

}
