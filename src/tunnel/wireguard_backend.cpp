#include "lcars/tunnel/wireguard_backend.hpp"
#include "lcars/core/logger.hpp"
#include "lcars/core/utils.hpp"
#include <unistd.h>
#include <algorithm>
#include <thread>

namespace lcars::tunnel {

using core::ErrorCode;
using core::Result;
using core::utils::StringUtils;

namespace {
constexpr auto HANDSHAKE_POLL_INTERVAL = std::chrono::milliseconds(250);
constexpr auto CANCEL_CHECK_INTERVAL = std::chrono::milliseconds(20);

std::optional<uint64_t> parse_u64(const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return std::stoull(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}
}

WireGuardBackend::WireGuardBackend(std::string interface_name,
                                   WireGuardConfig config,
                                   const core::TunnelSettings& settings,
                                   std::shared_ptr<network::CommandRunner> runner,
                                   std::filesystem::path resolv_conf)
    : interface_name_(std::move(interface_name))
    , config_(std::move(config))
    , settings_(settings)
    , runner_(std::move(runner))
    , resolv_conf_(std::move(resolv_conf))
    , dns_mode_(DnsMode::NONE) {
}

Result WireGuardBackend::check_privileges() {
    if (::geteuid() != 0) {
        return Result(ErrorCode::PERMISSION_DENIED,
                      "Managing " + interface_name_ + " requires root (CAP_NET_ADMIN)");
    }
    return Result();
}

std::vector<std::string> WireGuardBackend::peer_command() const {
    std::vector<std::string> command = {"wg", "set", interface_name_, "peer", config_.peer.public_key};
    if (config_.peer.preshared_key) {
        command.insert(command.end(), {"preshared-key", "/dev/stdin"});
    }
    command.insert(command.end(), {
        "endpoint", config_.peer.endpoint,
        "allowed-ips", StringUtils::join(config_.peer.allowed_ips, ","),
        "persistent-keepalive", std::to_string(config_.peer.persistent_keepalive)});
    return command;
}

std::vector<std::vector<std::string>> WireGuardBackend::bring_up_plan() const {
    std::vector<std::vector<std::string>> plan;
    plan.push_back({"ip", "link", "add", "dev", interface_name_, "type", "wireguard"});

    std::vector<std::string> interface_command = {"wg", "set", interface_name_};
    if (config_.listen_port) {
        interface_command.insert(interface_command.end(), {"listen-port", std::to_string(*config_.listen_port)});
    }
    interface_command.insert(interface_command.end(), {"private-key", "/dev/stdin"});
    plan.push_back(interface_command);

    plan.push_back(peer_command());

    for (const auto& address : config_.addresses) {
        plan.push_back({"ip", "address", "add", address, "dev", interface_name_});
    }

    plan.push_back({"ip", "link", "set", "mtu",
                    std::to_string(config_.mtu.value_or(WireGuardConfig::DEFAULT_MTU)),
                    "up", "dev", interface_name_});
    return plan;
}

core::ValueResult<LinkInfo> WireGuardBackend::bring_up(const CancelCheck& cancelled) {
    LOG_INFO("Bringing up WireGuard interface {} (peer {})", interface_name_, config_.peer.endpoint);

    auto plan = bring_up_plan();
    for (const auto& command : plan) {
        if (cancelled && cancelled()) {
            return Result(ErrorCode::TUNNEL_SETUP, "Bring-up of " + interface_name_ + " cancelled");
        }

        // Keys travel on stdin only
        std::string input;
        if (command[0] == "wg") {
            if (command[3] != "peer") {
                input = config_.private_key + "\n";
            } else if (config_.peer.preshared_key) {
                input = *config_.peer.preshared_key + "\n";
            }
        }

        auto result = runner_->run_checked(command, ErrorCode::TUNNEL_SETUP, input);
        if (!result) {
            return result;
        }
    }

    auto handshake = wait_for_handshake(cancelled);
    if (!handshake) {
        return handshake.status;
    }

    if (settings_.dns_leak_protection) {
        auto dns = apply_dns();
        if (!dns) {
            LOG_ERROR("DNS leak protection not applied: {}", dns.message);
        }
    }

    LinkInfo link;
    link.interface_name = interface_name_;
    link.endpoint = config_.peer.endpoint;
    link.last_handshake = *handshake;
    return link;
}

core::ValueResult<std::chrono::system_clock::time_point> WireGuardBackend::wait_for_handshake(const CancelCheck& cancelled) {
    auto deadline = std::chrono::steady_clock::now() + settings_.handshake_timeout;

    while (true) {
        auto output = runner_->run({"wg", "show", interface_name_, "latest-handshakes"});
        if (output && output->ok()) {
            if (auto handshake = parse_latest_handshake(output->out)) {
                return *handshake;
            }
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            return Result(ErrorCode::TUNNEL_SETUP,
                          "No handshake with " + config_.peer.endpoint + " within " +
                          StringUtils::format_duration(settings_.handshake_timeout));
        }

        // Sleep until the next poll in short slices so a disconnect is not held up
        auto next_poll = std::min(std::chrono::steady_clock::now() + HANDSHAKE_POLL_INTERVAL, deadline);
        while (std::chrono::steady_clock::now() < next_poll) {
            if (cancelled && cancelled()) {
                return Result(ErrorCode::TUNNEL_SETUP,
                              "Handshake wait on " + interface_name_ + " cancelled");
            }
            std::this_thread::sleep_for(CANCEL_CHECK_INTERVAL);
        }
    }
}

bool WireGuardBackend::systemd_resolved_active() {
    auto output = runner_->run({"systemctl", "is-active", "--quiet", "systemd-resolved"});
    return output && output->ok();
}

Result WireGuardBackend::apply_dns() {
    if (config_.dns.empty()) {
        LOG_DEBUG("No DNS servers configured, skipping DNS leak protection");
        return Result();
    }

    auto result = systemd_resolved_active() ? apply_dns_resolved() : apply_dns_resolv_conf();
    if (result) {
        LOG_INFO("DNS for {} set to {}", interface_name_, StringUtils::join(config_.dns, ", "));
    }
    return result;
}

Result WireGuardBackend::apply_dns_resolved() {
    std::vector<std::string> dns_command = {"resolvectl", "dns", interface_name_};
    dns_command.insert(dns_command.end(), config_.dns.begin(), config_.dns.end());

    auto result = runner_->run_checked(dns_command, ErrorCode::TUNNEL_SETUP);
    if (!result) {
        return result;
    }
    dns_mode_ = DnsMode::RESOLVED;

    // Route every lookup through the tunnel's resolvers
    return runner_->run_checked({"resolvectl", "domain", interface_name_, "~."}, ErrorCode::TUNNEL_SETUP);
}

Result WireGuardBackend::apply_dns_resolv_conf() {
    LOG_DEBUG("systemd-resolved not active, managing {} directly", resolv_conf_.string());

    // A missing file is restored as missing
    resolv_conf_backup_ = core::utils::FileUtils::read_text(resolv_conf_);
    if (!resolv_conf_backup_ && core::utils::FileUtils::exists(resolv_conf_)) {
        return Result(ErrorCode::TUNNEL_SETUP, "Cannot read " + resolv_conf_.string());
    }

    if (!core::utils::FileUtils::write_text(resolv_conf_, resolv_conf_content(config_.dns))) {
        resolv_conf_backup_.reset();
        return Result(ErrorCode::TUNNEL_SETUP, "Cannot write " + resolv_conf_.string());
    }
    dns_mode_ = DnsMode::RESOLV_CONF;
    return Result();
}

Result WireGuardBackend::restore_dns() {
    auto mode = dns_mode_;
    dns_mode_ = DnsMode::NONE;

    if (mode == DnsMode::RESOLVED) {
        return runner_->run_checked({"resolvectl", "revert", interface_name_}, ErrorCode::TUNNEL_SETUP);
    }

    if (mode == DnsMode::RESOLV_CONF) {
        auto backup = std::move(resolv_conf_backup_);
        resolv_conf_backup_.reset();

        if (!backup) {
            std::error_code ec;
            std::filesystem::remove(resolv_conf_, ec);
            if (ec) {
                return Result(ErrorCode::TUNNEL_SETUP, "Cannot remove " + resolv_conf_.string() + ": " + ec.message());
            }
        } else if (!core::utils::FileUtils::write_text(resolv_conf_, *backup)) {
            return Result(ErrorCode::TUNNEL_SETUP, "Cannot restore " + resolv_conf_.string());
        }
    }
    return Result();
}

std::string WireGuardBackend::resolv_conf_content(const std::vector<std::string>& servers) {
    std::string content = "# Managed by lcars-netcore; restored when the tunnel goes down\n";
    for (const auto& server : servers) {
        content += "nameserver " + server + "\n";
    }
    return content;
}

Result WireGuardBackend::tear_down() {
    Result first_error;

    auto restored = restore_dns();
    if (!restored) {
        LOG_WARN("Failed to restore DNS settings: {}", restored.message);
        first_error = restored;
    }

    auto deleted = runner_->run_checked({"ip", "link", "del", "dev", interface_name_}, ErrorCode::TUNNEL_SETUP);
    if (!deleted && first_error.success()) {
        first_error = deleted;
    }

    if (first_error.success()) {
        LOG_INFO("WireGuard interface {} removed", interface_name_);
    }
    return first_error;
}

core::ValueResult<InterfaceStats> WireGuardBackend::read_stats() {
    auto output = runner_->run({"wg", "show", interface_name_, "dump"});
    if (!output) {
        return output.status;
    }
    if (!output->ok()) {
        return Result(ErrorCode::TUNNEL_SETUP, "wg show failed: " + StringUtils::trim(output->err));
    }
    return parse_dump(output->out);
}

core::ValueResult<InterfaceStats> WireGuardBackend::parse_dump(const std::string& dump) {
    auto lines = StringUtils::split(dump, '\n');
    if (lines.empty() || StringUtils::trim(lines[0]).empty()) {
        return Result(ErrorCode::INVALID_INPUT, "Empty wg dump");
    }

    InterfaceStats stats;

    // First line describes the interface; each further line is one peer:
    // public-key preshared-key endpoint allowed-ips latest-handshake rx tx keepalive
    for (size_t i = 1; i < lines.size(); ++i) {
        if (StringUtils::trim(lines[i]).empty()) continue;

        auto fields = StringUtils::split(lines[i], '\t');
        if (fields.size() < 8) {
            return Result(ErrorCode::INVALID_INPUT, "Malformed wg dump peer line");
        }

        auto handshake = parse_u64(fields[4]);
        auto rx = parse_u64(fields[5]);
        auto tx = parse_u64(fields[6]);
        if (!handshake || !rx || !tx) {
            return Result(ErrorCode::INVALID_INPUT, "Malformed wg dump counters");
        }

        stats.rx_bytes += *rx;
        stats.tx_bytes += *tx;

        if (*handshake > 0) {
            auto time = std::chrono::system_clock::time_point(std::chrono::seconds(*handshake));
            if (!stats.last_handshake || time > *stats.last_handshake) {
                stats.last_handshake = time;
            }
        }
    }

    return stats;
}

std::optional<std::chrono::system_clock::time_point> WireGuardBackend::parse_latest_handshake(const std::string& output) {
    std::optional<std::chrono::system_clock::time_point> latest;

    for (const auto& line : StringUtils::split(output, '\n')) {
        auto fields = StringUtils::split(StringUtils::trim(line), '\t');
        if (fields.size() < 2) continue;

        auto seconds = parse_u64(StringUtils::trim(fields[1]));
        if (!seconds || *seconds == 0) continue;

        auto time = std::chrono::system_clock::time_point(std::chrono::seconds(*seconds));
        if (!latest || time > *latest) {
            latest = time;
        }
    }

    return latest;
}

}
