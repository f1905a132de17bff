#pragma once

#include "lcars/core/settings.hpp"
#include "lcars/network/command_runner.hpp"
#include "lcars/tunnel/tunnel_backend.hpp"
#include "lcars/tunnel/wireguard_config.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lcars::tunnel {

// Kernel WireGuard interface managed through ip(8) and wg(8). Tunnel DNS goes
// through resolvectl(1) when systemd-resolved is active, otherwise resolv.conf
// is replaced for the lifetime of the link and restored on teardown.
class WireGuardBackend : public TunnelBackend {
public:
    static constexpr const char* DEFAULT_RESOLV_CONF = "/etc/resolv.conf";

    WireGuardBackend(std::string interface_name,
                     WireGuardConfig config,
                     const core::TunnelSettings& settings,
                     std::shared_ptr<network::CommandRunner> runner,
                     std::filesystem::path resolv_conf = DEFAULT_RESOLV_CONF);

    core::Result check_privileges() override;
    core::ValueResult<LinkInfo> bring_up(const CancelCheck& cancelled) override;
    core::Result tear_down() override;
    core::ValueResult<InterfaceStats> read_stats() override;
    std::string interface_name() const override { return interface_name_; }

    // Commands bring_up() would run, with key material elided
    std::vector<std::vector<std::string>> bring_up_plan() const;

    // Parses `wg show <if> dump`
    static core::ValueResult<InterfaceStats> parse_dump(const std::string& dump);

    // Parses `wg show <if> latest-handshakes`
    static std::optional<std::chrono::system_clock::time_point> parse_latest_handshake(const std::string& output);

    // Content written over resolv.conf when systemd-resolved is unavailable
    static std::string resolv_conf_content(const std::vector<std::string>& servers);

private:
    enum class DnsMode { NONE, RESOLVED, RESOLV_CONF };

    std::string interface_name_;
    WireGuardConfig config_;
    core::TunnelSettings settings_;
    std::shared_ptr<network::CommandRunner> runner_;
    std::filesystem::path resolv_conf_;
    DnsMode dns_mode_;
    std::optional<std::string> resolv_conf_backup_;

    std::vector<std::string> peer_command() const;
    bool systemd_resolved_active();
    core::Result apply_dns();
    core::Result apply_dns_resolved();
    core::Result apply_dns_resolv_conf();
    core::Result restore_dns();
    core::ValueResult<std::chrono::system_clock::time_point> wait_for_handshake(const CancelCheck& cancelled);
};

} // namespace lcars::tunnel
