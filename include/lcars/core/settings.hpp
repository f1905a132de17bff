#pragma once

#include "lcars/core/config.hpp"
#include "lcars/core/error.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace lcars::core {

struct SeedingSettings {
    bool enabled = true;
    std::optional<double> ratio_limit = 1.0;
    std::optional<std::chrono::milliseconds> time_limit = std::chrono::hours(48);
};

struct TransferSettings {
    std::filesystem::path download_directory = "./downloads";
    uint32_t max_connections = 100;
    std::pair<uint16_t, uint16_t> port_range{6881, 6889};

    std::chrono::milliseconds tick_interval{std::chrono::seconds(1)};
    uint32_t max_retries = 5;
    std::chrono::milliseconds retry_min_delay{std::chrono::seconds(2)};
    std::chrono::milliseconds retry_max_delay{std::chrono::seconds(60)};

    SeedingSettings seeding;

    // Keep at least 100MB free after a download
    static constexpr uint64_t SPACE_SAFETY_MARGIN = 100ULL * 1024 * 1024;

    bool has_sufficient_space(uint64_t required_bytes) const;
};

struct TunnelSettings {
    bool enabled = false;
    std::string interface_name;
    std::filesystem::path config_file;

    bool kill_switch = true;
    bool kill_switch_explicit = false;
    bool auto_reconnect = true;
    bool dns_leak_protection = true;

    std::chrono::milliseconds health_check_interval{std::chrono::seconds(30)};
    std::chrono::milliseconds reconnect_min_delay{std::chrono::seconds(1)};
    std::chrono::milliseconds reconnect_max_delay{std::chrono::seconds(300)};
    double reconnect_backoff_factor = 2.0;
    uint32_t max_reconnect_attempts = 0; // 0 = unlimited
    std::chrono::milliseconds handshake_stale_after{std::chrono::seconds(180)};
    std::chrono::milliseconds handshake_timeout{std::chrono::seconds(10)};
};

struct BindingSettings {
    uint32_t fwmark = 0x4c43;
    uint32_t table = 51820;
    uint32_t rule_priority = 10000;
};

struct Settings {
    TransferSettings transfer;
    TunnelSettings tunnel;
    BindingSettings binding;

    size_t event_capacity = 256;
    std::string log_level = "info";
    std::string log_file = "lcars.log";

    static ValueResult<Settings> from_config(const Config& config);

    Result validate() const;

    // Kill switch only guards traffic when a tunnel exists to guard it with
    bool kill_switch_active() const { return tunnel.enabled && tunnel.kill_switch; }
};

} // namespace lcars::core
